#include "memory_repository.hpp"

#include <algorithm>
#include <iterator>

#include "memory_tx.hpp"

namespace asqueue::db::memory {

MemoryRepository::MemoryRepository(std::chrono::milliseconds lock_timeout) : lock_timeout_(lock_timeout) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin(const TransactionOptions& options) {
  return std::make_unique<MemoryTransaction>(*this, options);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertEvent(Transaction& t, model::QueuedEventRecord& r) {
  auto& tx = TX(t);
  if (auto check = tx.Check(); !check) return check;

  r.sequence_id = tx.NextSequenceId();
  tx.Mutable().queues[r.destination_id].emplace(r.sequence_id, r);
  return Result::Ok();
}

Result MemoryRepository::CountByDestination(Transaction& t, const std::string& destination_id, uint64_t& count) {
  auto& tx = TX(t);
  if (auto check = tx.Check(); !check) return check;

  const auto& s  = tx.View();
  auto        it = s.queues.find(destination_id);
  count          = it == s.queues.end() ? 0 : it->second.size();
  return Result::Ok();
}

Result MemoryRepository::SelectEventsByDestination(Transaction& t, const std::string& destination_id, uint64_t limit,
                                                   std::vector<model::QueuedEventRecord>& out) {
  out.clear();
  auto& tx = TX(t);
  if (auto check = tx.Check(); !check) return check;

  const auto& s  = tx.View();
  auto        it = s.queues.find(destination_id);
  if (it == s.queues.end()) return Result::Ok();

  for (const auto& [_, record] : it->second) {
    if (out.size() >= limit) break;
    out.push_back(record);
  }
  return Result::Ok();
}

Result MemoryRepository::DeleteUpToSequence(Transaction& t, const std::string& destination_id, uint64_t max_sequence_id,
                                            uint64_t& deleted) {
  deleted  = 0;
  auto& tx = TX(t);
  if (auto check = tx.Check(); !check) return check;

  auto& s  = tx.Mutable();
  auto  it = s.queues.find(destination_id);
  if (it == s.queues.end()) return Result::Ok();

  auto& rows = it->second;
  auto  end  = rows.upper_bound(max_sequence_id);
  deleted    = static_cast<uint64_t>(std::distance(rows.begin(), end));
  rows.erase(rows.begin(), end);
  if (rows.empty()) s.queues.erase(it);
  return Result::Ok();
}

Result MemoryRepository::DeleteUpToEventID(Transaction& t, const std::string& event_id, uint64_t& deleted) {
  deleted  = 0;
  auto& tx = TX(t);
  if (auto check = tx.Check(); !check) return check;

  auto& s = tx.Mutable();
  for (auto it = s.queues.begin(); it != s.queues.end();) {
    auto& rows = it->second;

    // last row of this destination carrying the id bounds the delete
    auto bound = std::find_if(rows.rbegin(), rows.rend(), [&](const auto& row) { return row.second.event_id == event_id; });
    if (bound != rows.rend()) {
      auto end = rows.upper_bound(bound->first);
      deleted += static_cast<uint64_t>(std::distance(rows.begin(), end));
      rows.erase(rows.begin(), end);
    }

    if (rows.empty()) {
      it = s.queues.erase(it);
    } else {
      ++it;
    }
  }
  return Result::Ok();
}

Result MemoryRepository::ListDestinations(Transaction& t, std::vector<std::string>& out) {
  out.clear();
  auto& tx = TX(t);
  if (auto check = tx.Check(); !check) return check;

  for (const auto& [destination_id, rows] : tx.View().queues) {
    if (!rows.empty()) out.push_back(destination_id);
  }
  return Result::Ok();
}

} // namespace asqueue::db::memory
