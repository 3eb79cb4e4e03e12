#include "pg_repository.hpp"

#include "internal/db/sql/sql_queries.hpp"

namespace asqueue::db::postgres {

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin(const TransactionOptions& options) {
  return std::make_unique<PgTransaction>(pool_, options);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

static model::QueuedEventRecord ReadEvent(const pqxx::row& row) {
  model::QueuedEventRecord r;
  r.sequence_id      = row[0].as<uint64_t>();
  r.destination_id   = row[1].c_str();
  r.event_id         = row[2].c_str();
  r.origin_server_ts = row[3].as<int64_t>();
  r.room_id          = row[4].c_str();
  r.type             = row[5].c_str();
  r.sender           = row[6].c_str();
  if (!row[7].is_null()) r.content = row[7].as<std::string>();
  r.transaction_ref  = row[8].as<uint64_t>();
  return r;
}

Result PgRepository::InsertEvent(Transaction& t, model::QueuedEventRecord& r) {
  auto& tx = TX(t);
  if (auto check = tx.Check(); !check) return check;

  try {
    auto row = tx.Work().exec_prepared1(sql::PG_INSERT_EVENT, r.destination_id, r.event_id, r.origin_server_ts,
                                        r.room_id, r.type, r.sender, r.content, static_cast<int64_t>(r.transaction_ref));
    r.sequence_id = row[0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return TranslateException(e);
  }
}

Result PgRepository::CountByDestination(Transaction& t, const std::string& destination_id, uint64_t& count) {
  auto& tx = TX(t);
  if (auto check = tx.Check(); !check) return check;

  try {
    auto row = tx.Work().exec_prepared1(sql::PG_COUNT_EVENTS_BY_DESTINATION, destination_id);
    count = row[0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return TranslateException(e);
  }
}

Result PgRepository::SelectEventsByDestination(Transaction& t, const std::string& destination_id, uint64_t limit,
                                               std::vector<model::QueuedEventRecord>& out) {
  out.clear();
  if (limit == 0) return Result::Ok();

  auto& tx = TX(t);
  if (auto check = tx.Check(); !check) return check;

  try {
    auto res = tx.Work().exec_prepared(sql::PG_SELECT_EVENTS_BY_DESTINATION, destination_id,
                                       static_cast<int64_t>(limit));
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadEvent(row));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    out.clear();
    return TranslateException(e);
  }
}

Result PgRepository::DeleteUpToSequence(Transaction& t, const std::string& destination_id, uint64_t max_sequence_id,
                                        uint64_t& deleted) {
  auto& tx = TX(t);
  if (auto check = tx.Check(); !check) return check;

  try {
    auto res = tx.Work().exec_prepared0(sql::PG_DELETE_UP_TO_SEQUENCE, destination_id,
                                        static_cast<int64_t>(max_sequence_id));
    deleted = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return TranslateException(e);
  }
}

Result PgRepository::DeleteUpToEventID(Transaction& t, const std::string& event_id, uint64_t& deleted) {
  auto& tx = TX(t);
  if (auto check = tx.Check(); !check) return check;

  try {
    auto res = tx.Work().exec_prepared0(sql::PG_DELETE_UP_TO_EVENT_ID, event_id);
    deleted = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return TranslateException(e);
  }
}

Result PgRepository::ListDestinations(Transaction& t, std::vector<std::string>& out) {
  out.clear();
  auto& tx = TX(t);
  if (auto check = tx.Check(); !check) return check;

  try {
    auto res = tx.Work().exec_prepared(sql::PG_SELECT_DESTINATIONS);
    out.reserve(res.size());
    for (const auto& row : res) {
      out.emplace_back(row[0].c_str());
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    out.clear();
    return TranslateException(e);
  }
}

}
