#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>

#include "internal/db/api/repository.hpp"

namespace asqueue::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  explicit MemoryRepository(std::chrono::milliseconds lock_timeout = std::chrono::seconds(5));

  std::unique_ptr<Transaction> Begin(const TransactionOptions& options = {}) override;

  Result InsertEvent(Transaction&, model::QueuedEventRecord&) override;
  Result CountByDestination(Transaction&, const std::string&, uint64_t&) override;
  Result SelectEventsByDestination(Transaction&, const std::string&, uint64_t,
                                   std::vector<model::QueuedEventRecord>&) override;
  Result DeleteUpToSequence(Transaction&, const std::string&, uint64_t, uint64_t&) override;
  Result DeleteUpToEventID(Transaction&, const std::string&, uint64_t&) override;
  Result ListDestinations(Transaction&, std::vector<std::string>&) override;

private:
  friend class MemoryTransaction;

  struct State {
    // destination -> sequence id -> row
    std::map<std::string, std::map<uint64_t, model::QueuedEventRecord>> queues;
  };

  std::chrono::milliseconds lock_timeout_;

  // one open transaction at a time
  std::timed_mutex tx_mutex_;

  std::mutex mutex_;
  State committed_;

  // outside State so rolled back inserts never hand their ids out again
  std::atomic<uint64_t> next_sequence_id_{1};
};

}
