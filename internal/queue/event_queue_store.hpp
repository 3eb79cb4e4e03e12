#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/transaction_scope.hpp"
#include "internal/model/event.hpp"

namespace asqueue::queue {

// One read of a destination's queue, oldest first.
struct EventBatch {
  std::vector<std::string>                    event_ids;
  std::vector<model::ApplicationServiceEvent> events;

  // 0 when empty
  uint64_t max_sequence_id = 0;

  bool Empty() const {
    return events.empty();
  }
};

/*
  Durable FIFO of events pending delivery, partitioned by application
  service (destination).

  Methods without a Transaction& open their own transaction scope and throw
  util::InvalidArgument / util::BackendUnavailable / util::ConstraintViolation
  / util::StoreError. Methods taking a Transaction& run inside the caller's
  scope and return db::Result instead.

  Thread-safe; share one instance per repository.
*/
class EventQueueStore {
 public:
  // statement_timeout == 0 disables per-scope deadlines.
  explicit EventQueueStore(std::shared_ptr<db::Repository> repository,
                           std::chrono::milliseconds       statement_timeout = std::chrono::milliseconds::zero());

  // Returns the sequence id assigned to the new row.
  uint64_t   InsertEvent(const std::string& destination_id, const model::Event& event);
  db::Result InsertEvent(db::Transaction& tx, const std::string& destination_id, const model::Event& event,
                         uint64_t* sequence_id = nullptr);

  uint64_t CountByDestination(const std::string& destination_id);

  // limit must be > 0.
  EventBatch SelectEventsByDestination(const std::string& destination_id, int limit);

  // Returns the number of rows removed.
  uint64_t   DeleteUpToID(const std::string& event_id);
  db::Result DeleteUpToID(db::Transaction& tx, const std::string& event_id, uint64_t* deleted = nullptr);

  uint64_t   DeleteUpToSequence(const std::string& destination_id, uint64_t sequence_id);
  db::Result DeleteUpToSequence(db::Transaction& tx, const std::string& destination_id, uint64_t sequence_id,
                                uint64_t* deleted = nullptr);

  std::vector<std::string> ListDestinations();

 private:
  db::TransactionOptions Options(bool read_only) const;

  // Runs `work` in a fresh scope; throws on any error.
  void Run(const char* operation, const db::TransactionWork& work, bool read_only);

  std::shared_ptr<db::Repository> repository_;
  std::chrono::milliseconds       statement_timeout_;
};

} // namespace asqueue::queue
