#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/queued_event_record.hpp"

namespace asqueue::db {

/*
  Repository abstraction over the appservice event queue.

  CRITICAL GUARANTEES:

  - Every call runs inside a Transaction
  - Reads inside a transaction see its writes
  - Sequence ids are assigned by the backend, unique and strictly
    increasing across the whole store, never reused
  - A missing row is never an error for reads (empty / zero instead)

  The DB is the source of truth for:
    pending deliveries per application service
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  // Throws db::Error when the backend cannot open a transaction.
  virtual std::unique_ptr<Transaction> Begin(const TransactionOptions& options = {}) = 0;

  // ---------------------------------------------------------------------
  // Queue
  // ---------------------------------------------------------------------

  // Appends one row; sequence_id is ignored on input and set on success.
  virtual Result InsertEvent(Transaction&, model::QueuedEventRecord& record) = 0;

  virtual Result CountByDestination(Transaction&, const std::string& destination_id, uint64_t& count) = 0;

  // Oldest first, at most `limit` rows. limit == 0 yields no rows.
  virtual Result SelectEventsByDestination(Transaction&, const std::string& destination_id, uint64_t limit,
                                           std::vector<model::QueuedEventRecord>& out) = 0;

  // Deletes the destination's rows with sequence_id <= max_sequence_id.
  virtual Result DeleteUpToSequence(Transaction&, const std::string& destination_id, uint64_t max_sequence_id,
                                    uint64_t& deleted) = 0;

  // For every destination holding `event_id`, deletes that destination's rows
  // up to and including the row carrying it. Unknown ids delete nothing.
  virtual Result DeleteUpToEventID(Transaction&, const std::string& event_id, uint64_t& deleted) = 0;

  virtual Result ListDestinations(Transaction&, std::vector<std::string>& out) = 0;
};

} // namespace asqueue::db
