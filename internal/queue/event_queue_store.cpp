#include "event_queue_store.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace asqueue::queue {

namespace {

using db::ErrorCode;
using observability::IntField;
using observability::StringField;

void ThrowIfError(const db::Result& result, const std::string& prefix) {
  if (result) {
    return;
  }

  const std::string message = prefix + ": " + result.message;
  switch (result.code) {
    case ErrorCode::InvalidArgument:
      throw util::InvalidArgument(message);
    case ErrorCode::ConstraintViolation:
    case ErrorCode::AlreadyExists:
      throw util::ConstraintViolation(message);
    case ErrorCode::Busy:
    case ErrorCode::Unavailable:
    case ErrorCode::IOError:
    case ErrorCode::DeadlineExceeded:
    case ErrorCode::SerializationFailure:
    case ErrorCode::Conflict:
      throw util::BackendUnavailable(result.code, message);
    default:
      throw util::StoreError(result.code, message);
  }
}

db::Result Validate(const std::string& destination_id, const model::Event& event) {
  if (destination_id.empty()) {
    return db::Result::Err(ErrorCode::InvalidArgument, "destination id must not be empty");
  }
  if (event.event_id.empty()) {
    return db::Result::Err(ErrorCode::InvalidArgument, "event id must not be empty");
  }
  return db::Result::Ok();
}

model::ApplicationServiceEvent ToApplicationServiceEvent(db::model::QueuedEventRecord&& record, int64_t now_ms) {
  model::ApplicationServiceEvent event;
  event.sequence_id      = record.sequence_id;
  event.event_id         = std::move(record.event_id);
  event.origin_server_ts = record.origin_server_ts;
  event.age              = now_ms - record.origin_server_ts;
  event.room_id          = std::move(record.room_id);
  event.type             = std::move(record.type);
  event.user_id          = record.sender;
  event.sender           = std::move(record.sender);
  event.content          = std::move(record.content).value_or(std::string{});
  return event;
}

} // namespace

EventQueueStore::EventQueueStore(std::shared_ptr<db::Repository> repository, std::chrono::milliseconds statement_timeout)
    : repository_(std::move(repository)), statement_timeout_(statement_timeout) {
}

db::TransactionOptions EventQueueStore::Options(bool read_only) const {
  db::TransactionOptions options;
  options.read_only = read_only;
  if (statement_timeout_.count() > 0) {
    options.deadline = std::chrono::steady_clock::now() + statement_timeout_;
  }
  return options;
}

void EventQueueStore::Run(const char* operation, const db::TransactionWork& work, bool read_only) {
  ThrowIfError(db::WithTransaction(*repository_, work, Options(read_only)), operation);
}

// ---------------------------------------------------------------------
// Insert
// ---------------------------------------------------------------------

uint64_t EventQueueStore::InsertEvent(const std::string& destination_id, const model::Event& event) {
  ThrowIfError(Validate(destination_id, event), "insert event");

  uint64_t sequence_id = 0;
  Run(
      "insert event", [&](db::Transaction& tx) { return InsertEvent(tx, destination_id, event, &sequence_id); }, false);

  ASQUEUE_LOG_DEBUG("event queued", {StringField("destination", destination_id), StringField("event_id", event.event_id),
                                     IntField("sequence_id", static_cast<int64_t>(sequence_id))});
  return sequence_id;
}

db::Result EventQueueStore::InsertEvent(db::Transaction& tx, const std::string& destination_id, const model::Event& event,
                                        uint64_t* sequence_id) {
  if (auto valid = Validate(destination_id, event); !valid) {
    return valid;
  }

  db::model::QueuedEventRecord record;
  record.destination_id   = destination_id;
  record.event_id         = event.event_id;
  record.origin_server_ts = event.origin_server_ts;
  record.room_id          = event.room_id;
  record.type             = event.type;
  record.sender           = event.sender;
  record.content          = event.content;

  auto result = repository_->InsertEvent(tx, record);
  if (result && sequence_id) {
    *sequence_id = record.sequence_id;
  }
  return result;
}

// ---------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------

uint64_t EventQueueStore::CountByDestination(const std::string& destination_id) {
  uint64_t count = 0;
  Run(
      "count events",
      [&](db::Transaction& tx) { return repository_->CountByDestination(tx, destination_id, count); }, true);
  return count;
}

EventBatch EventQueueStore::SelectEventsByDestination(const std::string& destination_id, int limit) {
  if (limit <= 0) {
    throw util::InvalidArgument("select events: limit must be positive, got " + std::to_string(limit));
  }

  std::vector<db::model::QueuedEventRecord> records;
  Run(
      "select events",
      [&](db::Transaction& tx) {
        return repository_->SelectEventsByDestination(tx, destination_id, static_cast<uint64_t>(limit), records);
      },
      true);

  EventBatch batch;
  batch.event_ids.reserve(records.size());
  batch.events.reserve(records.size());

  // age is relative to this read
  const int64_t now_ms = util::NowUnixMillis();
  for (auto& record : records) {
    batch.max_sequence_id = std::max(batch.max_sequence_id, record.sequence_id);
    batch.event_ids.push_back(record.event_id);
    batch.events.push_back(ToApplicationServiceEvent(std::move(record), now_ms));
  }
  return batch;
}

std::vector<std::string> EventQueueStore::ListDestinations() {
  std::vector<std::string> destinations;
  Run(
      "list destinations", [&](db::Transaction& tx) { return repository_->ListDestinations(tx, destinations); }, true);
  return destinations;
}

// ---------------------------------------------------------------------
// Deletes
// ---------------------------------------------------------------------

uint64_t EventQueueStore::DeleteUpToID(const std::string& event_id) {
  uint64_t deleted = 0;
  Run(
      "delete up to event", [&](db::Transaction& tx) { return DeleteUpToID(tx, event_id, &deleted); }, false);

  ASQUEUE_LOG_DEBUG("events acknowledged",
                    {StringField("event_id", event_id), IntField("deleted", static_cast<int64_t>(deleted))});
  return deleted;
}

db::Result EventQueueStore::DeleteUpToID(db::Transaction& tx, const std::string& event_id, uint64_t* deleted) {
  uint64_t count  = 0;
  auto     result = repository_->DeleteUpToEventID(tx, event_id, count);
  if (result && deleted) {
    *deleted = count;
  }
  return result;
}

uint64_t EventQueueStore::DeleteUpToSequence(const std::string& destination_id, uint64_t sequence_id) {
  uint64_t deleted = 0;
  Run(
      "delete up to sequence",
      [&](db::Transaction& tx) { return DeleteUpToSequence(tx, destination_id, sequence_id, &deleted); }, false);

  ASQUEUE_LOG_DEBUG("events acknowledged", {StringField("destination", destination_id),
                                            IntField("sequence_id", static_cast<int64_t>(sequence_id)),
                                            IntField("deleted", static_cast<int64_t>(deleted))});
  return deleted;
}

db::Result EventQueueStore::DeleteUpToSequence(db::Transaction& tx, const std::string& destination_id,
                                               uint64_t sequence_id, uint64_t* deleted) {
  if (destination_id.empty()) {
    return db::Result::Err(ErrorCode::InvalidArgument, "destination id must not be empty");
  }

  uint64_t count  = 0;
  auto     result = repository_->DeleteUpToSequence(tx, destination_id, sequence_id, count);
  if (result && deleted) {
    *deleted = count;
  }
  return result;
}

} // namespace asqueue::queue
