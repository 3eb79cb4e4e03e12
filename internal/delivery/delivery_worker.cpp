#include "delivery_worker.hpp"

#include <limits>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "transaction_body.hpp"

namespace asqueue::delivery {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

DeliveryWorker::DeliveryWorker(std::string destination_id, std::shared_ptr<queue::EventQueueStore> store,
                               std::shared_ptr<Transmitter> transmitter, DeliveryOptions options)
    : destination_id_(std::move(destination_id)),
      store_(std::move(store)),
      transmitter_(std::move(transmitter)),
      options_(options) {
  if (options_.batch_size == 0) {
    options_.batch_size = 1;
  }
  // store limits are int
  if (options_.batch_size > static_cast<uint32_t>(std::numeric_limits<int>::max())) {
    options_.batch_size = static_cast<uint32_t>(std::numeric_limits<int>::max());
  }
}

DeliveryWorker::~DeliveryWorker() {
  Stop();
}

DeliveryOutcome DeliveryWorker::RunOnce() {
  queue::EventBatch batch;
  try {
    batch = store_->SelectEventsByDestination(destination_id_, static_cast<int>(options_.batch_size));
  } catch (const util::StoreError& e) {
    ASQUEUE_LOG_WARN("delivery read failed", {StringField("destination", destination_id_), StringField("error", e.what()),
                                              BoolField("retryable", e.Retryable())});
    return {DeliveryOutcome::Status::Failed, 0};
  } catch (const util::InvalidArgument& e) {
    ASQUEUE_LOG_ERROR("delivery read rejected", {StringField("destination", destination_id_), StringField("error", e.what())});
    return {DeliveryOutcome::Status::Failed, 0};
  }

  if (batch.Empty()) {
    return {DeliveryOutcome::Status::Idle, 0};
  }

  const std::string txn_id = TransactionId(batch);

  bool sent = false;
  try {
    sent = transmitter_->Send(destination_id_, txn_id, batch);
  } catch (const std::exception& e) {
    ASQUEUE_LOG_WARN("delivery transmit failed",
                     {StringField("destination", destination_id_), StringField("txn_id", txn_id), StringField("error", e.what())});
    return {DeliveryOutcome::Status::Failed, 0};
  }

  if (!sent) {
    ASQUEUE_LOG_WARN("delivery rejected", {StringField("destination", destination_id_), StringField("txn_id", txn_id),
                                           IntField("events", static_cast<int64_t>(batch.events.size()))});
    return {DeliveryOutcome::Status::Failed, 0};
  }

  try {
    store_->DeleteUpToSequence(destination_id_, batch.max_sequence_id);
  } catch (const util::StoreError& e) {
    // delivered but not acknowledged; the batch is resent under the same txn id
    ASQUEUE_LOG_ERROR("delivery ack failed",
                      {StringField("destination", destination_id_), StringField("txn_id", txn_id), StringField("error", e.what())});
    return {DeliveryOutcome::Status::Failed, 0};
  }

  ASQUEUE_LOG_INFO("delivered transaction", {StringField("destination", destination_id_), StringField("txn_id", txn_id),
                                             IntField("events", static_cast<int64_t>(batch.events.size()))});
  return {DeliveryOutcome::Status::Delivered, batch.events.size()};
}

void DeliveryWorker::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&DeliveryWorker::Run, this);
}

void DeliveryWorker::Stop() {
  running_ = false;
  cv_.notify_all();
  if (thread_.joinable())
    thread_.join();
}

void DeliveryWorker::Notify() {
  {
    std::lock_guard lock(mutex_);
    notified_ = true;
  }
  cv_.notify_all();
}

void DeliveryWorker::Run() {
  while (running_) {
    auto outcome = RunOnce();

    // full batch: more is probably waiting
    if (outcome.status == DeliveryOutcome::Status::Delivered && outcome.events >= options_.batch_size) {
      continue;
    }

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, options_.poll_interval, [this] { return notified_ || !running_; });
    notified_ = false;
  }
}

} // namespace asqueue::delivery
