#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/queue/event_queue_store.hpp"
#include "transmitter.hpp"

namespace asqueue::delivery {

struct DeliveryOptions {
  uint32_t                  batch_size = 100;
  std::chrono::milliseconds poll_interval{1000};
};

struct DeliveryOutcome {
  enum class Status { Idle, Delivered, Failed };

  Status      status = Status::Idle;
  std::size_t events = 0;
};

/*
  Background worker draining one destination's queue.

  Each cycle:
      read batch -> Send -> DeleteUpToSequence(batch max)
  Nothing is deleted unless Send succeeded. Exactly one worker may run
  per destination.
*/
class DeliveryWorker {
 public:
  DeliveryWorker(std::string destination_id, std::shared_ptr<queue::EventQueueStore> store,
                 std::shared_ptr<Transmitter> transmitter, DeliveryOptions options = {});
  ~DeliveryWorker();

  DeliveryWorker(const DeliveryWorker&)            = delete;
  DeliveryWorker& operator=(const DeliveryWorker&) = delete;

  // One synchronous cycle. Never throws for store or transport failures.
  DeliveryOutcome RunOnce();

  void Start();
  void Stop();

  // Wakes the worker ahead of the next poll (new events were queued).
  void Notify();

  const std::string& Destination() const {
    return destination_id_;
  }

 private:
  void Run();

  std::string                             destination_id_;
  std::shared_ptr<queue::EventQueueStore> store_;
  std::shared_ptr<Transmitter>            transmitter_;
  DeliveryOptions                         options_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    notified_ = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace asqueue::delivery
