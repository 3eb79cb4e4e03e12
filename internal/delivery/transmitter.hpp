#pragma once

#include <string>

#include "internal/queue/event_queue_store.hpp"

namespace asqueue::delivery {

/*
  Pushes one transaction to an application service.

  Returns true only when the whole batch was accepted. False or an
  exception means nothing was delivered; the same batch is retried later
  under the same txn_id.
*/
class Transmitter {
 public:
  virtual ~Transmitter() = default;

  virtual bool Send(const std::string& destination_id, const std::string& txn_id, const queue::EventBatch& batch) = 0;
};

} // namespace asqueue::delivery
