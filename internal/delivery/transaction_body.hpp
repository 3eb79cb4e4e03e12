#pragma once

#include <string>

#include "internal/queue/event_queue_store.hpp"

namespace asqueue::delivery {

// Transaction id of a batch; stable across retries of the same batch.
std::string TransactionId(const queue::EventBatch& batch);

/*
  Renders {"events":[...]} for an appservice push.

  Event content is embedded as an object when it parses as a JSON object,
  as a string otherwise; empty content becomes {}.
*/
std::string BuildTransactionBody(const queue::EventBatch& batch);

} // namespace asqueue::delivery
