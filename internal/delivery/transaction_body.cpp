#include "transaction_body.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>
#include <utility>

namespace asqueue::delivery {

namespace {

// Numbers are carried as doubles, exact for the canonical JSON integer range
// [-(2^53)+1, 2^53-1]. Object key order is not preserved.
void SetContent(const std::string& raw, google::protobuf::Value* value) {
  if (raw.empty()) {
    value->mutable_struct_value();
    return;
  }

  google::protobuf::Struct content;
  if (google::protobuf::util::JsonStringToMessage(raw, &content).ok()) {
    *value->mutable_struct_value() = std::move(content);
    return;
  }
  value->set_string_value(raw);
}

} // namespace

std::string TransactionId(const queue::EventBatch& batch) {
  return std::to_string(batch.max_sequence_id);
}

std::string BuildTransactionBody(const queue::EventBatch& batch) {
  google::protobuf::Struct body;
  auto* events = (*body.mutable_fields())["events"].mutable_list_value();

  for (const auto& event : batch.events) {
    auto& fields = *events->add_values()->mutable_struct_value()->mutable_fields();
    fields["event_id"].set_string_value(event.event_id);
    fields["type"].set_string_value(event.type);
    fields["room_id"].set_string_value(event.room_id);
    fields["sender"].set_string_value(event.sender);
    fields["user_id"].set_string_value(event.user_id);
    fields["origin_server_ts"].set_number_value(static_cast<double>(event.origin_server_ts));
    fields["age"].set_number_value(static_cast<double>(event.age));
    SetContent(event.content, &fields["content"]);
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(body, &json);
  if (!status.ok()) {
    throw std::runtime_error("render transaction body: " + std::string(status.message()));
  }
  return json;
}

} // namespace asqueue::delivery
