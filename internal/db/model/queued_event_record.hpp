#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace asqueue::db::model {

/*
  Persistent queue row: one pending delivery of one event to one
  application service.

  IMPORTANT:
  - sequence_id is assigned by the backend and is the only valid
    ordering / truncation cursor.
  - Rows are never updated in place.
*/

struct QueuedEventRecord {
  uint64_t    sequence_id = 0;
  std::string destination_id;
  std::string event_id;

  // Unix millis at the origin server
  int64_t origin_server_ts = 0;

  std::string room_id;
  std::string type;
  std::string sender;

  // NULL column when absent
  std::optional<std::string> content;

  // 0 = not assigned to a delivery batch
  uint64_t transaction_ref = 0;
};

} // namespace asqueue::db::model
