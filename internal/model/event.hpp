#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace asqueue::model {

/*
  Event as handed over by the producer (room server output).
  Only the fields the queue persists.
*/
struct Event {
  std::string event_id;
  int64_t     origin_server_ts = 0; // unix millis
  std::string room_id;
  std::string type;
  std::string sender;

  std::optional<std::string> content; // serialized JSON
};

/*
  Event as delivered to an application service.

  age is derived from origin_server_ts at read time and never stored.
*/
struct ApplicationServiceEvent {
  uint64_t    sequence_id = 0;
  std::string event_id;
  int64_t     origin_server_ts = 0;
  int64_t     age              = 0;
  std::string room_id;
  std::string type;
  std::string user_id;
  std::string sender;

  // empty when the queued row carried no content
  std::string content;
};

} // namespace asqueue::model
