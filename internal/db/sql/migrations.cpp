#include "internal/db/sql/migrations.hpp"

#include <cstdint>

#include "internal/observability/logging.hpp"

namespace asqueue::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  std::int64_t step = 0;
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
    ++step;
  }
  ASQUEUE_LOG_DEBUG("schema migrations applied", {observability::IntField("statements", step)});
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS appservice_events ("
      "id INTEGER PRIMARY KEY AUTOINCREMENT, "
      "as_id TEXT NOT NULL, "
      "event_id TEXT NOT NULL, "
      "origin_server_ts INTEGER NOT NULL, "
      "room_id TEXT NOT NULL, "
      "type TEXT NOT NULL, "
      "sender TEXT NOT NULL, "
      "event_content TEXT, "
      "txn_id INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS appservice_events_as_id ON appservice_events(as_id, id);",
      "CREATE INDEX IF NOT EXISTS appservice_events_event_id ON appservice_events(event_id);"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS appservice_events ("
      "id BIGSERIAL NOT NULL PRIMARY KEY, "
      "as_id TEXT NOT NULL, "
      "event_id TEXT NOT NULL, "
      "origin_server_ts BIGINT NOT NULL, "
      "room_id TEXT NOT NULL, "
      "type TEXT NOT NULL, "
      "sender TEXT NOT NULL, "
      "event_content TEXT, "
      "txn_id BIGINT NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS appservice_events_as_id ON appservice_events(as_id, id);",
      "CREATE INDEX IF NOT EXISTS appservice_events_event_id ON appservice_events(event_id);"};
  return kSchema;
}

} // namespace asqueue::db::sql
