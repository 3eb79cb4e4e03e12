#pragma once

namespace asqueue::db::sql {

/*
  Canonical queue SQL.

  IMPORTANT:
  Written with `?` placeholders for SQLite. The Postgres pool prepares
  the same statements with $n placeholders under the names below.
*/

static constexpr const char* INSERT_EVENT =
    "INSERT INTO appservice_events(as_id,event_id,origin_server_ts,room_id,type,sender,event_content,txn_id)"
    " VALUES(?,?,?,?,?,?,?,?);";

static constexpr const char* COUNT_EVENTS_BY_DESTINATION =
    "SELECT COUNT(*) FROM appservice_events WHERE as_id=?;";

static constexpr const char* SELECT_EVENTS_BY_DESTINATION =
    "SELECT id,as_id,event_id,origin_server_ts,room_id,type,sender,event_content,txn_id"
    " FROM appservice_events WHERE as_id=? ORDER BY id ASC LIMIT ?;";

static constexpr const char* DELETE_UP_TO_SEQUENCE =
    "DELETE FROM appservice_events WHERE as_id=? AND id<=?;";

// NULL bound (unknown event id) matches nothing.
static constexpr const char* DELETE_UP_TO_EVENT_ID =
    "DELETE FROM appservice_events WHERE id<=("
    "SELECT MAX(b.id) FROM appservice_events b"
    " WHERE b.event_id=? AND b.as_id=appservice_events.as_id);";

static constexpr const char* SELECT_DESTINATIONS =
    "SELECT DISTINCT as_id FROM appservice_events ORDER BY as_id ASC;";

// Statement names used by the Postgres pool.
static constexpr const char* PG_INSERT_EVENT                 = "insert_event";
static constexpr const char* PG_COUNT_EVENTS_BY_DESTINATION  = "count_events_by_destination";
static constexpr const char* PG_SELECT_EVENTS_BY_DESTINATION = "select_events_by_destination";
static constexpr const char* PG_DELETE_UP_TO_SEQUENCE        = "delete_up_to_sequence";
static constexpr const char* PG_DELETE_UP_TO_EVENT_ID        = "delete_up_to_event_id";
static constexpr const char* PG_SELECT_DESTINATIONS          = "select_destinations";

}
