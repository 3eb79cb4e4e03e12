#include "pg_pool.hpp"

#include "internal/db/sql/sql_queries.hpp"

namespace asqueue::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::ExecuteSQL(const std::string& sql) {
  pqxx::connection    conn(conninfo_);
  pqxx::nontransaction tx(conn);
  tx.exec(sql);
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare(sql::PG_INSERT_EVENT,
               "INSERT INTO appservice_events(as_id,event_id,origin_server_ts,room_id,type,sender,event_content,txn_id) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8) RETURNING id");

  conn.prepare(sql::PG_COUNT_EVENTS_BY_DESTINATION, "SELECT COUNT(*) FROM appservice_events WHERE as_id=$1");

  conn.prepare(sql::PG_SELECT_EVENTS_BY_DESTINATION,
               "SELECT id,as_id,event_id,origin_server_ts,room_id,type,sender,event_content,txn_id "
               "FROM appservice_events WHERE as_id=$1 ORDER BY id ASC LIMIT $2");

  conn.prepare(sql::PG_DELETE_UP_TO_SEQUENCE, "DELETE FROM appservice_events WHERE as_id=$1 AND id<=$2");

  conn.prepare(sql::PG_DELETE_UP_TO_EVENT_ID,
               "DELETE FROM appservice_events WHERE id<=("
               "SELECT MAX(b.id) FROM appservice_events b "
               "WHERE b.event_id=$1 AND b.as_id=appservice_events.as_id)");

  conn.prepare(sql::PG_SELECT_DESTINATIONS, "SELECT DISTINCT as_id FROM appservice_events ORDER BY as_id ASC");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace asqueue::db::postgres
