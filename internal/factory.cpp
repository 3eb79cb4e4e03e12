#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"
#if ASQUEUE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if ASQUEUE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace asqueue::factory {

using observability::IntField;
using observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const asqueue::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ASQUEUE_DB_SQLITE
    db::sqlite::SqliteOptions options;
    options.path            = database.sqlite().path();
    options.wal_mode        = !database.sqlite().has_wal_mode() || database.sqlite().wal_mode();
    options.busy_timeout_ms = database.sqlite().busy_timeout_ms();

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(std::move(options));
    db::sql::RunMigrations(*sqlite_db, db::sql::SqliteSchema());
    ASQUEUE_LOG_DEBUG("queue backend ready", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if ASQUEUE_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(),
                                                       database.postgres().max_connections());
    db::sql::RunMigrations(*pool, db::sql::PostgresSchema());
    ASQUEUE_LOG_DEBUG("queue backend ready", {StringField("backend", "postgres"),
                                             IntField("max_connections", database.postgres().max_connections())});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  ASQUEUE_LOG_DEBUG("queue backend ready", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Runtime Build(const asqueue::runtime::config::RuntimeConfig& config) {
  Runtime runtime;
  runtime.repository = BuildRepository(config);
  runtime.store      = std::make_shared<queue::EventQueueStore>(
      runtime.repository, std::chrono::milliseconds(config.database().statement_timeout_ms()));

  runtime.delivery.batch_size    = config.queue().batch_size();
  runtime.delivery.poll_interval = std::chrono::milliseconds(config.queue().poll_interval_ms());
  return runtime;
}

} // namespace asqueue::factory
