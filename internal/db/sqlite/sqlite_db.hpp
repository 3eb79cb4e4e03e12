#pragma once

#include <sqlite3.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/db/api/result.hpp"
#include "internal/db/sql/migrations.hpp"

namespace asqueue::db::sqlite {

struct SqliteOptions {
  std::string path;
  bool        wal_mode        = true;
  uint32_t    busy_timeout_ms = 5000;
};

/*
  Thin RAII wrapper around sqlite3* + prepared statement cache.

  One connection per database file. Transactions on it are serialized
  through TransactionMutex(); cached statements are only used while that
  mutex is held.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path);
  explicit SqliteDB(SqliteOptions options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations/transaction control).
  // Throws db::Error.
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // Cached prepared statement, owned by this object. Returns the sqlite rc.
  int Prepare(const char* sql, sqlite3_stmt** out);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

  std::timed_mutex& TransactionMutex() {
    return tx_mutex_;
  }

  std::chrono::milliseconds BusyTimeout() const {
    return std::chrono::milliseconds(options_.busy_timeout_ms);
  }

  // Statements running past the deadline are interrupted (SQLITE_INTERRUPT).
  void SetDeadline(std::optional<std::chrono::steady_clock::time_point> deadline);

  static ErrorCode TranslateCode(int rc);

 private:
  static int ProgressHandler(void* self);

  sqlite3*      db_ = nullptr;
  SqliteOptions options_;

  std::mutex                                     statements_mutex_;
  std::unordered_map<std::string, sqlite3_stmt*> statements_;

  std::timed_mutex tx_mutex_;

  // steady_clock ticks, 0 = no deadline
  std::atomic<int64_t> deadline_ticks_{0};
};

} // namespace asqueue::db::sqlite
