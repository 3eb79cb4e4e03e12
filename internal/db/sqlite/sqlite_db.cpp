#include "sqlite_db.hpp"

#include <utility>

namespace asqueue::db::sqlite {

// Progress callback granularity in VM instructions.
static constexpr int kProgressOps = 1000;

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw Error(SqliteDB::TranslateCode(rc), std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : SqliteDB(SqliteOptions{.path = std::move(path)}) {
}

SqliteDB::SqliteDB(SqliteOptions options) : options_(std::move(options)) {
  int rc = sqlite3_open_v2(options_.path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw Error(ErrorCode::Unavailable, "sqlite open " + options_.path + ": " + msg);
  }

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  for (auto& [_, stmt] : statements_) {
    sqlite3_finalize(stmt);
  }
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw Error(TranslateCode(rc), msg);
  }
}

int SqliteDB::Prepare(const char* sql, sqlite3_stmt** out) {
  std::lock_guard lock(statements_mutex_);

  auto it = statements_.find(sql);
  if (it != statements_.end()) {
    *out = it->second;
    return SQLITE_OK;
  }

  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v3(db_, sql, -1, SQLITE_PREPARE_PERSISTENT, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    sqlite3_finalize(stmt);
    *out = nullptr;
    return rc;
  }

  statements_.emplace(sql, stmt);
  *out = stmt;
  return SQLITE_OK;
}

void SqliteDB::Configure() {
  // WAL enables concurrent readers from other processes while we write
  Exec(options_.wal_mode ? "PRAGMA journal_mode=WAL;" : "PRAGMA journal_mode=DELETE;");

  // queue rows must survive a crash once the insert committed
  Exec("PRAGMA synchronous=FULL;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, static_cast<int>(options_.busy_timeout_ms)), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");

  sqlite3_progress_handler(db_, kProgressOps, &SqliteDB::ProgressHandler, this);
}

void SqliteDB::SetDeadline(std::optional<std::chrono::steady_clock::time_point> deadline) {
  deadline_ticks_.store(deadline ? deadline->time_since_epoch().count() : 0);
}

int SqliteDB::ProgressHandler(void* self) {
  const auto ticks = static_cast<SqliteDB*>(self)->deadline_ticks_.load();
  if (ticks == 0) {
    return 0;
  }
  return std::chrono::steady_clock::now().time_since_epoch().count() >= ticks ? 1 : 0;
}

ErrorCode SqliteDB::TranslateCode(int rc) {
  switch (rc & 0xff) {
    case SQLITE_OK:
    case SQLITE_DONE:
    case SQLITE_ROW:
      return ErrorCode::OK;
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return ErrorCode::Busy;
    case SQLITE_CONSTRAINT:
    case SQLITE_MISMATCH:
    case SQLITE_TOOBIG:
      return ErrorCode::ConstraintViolation;
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return ErrorCode::IOError;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return ErrorCode::Corruption;
    case SQLITE_CANTOPEN:
    case SQLITE_READONLY:
      return ErrorCode::Unavailable;
    case SQLITE_INTERRUPT:
      return ErrorCode::DeadlineExceeded;
    default:
      return ErrorCode::InternalError;
  }
}

} // namespace asqueue::db::sqlite
