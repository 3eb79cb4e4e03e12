#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace asqueue::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, const TransactionOptions& options)
    : db_(std::move(db)), lock_(db_->TransactionMutex(), std::defer_lock), deadline_(options.deadline) {
  if (!lock_.try_lock_for(db_->BusyTimeout())) {
    throw Error(ErrorCode::Busy, "sqlite: timed out waiting for the open transaction to end");
  }

  db_->SetDeadline(options.deadline);
  try {
    db_->Exec(options.read_only ? "BEGIN DEFERRED;" : "BEGIN IMMEDIATE;");
  } catch (...) {
    db_->SetDeadline(std::nullopt);
    throw;
  }
  active_ = true;
}

SqliteTransaction::~SqliteTransaction() {
  if (active_) {
    try {
      Rollback();
    } catch (const std::exception& e) {
      ASQUEUE_LOG_WARN("sqlite rollback on destruction failed", {observability::StringField("error", e.what())});
    }
  }
}

Result SqliteTransaction::Check() const {
  if (!active_) {
    return Result::Err(ErrorCode::InternalError, "transaction is not active");
  }
  if (deadline_ && std::chrono::steady_clock::now() >= *deadline_) {
    return Result::Err(ErrorCode::DeadlineExceeded, "sqlite: transaction deadline exceeded");
  }
  return Result::Ok();
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  active_ = false;
  Release();
}

void SqliteTransaction::Rollback() {
  active_ = false;
  // the rollback itself must never be interrupted
  db_->SetDeadline(std::nullopt);
  try {
    db_->Exec("ROLLBACK;");
  } catch (...) {
    Release();
    throw;
  }
  Release();
}

void SqliteTransaction::Release() {
  db_->SetDeadline(std::nullopt);
  if (lock_.owns_lock()) {
    lock_.unlock();
  }
}

} // namespace asqueue::db::sqlite
