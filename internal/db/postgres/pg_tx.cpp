#include "pg_tx.hpp"

#include <string>

#include "internal/observability/logging.hpp"

namespace asqueue::db::postgres {

static Error ToError(const std::exception& e) {
  Result r = TranslateException(e);
  return Error(r.code, r.message);
}

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, const TransactionOptions& options)
    : deadline_(options.deadline)
{
  try {
    conn_ = pool->Acquire();
    tx_ = std::make_unique<pqxx::work>(*conn_);

    if (options.read_only) {
      tx_->exec("SET TRANSACTION READ ONLY");
    }

    if (deadline_) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        throw Error(ErrorCode::DeadlineExceeded, "postgres: deadline passed before begin");
      }
      tx_->exec("SET LOCAL statement_timeout = " + std::to_string(remaining.count()));
    }
  } catch (const Error&) {
    throw;
  } catch (const std::exception& e) {
    throw ToError(e);
  }
  active_ = true;
}

PgTransaction::~PgTransaction() {
  if (active_) {
    try {
      Rollback();
    } catch (const std::exception& e) {
      ASQUEUE_LOG_WARN("postgres rollback on destruction failed", {observability::StringField("error", e.what())});
    }
  }
}

Result PgTransaction::Check() const {
  if (!active_) {
    return Result::Err(ErrorCode::InternalError, "transaction is not active");
  }
  if (deadline_ && std::chrono::steady_clock::now() >= *deadline_) {
    return Result::Err(ErrorCode::DeadlineExceeded, "postgres: transaction deadline exceeded");
  }
  return Result::Ok();
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const std::exception& e) {
    // pqxx leaves the work unusable after a failed commit
    active_ = false;
    throw ToError(e);
  }
  committed_ = true;
  active_ = false;
}

void PgTransaction::Rollback() {
  active_ = false;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    throw ToError(e);
  }
}

Result TranslateException(const std::exception& e) {
  if (dynamic_cast<const pqxx::query_cancelled*>(&e)) {
    return Result::Err(ErrorCode::DeadlineExceeded, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e) || dynamic_cast<const pqxx::in_doubt_error*>(&e)) {
    return Result::Err(ErrorCode::Unavailable, e.what());
  }
  if (auto* sql = dynamic_cast<const pqxx::sql_error*>(&e)) {
    // statement_timeout reports 57014 (query_canceled)
    if (sql->sqlstate() == "57014") {
      return Result::Err(ErrorCode::DeadlineExceeded, e.what());
    }
    if (sql->sqlstate().rfind("53", 0) == 0) {
      return Result::Err(ErrorCode::Unavailable, e.what());
    }
  }
  if (auto* err = dynamic_cast<const Error*>(&e)) {
    return Result::Err(err->Code(), err->what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

}
