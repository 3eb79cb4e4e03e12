#include "internal/db/api/transaction_scope.hpp"

#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"

namespace asqueue::db {

namespace {

Result RollbackQuietly(Transaction& tx) {
  try {
    tx.Rollback();
    return Result::Ok();
  } catch (const Error& e) {
    ASQUEUE_LOG_WARN("transaction rollback failed",
                     {observability::StringField("code", ToString(e.Code())), observability::StringField("error", e.what())});
    return Result::Err(e.Code(), e.what());
  } catch (const std::exception& e) {
    ASQUEUE_LOG_WARN("transaction rollback failed", {observability::StringField("error", e.what())});
    return Result::Err(ErrorCode::InternalError, e.what());
  }
}

} // namespace

Result EndTransaction(Transaction& tx, bool succeeded) {
  if (!tx.IsActive()) {
    return Result::Err(ErrorCode::InternalError, "transaction already ended");
  }

  if (!succeeded) {
    return RollbackQuietly(tx);
  }

  Result commit;
  try {
    tx.Commit();
    return Result::Ok();
  } catch (const Error& e) {
    commit = Result::Err(e.Code(), e.what());
  } catch (const std::exception& e) {
    commit = Result::Err(ErrorCode::InternalError, e.what());
  }

  ASQUEUE_LOG_WARN("transaction commit failed",
                   {observability::StringField("code", ToString(commit.code)), observability::StringField("error", commit.message)});
  if (tx.IsActive()) {
    (void)RollbackQuietly(tx);
  }
  return commit;
}

TransactionScope::TransactionScope(std::unique_ptr<Transaction> tx) : tx_(std::move(tx)) {
}

TransactionScope::~TransactionScope() {
  if (!ended_) {
    (void)End(false);
  }
}

Result TransactionScope::End(bool succeeded) {
  if (ended_) {
    return Result::Err(ErrorCode::InternalError, "transaction scope already ended");
  }
  ended_ = true;
  return EndTransaction(*tx_, succeeded);
}

Result WithTransaction(Repository& repository, const TransactionWork& work, const TransactionOptions& options) {
  std::unique_ptr<Transaction> tx;
  try {
    tx = repository.Begin(options);
  } catch (const Error& e) {
    return Result::Err(e.Code(), e.what());
  }

  TransactionScope scope(std::move(tx));

  Result result = work(scope.Handle());
  if (!result) {
    // rollback errors are logged by End() and never replace the work error
    (void)scope.End(false);
    return result;
  }

  return scope.End(true);
}

} // namespace asqueue::db
