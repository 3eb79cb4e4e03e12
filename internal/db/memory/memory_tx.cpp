#include "memory_tx.hpp"

namespace asqueue::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, const TransactionOptions& options)
    : repo_(repo), lock_(repo.tx_mutex_, std::defer_lock), deadline_(options.deadline) {
  if (!lock_.try_lock_for(repo_.lock_timeout_)) {
    throw Error(ErrorCode::Busy, "memory: timed out waiting for the open transaction to end");
  }

  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (active_) Rollback();
}

Result MemoryTransaction::Check() const {
  if (!active_) {
    return Result::Err(ErrorCode::InternalError, "transaction is not active");
  }
  if (deadline_ && std::chrono::steady_clock::now() >= *deadline_) {
    return Result::Err(ErrorCode::DeadlineExceeded, "memory: transaction deadline exceeded");
  }
  return Result::Ok();
}

void MemoryTransaction::Commit() {
  if (!active_) {
    throw Error(ErrorCode::InternalError, "memory: commit on an ended transaction");
  }
  {
    std::scoped_lock lock(repo_.mutex_);
    repo_.committed_ = std::move(working_);
  }
  committed_ = true;
  active_    = false;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  active_ = false;
  working_ = {};
  if (lock_.owns_lock()) lock_.unlock();
}

} // namespace asqueue::db::memory
