#pragma once

#include <functional>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"

namespace asqueue::db {

/*
  Ends a transaction: commit when `succeeded`, rollback otherwise.

  - Returns an error instead of touching the backend when the
    transaction has already ended.
  - A failed commit leaves nothing behind: the transaction is
    rolled back before the commit error is returned.
  - Rollback failures are logged and returned.
*/
Result EndTransaction(Transaction& tx, bool succeeded);

/*
  Scope guard around an open transaction.

  The first End() decides commit vs rollback. If the scope is destroyed
  without End() (early return, exception unwinding) it rolls back.
*/
class TransactionScope {
 public:
  explicit TransactionScope(std::unique_ptr<Transaction> tx);
  ~TransactionScope();

  TransactionScope(const TransactionScope&)            = delete;
  TransactionScope& operator=(const TransactionScope&) = delete;

  Transaction& Handle() {
    return *tx_;
  }

  bool Ended() const {
    return ended_;
  }

  Result End(bool succeeded);

 private:
  std::unique_ptr<Transaction> tx_;
  bool                         ended_ = false;
};

using TransactionWork = std::function<Result(Transaction&)>;

/*
  Runs `work` inside a fresh transaction.

  work error   -> rollback, the work error is returned unchanged
  work success -> commit, a commit failure is returned
  work throws  -> rollback, the exception propagates
*/
Result WithTransaction(Repository& repository, const TransactionWork& work, const TransactionOptions& options = {});

} // namespace asqueue::db
