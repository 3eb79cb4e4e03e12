#pragma once

#include <memory>
#include <mutex>
#include <optional>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace asqueue::db::sqlite {

/*
  SQLite transaction wrapper.

  Holds the connection's transaction mutex for its whole lifetime, so at
  most one transaction is open per SqliteDB.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later
  Read-only transactions use BEGIN DEFERRED.
*/
class SqliteTransaction final : public db::Transaction {
public:
  // Throws db::Error(Busy) when the connection stays locked past the busy timeout.
  SqliteTransaction(std::shared_ptr<SqliteDB> db, const TransactionOptions& options);
  ~SqliteTransaction();

  SqliteDB& DB() const { return *db_; }
  sqlite3* Handle() const { return db_->Handle(); }

  // Err when the transaction ended or its deadline passed.
  Result Check() const;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }
  bool IsActive() const override { return active_; }

private:
  void Release();

  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::timed_mutex> lock_;
  std::optional<std::chrono::steady_clock::time_point> deadline_;
  bool committed_ = false;
  bool active_ = false;
};

}
