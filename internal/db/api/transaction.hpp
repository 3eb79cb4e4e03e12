#pragma once

#include <chrono>
#include <optional>

namespace asqueue::db {

struct TransactionOptions {
  // Read-only scopes may start deferred; backends are free to ignore it.
  bool read_only = false;

  // In-flight backend calls past this point are aborted with DeadlineExceeded.
  std::optional<std::chrono::steady_clock::time_point> deadline;
};

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not ended
  - Commit()/Rollback() throw db::Error on backend failure

  SQLite: BEGIN IMMEDIATE (BEGIN DEFERRED when read_only)
  Postgres: pqxx::work
  Memory: snapshot copy-on-write
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() succeeded
  virtual bool IsCommitted() const = 0;

  // false once Commit() or Rollback() ran
  virtual bool IsActive() const = 0;
};

}
