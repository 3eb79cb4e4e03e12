#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <pqxx/pqxx>
#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace asqueue::db::postgres {

/*
  One pqxx::work on a pooled connection.

  A deadline becomes SET LOCAL statement_timeout, so the server cancels
  statements still running past it.
*/
class PgTransaction final : public db::Transaction {
public:
  // Throws db::Error when no connection can be opened.
  PgTransaction(std::shared_ptr<PgPool> pool, const TransactionOptions& options);
  ~PgTransaction();

  pqxx::work& Work() { return *tx_; }

  // Err when the transaction ended or its deadline passed.
  Result Check() const;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }
  bool IsActive() const override { return active_; }

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> tx_;
  std::optional<std::chrono::steady_clock::time_point> deadline_;
  bool committed_ = false;
  bool active_ = false;
};

// Maps libpqxx exceptions onto portable codes.
Result TranslateException(const std::exception& e);

}
