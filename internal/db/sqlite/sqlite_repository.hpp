#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace asqueue::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin(const TransactionOptions& options = {}) override;

  Result InsertEvent(Transaction&, model::QueuedEventRecord&) override;
  Result CountByDestination(Transaction&, const std::string&, uint64_t&) override;
  Result SelectEventsByDestination(Transaction&, const std::string&, uint64_t,
                                   std::vector<model::QueuedEventRecord>&) override;
  Result DeleteUpToSequence(Transaction&, const std::string&, uint64_t, uint64_t&) override;
  Result DeleteUpToEventID(Transaction&, const std::string&, uint64_t&) override;
  Result ListDestinations(Transaction&, std::vector<std::string>&) override;

private:
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
  // Checks the transaction is usable, then hands out its cached statement.
  static Result Prepare(SqliteTransaction& tx, const char* sql, sqlite3_stmt** st);

  std::shared_ptr<SqliteDB> db_;
};

}
