#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace asqueue::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin(const TransactionOptions& options = {}) override;

  Result InsertEvent(Transaction&, model::QueuedEventRecord&) override;
  Result CountByDestination(Transaction&, const std::string&, uint64_t&) override;
  Result SelectEventsByDestination(Transaction&, const std::string&, uint64_t,
                                   std::vector<model::QueuedEventRecord>&) override;
  Result DeleteUpToSequence(Transaction&, const std::string&, uint64_t, uint64_t&) override;
  Result DeleteUpToEventID(Transaction&, const std::string&, uint64_t&) override;
  Result ListDestinations(Transaction&, std::vector<std::string>&) override;

private:
  static PgTransaction& TX(Transaction& t);

  std::shared_ptr<PgPool> pool_;
};

}
