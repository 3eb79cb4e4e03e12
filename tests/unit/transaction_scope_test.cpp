#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/transaction_scope.hpp"
#include "internal/db/memory/memory_repository.hpp"

namespace {

using asqueue::db::EndTransaction;
using asqueue::db::Error;
using asqueue::db::ErrorCode;
using asqueue::db::Repository;
using asqueue::db::Result;
using asqueue::db::Transaction;
using asqueue::db::TransactionOptions;
using asqueue::db::TransactionScope;
using asqueue::db::WithTransaction;
using asqueue::db::memory::MemoryRepository;
using asqueue::db::model::QueuedEventRecord;

struct Calls {
  int  commits       = 0;
  int  rollbacks     = 0;
  bool fail_commit   = false;
  bool fail_rollback = false;
};

class FakeTransaction final : public Transaction {
 public:
  explicit FakeTransaction(Calls& calls) : calls_(calls) {
  }

  void Commit() override {
    ++calls_.commits;
    if (calls_.fail_commit) {
      throw Error(ErrorCode::IOError, "disk full");
    }
    active_    = false;
    committed_ = true;
  }

  void Rollback() override {
    ++calls_.rollbacks;
    active_ = false;
    if (calls_.fail_rollback) {
      throw Error(ErrorCode::Unavailable, "connection lost");
    }
  }

  bool IsCommitted() const override {
    return committed_;
  }

  bool IsActive() const override {
    return active_;
  }

 private:
  Calls& calls_;
  bool   active_    = true;
  bool   committed_ = false;
};

// Hands out FakeTransactions; queue calls succeed without storing anything.
class FakeRepository final : public Repository {
 public:
  Calls calls;
  bool  fail_begin = false;

  std::unique_ptr<Transaction> Begin(const TransactionOptions&) override {
    if (fail_begin) {
      throw Error(ErrorCode::Busy, "database is locked");
    }
    return std::make_unique<FakeTransaction>(calls);
  }

  Result InsertEvent(Transaction&, QueuedEventRecord& record) override {
    record.sequence_id = 1;
    return Result::Ok();
  }
  Result CountByDestination(Transaction&, const std::string&, uint64_t& count) override {
    count = 0;
    return Result::Ok();
  }
  Result SelectEventsByDestination(Transaction&, const std::string&, uint64_t, std::vector<QueuedEventRecord>& out) override {
    out.clear();
    return Result::Ok();
  }
  Result DeleteUpToSequence(Transaction&, const std::string&, uint64_t, uint64_t& deleted) override {
    deleted = 0;
    return Result::Ok();
  }
  Result DeleteUpToEventID(Transaction&, const std::string&, uint64_t& deleted) override {
    deleted = 0;
    return Result::Ok();
  }
  Result ListDestinations(Transaction&, std::vector<std::string>& out) override {
    out.clear();
    return Result::Ok();
  }
};

void TestEndTransactionCommitsOnce() {
  Calls           calls;
  FakeTransaction tx(calls);

  assert(EndTransaction(tx, true));
  assert(calls.commits == 1);
  assert(tx.IsCommitted());

  // already ended: error, backend untouched
  auto again = EndTransaction(tx, true);
  assert(!again);
  assert(calls.commits == 1);
  assert(calls.rollbacks == 0);

  assert(!EndTransaction(tx, false));
  assert(calls.rollbacks == 0);
}

void TestEndTransactionRollsBack() {
  Calls           calls;
  FakeTransaction tx(calls);

  assert(EndTransaction(tx, false));
  assert(calls.rollbacks == 1);
  assert(calls.commits == 0);
  assert(!tx.IsCommitted());
}

void TestCommitFailureIsSurfacedAndRolledBack() {
  Calls calls;
  calls.fail_commit = true;
  FakeTransaction tx(calls);

  auto result = EndTransaction(tx, true);
  assert(!result);
  assert(result.code == ErrorCode::IOError);
  assert(result.message == "disk full");
  assert(calls.rollbacks == 1);
}

void TestRollbackFailureKeepsWorkError() {
  FakeRepository repo;
  repo.calls.fail_rollback = true;

  auto result = WithTransaction(repo, [](Transaction&) { return Result::Err(ErrorCode::ConstraintViolation, "duplicate"); });

  assert(!result);
  assert(result.code == ErrorCode::ConstraintViolation);
  assert(result.message == "duplicate");
  assert(repo.calls.rollbacks == 1);
  assert(repo.calls.commits == 0);
}

void TestWorkSuccessCommits() {
  FakeRepository repo;

  auto result = WithTransaction(repo, [](Transaction&) { return Result::Ok(); });
  assert(result);
  assert(repo.calls.commits == 1);
  assert(repo.calls.rollbacks == 0);
}

void TestCommitFailureFromWithTransaction() {
  FakeRepository repo;
  repo.calls.fail_commit = true;

  auto result = WithTransaction(repo, [](Transaction&) { return Result::Ok(); });
  assert(!result);
  assert(result.code == ErrorCode::IOError);
}

void TestThrowingWorkRollsBackAndPropagates() {
  FakeRepository repo;

  bool threw = false;
  try {
    (void)WithTransaction(repo, [](Transaction&) -> Result { throw std::runtime_error("boom"); });
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "boom";
  }

  assert(threw);
  assert(repo.calls.rollbacks == 1);
  assert(repo.calls.commits == 0);
}

void TestBeginFailureBecomesResult() {
  FakeRepository repo;
  repo.fail_begin = true;

  bool ran    = false;
  auto result = WithTransaction(repo, [&](Transaction&) {
    ran = true;
    return Result::Ok();
  });

  assert(!ran);
  assert(!result);
  assert(result.code == ErrorCode::Busy);
}

void TestScopeDestructorRollsBack() {
  Calls calls;
  {
    TransactionScope scope(std::make_unique<FakeTransaction>(calls));
    assert(!scope.Ended());
  }
  assert(calls.rollbacks == 1);
  assert(calls.commits == 0);

  Calls committed;
  {
    TransactionScope scope(std::make_unique<FakeTransaction>(committed));
    assert(scope.End(true));
    assert(scope.Ended());
    assert(!scope.End(false));
  }
  assert(committed.commits == 1);
  assert(committed.rollbacks == 0);
}

void TestInsertVisibilityFollowsWorkOutcome() {
  MemoryRepository repo;

  auto insert = [&](const std::string& event_id) {
    return [&repo, event_id](Transaction& tx) {
      QueuedEventRecord record;
      record.destination_id = "irc-bridge";
      record.event_id       = event_id;
      return repo.InsertEvent(tx, record);
    };
  };

  auto failed = WithTransaction(repo, [&](Transaction& tx) {
    auto r = insert("$dropped")(tx);
    assert(r);
    return Result::Err(ErrorCode::InternalError, "later step failed");
  });
  assert(!failed);
  assert(failed.message == "later step failed");

  assert(WithTransaction(repo, insert("$kept")));

  std::vector<QueuedEventRecord> rows;
  assert(WithTransaction(repo, [&](Transaction& tx) { return repo.SelectEventsByDestination(tx, "irc-bridge", 10, rows); }));
  assert(rows.size() == 1);
  assert(rows[0].event_id == "$kept");
}

} // namespace

int main() {
  TestEndTransactionCommitsOnce();
  TestEndTransactionRollsBack();
  TestCommitFailureIsSurfacedAndRolledBack();
  TestRollbackFailureKeepsWorkError();
  TestWorkSuccessCommits();
  TestCommitFailureFromWithTransaction();
  TestThrowingWorkRollsBackAndPropagates();
  TestBeginFailureBecomesResult();
  TestScopeDestructorRollsBack();
  TestInsertVisibilityFollowsWorkOutcome();

  std::cout << "asqueue_unit_transaction_scope: pass\n";
  return 0;
}
