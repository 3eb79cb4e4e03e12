#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/transaction_scope.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/queued_event_record.hpp"
#include "internal/db/sql/migrations.hpp"

#if ASQUEUE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if ASQUEUE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using asqueue::db::ErrorCode;
using asqueue::db::Repository;
using asqueue::db::Result;
using asqueue::db::Transaction;
using asqueue::db::TransactionOptions;
using asqueue::db::memory::MemoryRepository;
using asqueue::db::model::QueuedEventRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

QueuedEventRecord MakeRecord(const std::string& destination, const std::string& event_id, int64_t ts = 1000) {
  QueuedEventRecord r;
  r.destination_id   = destination;
  r.event_id         = event_id;
  r.origin_server_ts = ts;
  r.room_id          = "!room:example.org";
  r.type             = "m.room.message";
  r.sender           = "@alice:example.org";
  r.content          = R"({"body":"hi","msgtype":"m.text"})";
  return r;
}

uint64_t Insert(Repository& repo, Transaction& tx, const std::string& destination, const std::string& event_id) {
  auto r = MakeRecord(destination, event_id);
  assert(repo.InsertEvent(tx, r));
  assert(r.sequence_id > 0);
  return r.sequence_id;
}

uint64_t Count(Repository& repo, const std::string& destination) {
  uint64_t count = 0;
  auto     tx    = repo.Begin();
  assert(repo.CountByDestination(*tx, destination, count));
  tx->Commit();
  return count;
}

std::vector<QueuedEventRecord> Select(Repository& repo, const std::string& destination, uint64_t limit) {
  std::vector<QueuedEventRecord> out;
  auto                           tx = repo.Begin();
  assert(repo.SelectEventsByDestination(*tx, destination, limit, out));
  tx->Commit();
  return out;
}

void VerifyInsertSelectOrder(Repository& repo, const std::string& prefix) {
  const auto d = prefix + "-order";
  const auto e = prefix + "-order-other";

  auto     tx = repo.Begin();
  uint64_t s1 = Insert(repo, *tx, d, prefix + "$a");
  uint64_t s2 = Insert(repo, *tx, e, prefix + "$x");
  uint64_t s3 = Insert(repo, *tx, d, prefix + "$b");
  uint64_t s4 = Insert(repo, *tx, d, prefix + "$c");
  assert(s1 < s2 && s2 < s3 && s3 < s4);

  // reads inside the transaction see its writes
  uint64_t count = 0;
  assert(repo.CountByDestination(*tx, d, count));
  assert(count == 3);
  tx->Commit();
  assert(tx->IsCommitted());
  assert(!tx->IsActive());

  auto all = Select(repo, d, 10);
  assert(all.size() == 3);
  assert(all[0].event_id == prefix + "$a");
  assert(all[1].event_id == prefix + "$b");
  assert(all[2].event_id == prefix + "$c");
  assert(all[0].sequence_id == s1 && all[2].sequence_id == s4);
  assert(all[0].destination_id == d);
  assert(all[0].room_id == "!room:example.org");
  assert(all[0].content.has_value() && *all[0].content == R"({"body":"hi","msgtype":"m.text"})");
  assert(all[0].transaction_ref == 0);

  auto first_two = Select(repo, d, 2);
  assert(first_two.size() == 2);
  assert(first_two[1].event_id == prefix + "$b");

  assert(Select(repo, d, 0).empty());
  assert(Select(repo, prefix + "-nobody", 10).empty());
  assert(Count(repo, prefix + "-nobody") == 0);
  assert(Count(repo, e) == 1);
}

void VerifyNullContent(Repository& repo, const std::string& prefix) {
  const auto d = prefix + "-null-content";

  auto tx = repo.Begin();
  auto r  = MakeRecord(d, prefix + "$null");
  r.content.reset();
  assert(repo.InsertEvent(*tx, r));
  tx->Commit();

  auto rows = Select(repo, d, 1);
  assert(rows.size() == 1);
  assert(!rows[0].content.has_value());
}

void VerifyDeleteUpToSequence(Repository& repo, const std::string& prefix) {
  const auto d = prefix + "-trunc";

  auto tx = repo.Begin();
  Insert(repo, *tx, d, prefix + "$t1");
  uint64_t s2 = Insert(repo, *tx, d, prefix + "$t2");
  Insert(repo, *tx, d, prefix + "$t3");
  tx->Commit();

  uint64_t deleted = 0;
  auto     del     = repo.Begin();
  assert(repo.DeleteUpToSequence(*del, d, s2, deleted));
  assert(deleted == 2);
  del->Commit();

  auto left = Select(repo, d, 10);
  assert(left.size() == 1);
  assert(left[0].event_id == prefix + "$t3");

  // idempotent
  auto again = repo.Begin();
  assert(repo.DeleteUpToSequence(*again, d, s2, deleted));
  assert(deleted == 0);
  again->Commit();
  assert(Count(repo, d) == 1);
}

void VerifyDeleteUpToEventID(Repository& repo, const std::string& prefix) {
  const auto a      = prefix + "-ack-a";
  const auto b      = prefix + "-ack-b";
  const auto shared = prefix + "$shared";

  // one event fanned out to two application services
  auto tx = repo.Begin();
  Insert(repo, *tx, a, prefix + "$a1");
  Insert(repo, *tx, b, prefix + "$b1");
  Insert(repo, *tx, a, shared);
  Insert(repo, *tx, b, shared);
  Insert(repo, *tx, a, prefix + "$a2");
  tx->Commit();

  uint64_t deleted = 0;
  auto     del     = repo.Begin();
  assert(repo.DeleteUpToEventID(*del, shared, deleted));
  assert(deleted == 4);
  del->Commit();

  auto left_a = Select(repo, a, 10);
  assert(left_a.size() == 1);
  assert(left_a[0].event_id == prefix + "$a2");
  assert(Count(repo, b) == 0);

  auto again = repo.Begin();
  assert(repo.DeleteUpToEventID(*again, shared, deleted));
  assert(deleted == 0);
  assert(repo.DeleteUpToEventID(*again, prefix + "$never-queued", deleted));
  assert(deleted == 0);
  again->Commit();
  assert(Count(repo, a) == 1);
}

void VerifyListDestinations(Repository& repo, const std::string& prefix) {
  const auto d = prefix + "-listed";

  auto tx = repo.Begin();
  Insert(repo, *tx, d, prefix + "$l1");
  tx->Commit();

  std::vector<std::string> destinations;
  auto                     read = repo.Begin();
  assert(repo.ListDestinations(*read, destinations));
  read->Commit();

  std::set<std::string> unique(destinations.begin(), destinations.end());
  assert(unique.size() == destinations.size());
  assert(unique.count(d) == 1);
  assert(unique.count(prefix + "-ack-b") == 0); // drained above
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  const auto d = prefix + "-rollback";

  {
    auto tx = repo.Begin();
    Insert(repo, *tx, d, prefix + "$r1");
    tx->Rollback();
    assert(!tx->IsActive());
    assert(!tx->IsCommitted());
  }
  assert(Count(repo, d) == 0);

  // destructor rolls back
  {
    auto tx = repo.Begin();
    Insert(repo, *tx, d, prefix + "$r2");
  }
  assert(Count(repo, d) == 0);

  // failed work through the scope helper
  auto result = asqueue::db::WithTransaction(repo, [&](Transaction& tx) {
    Insert(repo, tx, d, prefix + "$r3");
    return Result::Err(ErrorCode::InternalError, "work failed");
  });
  assert(!result);
  assert(result.message == "work failed");
  assert(Count(repo, d) == 0);

  // calls on an ended transaction are rejected
  auto tx = repo.Begin();
  tx->Commit();
  auto r = MakeRecord(d, prefix + "$r4");
  auto rc = repo.InsertEvent(*tx, r);
  assert(!rc);
  assert(rc.code == ErrorCode::InternalError);

  std::vector<QueuedEventRecord> rows;
  assert(repo.SelectEventsByDestination(*tx, d, 10, rows).code == ErrorCode::InternalError);
  uint64_t deleted = 0;
  assert(repo.DeleteUpToSequence(*tx, d, 100, deleted).code == ErrorCode::InternalError);
  assert(Count(repo, d) == 0);
}

void VerifySequenceNeverReused(Repository& repo, const std::string& prefix) {
  const auto d = prefix + "-reuse";

  auto     tx    = repo.Begin();
  uint64_t first = Insert(repo, *tx, d, prefix + "$s1");
  tx->Commit();

  uint64_t deleted = 0;
  auto     del     = repo.Begin();
  assert(repo.DeleteUpToSequence(*del, d, first, deleted));
  assert(deleted == 1);
  del->Commit();

  auto     tx2    = repo.Begin();
  uint64_t second = Insert(repo, *tx2, d, prefix + "$s2");
  tx2->Commit();
  assert(second > first);
}

void VerifyDeadline(Repository& repo, const std::string& prefix) {
  const auto d = prefix + "-deadline";

  TransactionOptions options;
  options.deadline = std::chrono::steady_clock::now() - std::chrono::milliseconds(1);

  bool expired = false;
  try {
    auto tx = repo.Begin(options);
    auto r  = MakeRecord(d, prefix + "$late");
    auto rc = repo.InsertEvent(*tx, r);
    assert(!rc);
    assert(rc.code == ErrorCode::DeadlineExceeded);
    expired = true;
  } catch (const asqueue::db::Error& e) {
    assert(e.Code() == ErrorCode::DeadlineExceeded);
    expired = true;
  }
  assert(expired);
  assert(Count(repo, d) == 0);
}

void VerifyConcurrentInserts(Repository& repo, const std::string& prefix) {
  const auto        d          = prefix + "-concurrent";
  constexpr int     kThreads   = 4;
  constexpr int     kPerThread = 25;
  std::atomic<int>  failures{0};
  std::vector<std::thread> threads;

  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        auto result = asqueue::db::WithTransaction(repo, [&](Transaction& tx) {
          auto r = MakeRecord(d, prefix + "$c" + std::to_string(t) + "-" + std::to_string(i));
          return repo.InsertEvent(tx, r);
        });
        if (!result) failures.fetch_add(1);
      }
    });
  }
  for (auto& thread : threads) thread.join();

  assert(failures.load() == 0);
  assert(Count(repo, d) == kThreads * kPerThread);

  auto                rows = Select(repo, d, kThreads * kPerThread);
  std::set<uint64_t>  ids;
  for (size_t i = 0; i < rows.size(); ++i) {
    ids.insert(rows[i].sequence_id);
    if (i > 0) assert(rows[i - 1].sequence_id < rows[i].sequence_id);
  }
  assert(ids.size() == rows.size());
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  const auto d    = prefix + "-durable";
  auto       repo = backend.make_repository();

  uint64_t before = 0;
  {
    auto tx = repo->Begin();
    before  = Insert(*repo, *tx, d, prefix + "$d1");
    tx->Commit();
  }

  backend.restart(repo);

  auto rows = Select(*repo, d, 10);
  assert(rows.size() == 1);
  assert(rows[0].event_id == prefix + "$d1");
  assert(rows[0].sequence_id == before);

  auto     tx    = repo->Begin();
  uint64_t after = Insert(*repo, *tx, d, prefix + "$d2");
  tx->Commit();
  assert(after > before);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if ASQUEUE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("asqueue_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<asqueue::db::sqlite::SqliteDB>(db_path);
    asqueue::db::sql::RunMigrations(*db, asqueue::db::sql::SqliteSchema());
    return std::make_shared<asqueue::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if ASQUEUE_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("ASQUEUE_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("ASQUEUE_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<asqueue::db::postgres::PgPool>(conninfo);
    asqueue::db::sql::RunMigrations(*pool, asqueue::db::sql::PostgresSchema());
    return std::make_shared<asqueue::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = []() {},
  };
}
#endif

#if ASQUEUE_DB_POSTGRES
// Connections whose statements fail to prepare must be closed and must
// hand their slot back to the pool.
void VerifyPostgresPrepareFailureReleasesConnection() {
  const std::string uri      = std::getenv("ASQUEUE_TEST_POSTGRES_URI");
  const std::string app_name = "asqueue_prepare_failure_" + std::to_string(NowMs());
  const std::string broken   = uri + (uri.find('?') == std::string::npos ? "?" : "&") +
                             "application_name=" + app_name + "&options=-c%20search_path%3Dasqueue_no_such_schema";

  auto pool = std::make_shared<asqueue::db::postgres::PgPool>(broken, 1);
  for (int i = 0; i < 3; ++i) {
    bool threw = false;
    try {
      pool->Acquire();
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
  }

  pqxx::connection monitor(uri);
  int64_t          open     = -1;
  const auto       deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (std::chrono::steady_clock::now() < deadline) {
    pqxx::nontransaction tx(monitor);
    open = tx.exec1("SELECT COUNT(*) FROM pg_stat_activity WHERE application_name=" + tx.quote(app_name))[0].as<int64_t>();
    if (open == 0)
      break;
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  assert(open == 0);
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // shared databases keep rows from earlier runs
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  VerifyInsertSelectOrder(*repo, prefix);
  VerifyNullContent(*repo, prefix);
  VerifyDeleteUpToSequence(*repo, prefix);
  VerifyDeleteUpToEventID(*repo, prefix);
  VerifyListDestinations(*repo, prefix);
  VerifyRollbackBehavior(*repo, prefix);
  VerifySequenceNeverReused(*repo, prefix);
  VerifyDeadline(*repo, prefix);
  VerifyConcurrentInserts(*repo, prefix);

  repo.reset();
  VerifyRestartDurability(backend, prefix);

#if ASQUEUE_DB_POSTGRES
  if (backend.name == "postgres")
    VerifyPostgresPrepareFailureReleasesConnection();
#endif

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if ASQUEUE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if ASQUEUE_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "asqueue_integration_repository_parity: pass\n";
  return 0;
}
