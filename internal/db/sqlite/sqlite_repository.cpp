#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"

namespace asqueue::db::sqlite {

using asqueue::db::ErrorCode;
using asqueue::db::Result;

namespace {

// Resets a cached statement when the call returns, whatever the outcome.
class StatementReset {
public:
    explicit StatementReset(sqlite3_stmt* st) : st_(st) {}
    ~StatementReset() {
        sqlite3_reset(st_);
        sqlite3_clear_bindings(st_);
    }

    StatementReset(const StatementReset&) = delete;
    StatementReset& operator=(const StatementReset&) = delete;

private:
    sqlite3_stmt* st_;
};

} // namespace

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindOptionalText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s) BindText(st, idx, *s);
    else sqlite3_bind_null(st, idx);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? std::string(reinterpret_cast<const char*>(t), sqlite3_column_bytes(st, col)) : "";
}

static std::optional<std::string> ColOptionalText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColText(st, col);
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin(const TransactionOptions& options) {
    return std::make_unique<SqliteTransaction>(db_, options);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    const ErrorCode code = SqliteDB::TranslateCode(rc);
    if (code == ErrorCode::OK)
        return Result::Ok();
    return Result::Err(code, sqlite3_errmsg(db));
}

Result SqliteRepository::Prepare(SqliteTransaction& tx, const char* sql, sqlite3_stmt** st) {
    if (auto check = tx.Check(); !check)
        return check;
    if (int rc = tx.DB().Prepare(sql, st); rc != SQLITE_OK)
        return Translate(tx.Handle(), rc);
    return Result::Ok();
}

// ------------------------------------------------------------------
// Queue
// ------------------------------------------------------------------

Result SqliteRepository::InsertEvent(Transaction& t, model::QueuedEventRecord& r) {
    auto& tx = TX(t);
    sqlite3_stmt* st = nullptr;
    if (auto prepared = Prepare(tx, sql::INSERT_EVENT, &st); !prepared)
        return prepared;
    StatementReset reset(st);

    BindText(st, 1, r.destination_id);
    BindText(st, 2, r.event_id);
    BindI64(st, 3, r.origin_server_ts);
    BindText(st, 4, r.room_id);
    BindText(st, 5, r.type);
    BindText(st, 6, r.sender);
    BindOptionalText(st, 7, r.content);
    BindU64(st, 8, r.transaction_ref);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_DONE)
        return Translate(tx.Handle(), rc);

    r.sequence_id = static_cast<uint64_t>(sqlite3_last_insert_rowid(tx.Handle()));
    return Result::Ok();
}

Result SqliteRepository::CountByDestination(Transaction& t, const std::string& destination_id, uint64_t& count) {
    auto& tx = TX(t);
    sqlite3_stmt* st = nullptr;
    if (auto prepared = Prepare(tx, sql::COUNT_EVENTS_BY_DESTINATION, &st); !prepared)
        return prepared;
    StatementReset reset(st);

    BindText(st, 1, destination_id);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW)
        return Translate(tx.Handle(), rc);

    count = ColU64(st, 0);
    return Result::Ok();
}

Result SqliteRepository::SelectEventsByDestination(Transaction& t, const std::string& destination_id, uint64_t limit,
                                                   std::vector<model::QueuedEventRecord>& out) {
    out.clear();
    if (limit == 0)
        return Result::Ok();

    auto& tx = TX(t);
    sqlite3_stmt* st = nullptr;
    if (auto prepared = Prepare(tx, sql::SELECT_EVENTS_BY_DESTINATION, &st); !prepared)
        return prepared;
    StatementReset reset(st);

    BindText(st, 1, destination_id);
    BindU64(st, 2, limit);

    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        model::QueuedEventRecord r;
        r.sequence_id      = ColU64(st, 0);
        r.destination_id   = ColText(st, 1);
        r.event_id         = ColText(st, 2);
        r.origin_server_ts = ColI64(st, 3);
        r.room_id          = ColText(st, 4);
        r.type             = ColText(st, 5);
        r.sender           = ColText(st, 6);
        r.content          = ColOptionalText(st, 7);
        r.transaction_ref  = ColU64(st, 8);
        out.push_back(std::move(r));
    }

    if (rc != SQLITE_DONE) {
        out.clear();
        return Translate(tx.Handle(), rc);
    }
    return Result::Ok();
}

Result SqliteRepository::DeleteUpToSequence(Transaction& t, const std::string& destination_id,
                                            uint64_t max_sequence_id, uint64_t& deleted) {
    auto& tx = TX(t);
    sqlite3_stmt* st = nullptr;
    if (auto prepared = Prepare(tx, sql::DELETE_UP_TO_SEQUENCE, &st); !prepared)
        return prepared;
    StatementReset reset(st);

    BindText(st, 1, destination_id);
    BindU64(st, 2, max_sequence_id);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_DONE)
        return Translate(tx.Handle(), rc);

    deleted = static_cast<uint64_t>(sqlite3_changes(tx.Handle()));
    return Result::Ok();
}

Result SqliteRepository::DeleteUpToEventID(Transaction& t, const std::string& event_id, uint64_t& deleted) {
    auto& tx = TX(t);
    sqlite3_stmt* st = nullptr;
    if (auto prepared = Prepare(tx, sql::DELETE_UP_TO_EVENT_ID, &st); !prepared)
        return prepared;
    StatementReset reset(st);

    BindText(st, 1, event_id);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_DONE)
        return Translate(tx.Handle(), rc);

    deleted = static_cast<uint64_t>(sqlite3_changes(tx.Handle()));
    return Result::Ok();
}

Result SqliteRepository::ListDestinations(Transaction& t, std::vector<std::string>& out) {
    out.clear();

    auto& tx = TX(t);
    sqlite3_stmt* st = nullptr;
    if (auto prepared = Prepare(tx, sql::SELECT_DESTINATIONS, &st); !prepared)
        return prepared;
    StatementReset reset(st);

    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW)
        out.push_back(ColText(st, 0));

    if (rc != SQLITE_DONE) {
        out.clear();
        return Translate(tx.Handle(), rc);
    }
    return Result::Ok();
}

} // namespace asqueue::db::sqlite
