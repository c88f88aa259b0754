#include "sqlite_repository.hpp"

#include <set>
#include <stdexcept>

#include <sqlite3.h>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace epg::db::sqlite {

using epg::db::ErrorCode;
using epg::db::Result;

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const noexcept { sqlite3_finalize(st); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    return nullptr;
  }
  return Statement(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s) {
        BindText(st, idx, *s);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColText(st, col);
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

model::ChannelRecord ReadChannel(sqlite3_stmt* st) {
    model::ChannelRecord r;
    r.channel_id = ColText(st, 0);
    r.display_name = ColOptText(st, 1);
    r.icon_url = ColOptText(st, 2);
    return r;
}

model::ProgramRecord ReadProgram(sqlite3_stmt* st) {
    model::ProgramRecord r;
    r.id = static_cast<uint64_t>(ColI64(st, 0));
    r.channel_id = ColText(st, 1);
    r.title = ColText(st, 2);
    r.description = ColOptText(st, 3);
    r.start_time_ms = ColI64(st, 4);
    r.end_time_ms = ColI64(st, 5);
    r.category = ColOptText(st, 6);
    return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
    db::sql::RunMigrations(db, db::sql::ScheduleSchema());

    // fail fast on a database created by an incompatible version
    db.Exec("SELECT channel_id,display_name,icon_url FROM epg_channels LIMIT 1;");
    db.Exec("SELECT id,channel_id,title,description,start_time,end_time,category FROM epg_programs LIMIT 1;");
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Channels
// ------------------------------------------------------------------

Result SqliteRepository::UpsertChannels(Transaction& t, const std::vector<model::ChannelRecord>& channels) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, db::sql::UPSERT_CHANNEL);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (const auto& c : channels) {
        if (c.channel_id.empty()) return Result::Err(ErrorCode::InvalidArgument, "channel_id is empty");

        sqlite3_reset(st.get());
        sqlite3_clear_bindings(st.get());
        BindText(st.get(), 1, c.channel_id);
        BindOptText(st.get(), 2, c.display_name);
        BindOptText(st.get(), 3, c.icon_url);

        int rc = sqlite3_step(st.get());
        if (rc != SQLITE_DONE) return Translate(db, rc);
    }
    return Result::Ok();
}

std::optional<model::ChannelRecord>
SqliteRepository::GetChannel(Transaction& t, const std::string& channel_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, db::sql::SELECT_CHANNEL);
    if (!st) return std::nullopt;

    BindText(st.get(), 1, channel_id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadChannel(st.get());
}

std::vector<model::ChannelRecord> SqliteRepository::ListChannels(Transaction& t) {
    auto* db = TX(t).Handle();

    std::vector<model::ChannelRecord> out;
    auto st = Prepare(db, db::sql::SELECT_CHANNELS);
    if (!st) return out;

    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadChannel(st.get()));
    }
    return out;
}

Result SqliteRepository::DeleteAllChannels(Transaction& t) {
    auto* db = TX(t).Handle();

    // programs carry no FK constraint; cascade by hand
    const char* cascade =
        "DELETE FROM epg_programs WHERE channel_id IN (SELECT channel_id FROM epg_channels);";
    int rc = sqlite3_exec(db, cascade, nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) return Translate(db, rc);

    rc = sqlite3_exec(db, db::sql::DELETE_ALL_CHANNELS, nullptr, nullptr, nullptr);
    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Programs
// ------------------------------------------------------------------

Result SqliteRepository::UpsertPrograms(Transaction& t, const std::vector<model::ProgramRecord>& programs) {
    auto* db = TX(t).Handle();

    // whole batch is refused before any row is written
    for (const auto& p : programs) {
        if (p.channel_id.empty()) return Result::Err(ErrorCode::InvalidArgument, "channel_id is empty");
        if (p.end_time_ms <= p.start_time_ms) {
            return Result::Err(ErrorCode::InvalidArgument, "end_time must be after start_time");
        }
    }

    auto st = Prepare(db, db::sql::UPSERT_PROGRAM);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (const auto& p : programs) {
        sqlite3_reset(st.get());
        sqlite3_clear_bindings(st.get());
        BindText(st.get(), 1, p.channel_id);
        BindText(st.get(), 2, p.title);
        BindOptText(st.get(), 3, p.description);
        BindI64(st.get(), 4, p.start_time_ms);
        BindI64(st.get(), 5, p.end_time_ms);
        BindOptText(st.get(), 6, p.category);

        int rc = sqlite3_step(st.get());
        if (rc != SQLITE_DONE) return Translate(db, rc);
    }
    return Result::Ok();
}

std::vector<model::ProgramRecord>
SqliteRepository::QueryPrograms(Transaction& t, const std::vector<std::string>& channel_ids,
                                int64_t window_start_ms, int64_t window_end_ms) {
    auto* db = TX(t).Handle();

    std::vector<model::ProgramRecord> out;
    const std::set<std::string> unique_ids(channel_ids.begin(), channel_ids.end());
    if (unique_ids.empty()) return out;

    std::string sql = db::sql::SELECT_PROGRAMS_IN_WINDOW_PREFIX;
    sql += '(';
    for (size_t i = 0; i < unique_ids.size(); ++i) {
        sql += (i == 0) ? "?" : ",?";
    }
    sql += ')';
    sql += db::sql::SELECT_PROGRAMS_ORDER;

    auto st = Prepare(db, sql);
    if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    BindI64(st.get(), 1, window_start_ms);
    BindI64(st.get(), 2, window_end_ms);
    int idx = 3;
    for (const auto& id : unique_ids) {
        BindText(st.get(), idx++, id);
    }

    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ReadProgram(st.get()));
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("sqlite query: ") + sqlite3_errmsg(db));
    }
    return out;
}

Result SqliteRepository::DeleteProgramsOlderThan(Transaction& t, int64_t cutoff_ms, uint64_t* deleted) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, db::sql::DELETE_PROGRAMS_ENDING_BEFORE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, cutoff_ms);
    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE && deleted) {
        *deleted = static_cast<uint64_t>(sqlite3_changes(db));
    }
    return Translate(db, rc);
}

Result SqliteRepository::DeleteAllPrograms(Transaction& t) {
    auto* db = TX(t).Handle();
    int rc = sqlite3_exec(db, db::sql::DELETE_ALL_PROGRAMS, nullptr, nullptr, nullptr);
    return Translate(db, rc);
}

uint64_t SqliteRepository::CountChannels(Transaction& t) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, db::sql::COUNT_CHANNELS);
    if (!st || sqlite3_step(st.get()) != SQLITE_ROW) {
        throw std::runtime_error(std::string("sqlite count: ") + sqlite3_errmsg(db));
    }
    return static_cast<uint64_t>(ColI64(st.get(), 0));
}

uint64_t SqliteRepository::CountPrograms(Transaction& t) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, db::sql::COUNT_PROGRAMS);
    if (!st || sqlite3_step(st.get()) != SQLITE_ROW) {
        throw std::runtime_error(std::string("sqlite count: ") + sqlite3_errmsg(db));
    }
    return static_cast<uint64_t>(ColI64(st.get(), 0));
}

} // namespace epg::db::sqlite
