#include "mintgate/db/journal.hpp"

#include <sqlite3.h>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

namespace mintgate::db {

using namespace mintgate::core;

namespace {
    constexpr const char* kSchemaSQL = R"SQL(
        CREATE TABLE IF NOT EXISTS events (
            seq INTEGER PRIMARY KEY AUTOINCREMENT,
            kind INTEGER NOT NULL,
            actor BLOB NOT NULL,
            target BLOB NOT NULL,
            recipient BLOB NOT NULL,
            authorizer BLOB NOT NULL,
            token_id BLOB NOT NULL,
            nonce BLOB NOT NULL,
            old_value INTEGER NOT NULL,
            new_value INTEGER NOT NULL,
            recorded_at INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_events_kind ON events(kind);
        CREATE INDEX IF NOT EXISTS idx_events_authorizer ON events(authorizer, nonce);
    )SQL";

    constexpr const char* kInsertSQL =
        "INSERT INTO events (kind, actor, target, recipient, authorizer, token_id, nonce, "
        "old_value, new_value, recorded_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

    constexpr const char* kSelectSQL =
        "SELECT seq, kind, actor, target, recipient, authorizer, token_id, nonce, "
        "old_value, new_value, recorded_at FROM events WHERE seq > ? ORDER BY seq LIMIT ?";

    struct JournalMode {
        const char* name;
        const char* sql;
    };

    constexpr JournalMode kJournalModes[] = {
        {"DELETE", "PRAGMA journal_mode=DELETE"},
        {"TRUNCATE", "PRAGMA journal_mode=TRUNCATE"},
        {"PERSIST", "PRAGMA journal_mode=PERSIST"},
        {"MEMORY", "PRAGMA journal_mode=MEMORY"},
        {"WAL", "PRAGMA journal_mode=WAL"},
        {"OFF", "PRAGMA journal_mode=OFF"},
    };

    template <size_t N>
    [[nodiscard]] bool column_bytes(sqlite3_stmt* stmt, int col, std::array<u8, N>* out) noexcept {
        const void* blob = sqlite3_column_blob(stmt, col);
        const int len = sqlite3_column_bytes(stmt, col);
        if (blob == nullptr || len != static_cast<int>(N)) {
            return false;
        }
        std::memcpy(out->data(), blob, N);
        return true;
    }
} // namespace

const char* journal_mode_sql(const char* mode) noexcept {
    if (mode == nullptr) {
        return nullptr;
    }
    for (const JournalMode& m : kJournalModes) {
        if (sqlite3_stricmp(mode, m.name) == 0) {
            return m.sql;
        }
    }
    return nullptr;
}

EventJournal::~EventJournal() noexcept {
    close();
}

Status EventJournal::open(const JournalConfig& cfg) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    if (db_ != nullptr) {
        return make_status(StatusDomain::Db, StatusCode::Conflict);
    }

    const char* path = cfg.path ? cfg.path : ":memory:";
    int rc = sqlite3_open(path, &db_);
    if (rc != SQLITE_OK) {
        std::fprintf(stderr, "journal: cannot open %s: %s\n", path, db_ ? sqlite3_errmsg(db_) : "out of memory");
        sqlite3_close(db_);
        db_ = nullptr;
        return make_status(StatusDomain::Db, StatusCode::Io);
    }

    // Journal mode is configurable; in-memory databases reject WAL, which is fine.
    char* err_msg = nullptr;
    const char* journal_mode = std::getenv("MINTGATE_DB_JOURNAL_MODE");
    if (!journal_mode || journal_mode[0] == '\0') {
        journal_mode = "WAL";
    }
    const char* journal_sql = journal_mode_sql(journal_mode);
    if (journal_sql == nullptr) {
        std::fprintf(stderr, "journal: unknown journal mode %s, using WAL\n", journal_mode);
        journal_sql = journal_mode_sql("WAL");
    }
    rc = sqlite3_exec(db_, journal_sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        sqlite3_free(err_msg);
        err_msg = nullptr;
    }

    rc = sqlite3_exec(db_, kSchemaSQL, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::fprintf(stderr, "journal: schema failed: %s\n", err_msg ? err_msg : "unknown error");
        sqlite3_free(err_msg);
        sqlite3_close(db_);
        db_ = nullptr;
        return make_status(StatusDomain::Db, StatusCode::Unknown);
    }

    rc = sqlite3_prepare_v2(db_, kInsertSQL, -1, &insert_, nullptr);
    if (rc != SQLITE_OK) {
        std::fprintf(stderr, "journal: prepare failed: %s\n", sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        insert_ = nullptr;
        return make_status(StatusDomain::Db, StatusCode::Unknown);
    }

    return ok_status();
}

void EventJournal::close() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (insert_ != nullptr) {
        sqlite3_finalize(insert_);
        insert_ = nullptr;
    }
    if (db_ != nullptr) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool EventJournal::is_open() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

void EventJournal::set_next(EventSink* next) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    next_ = next;
}

void EventJournal::emit(const Event& e) noexcept {
    EventSink* next = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        next = next_;

        if (db_ == nullptr || insert_ == nullptr) {
            ++dropped_;
        } else {
            sqlite3_reset(insert_);
            sqlite3_clear_bindings(insert_);
            sqlite3_bind_int(insert_, 1, static_cast<int>(e.kind));
            sqlite3_bind_blob(insert_, 2, e.actor.b.data(), static_cast<int>(e.actor.b.size()), SQLITE_TRANSIENT);
            sqlite3_bind_blob(insert_, 3, e.target.b.data(), static_cast<int>(e.target.b.size()), SQLITE_TRANSIENT);
            sqlite3_bind_blob(insert_, 4, e.recipient.b.data(), static_cast<int>(e.recipient.b.size()), SQLITE_TRANSIENT);
            sqlite3_bind_blob(insert_, 5, e.authorizer.b.data(), static_cast<int>(e.authorizer.b.size()), SQLITE_TRANSIENT);
            sqlite3_bind_blob(insert_, 6, e.token_id.b.data(), static_cast<int>(e.token_id.b.size()), SQLITE_TRANSIENT);
            sqlite3_bind_blob(insert_, 7, e.nonce.b.data(), static_cast<int>(e.nonce.b.size()), SQLITE_TRANSIENT);
            sqlite3_bind_int64(insert_, 8, static_cast<sqlite3_int64>(e.old_value));
            sqlite3_bind_int64(insert_, 9, static_cast<sqlite3_int64>(e.new_value));
            sqlite3_bind_int64(insert_, 10, static_cast<sqlite3_int64>(std::time(nullptr)));

            const int rc = sqlite3_step(insert_);
            if (rc != SQLITE_DONE) {
                std::fprintf(stderr, "journal: insert %s failed: %s\n", event_kind_name(e.kind), sqlite3_errmsg(db_));
                ++dropped_;
            }
            sqlite3_reset(insert_);
        }
    }

    if (next != nullptr) {
        next->emit(e);
    }
}

Status EventJournal::count(u64* out) const noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM events", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return make_status(StatusDomain::Db, StatusCode::Unknown);
    }

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return make_status(StatusDomain::Db, StatusCode::Unknown);
    }
    *out = static_cast<u64>(sqlite3_column_int64(stmt, 0));
    sqlite3_finalize(stmt);
    return ok_status();
}

Status EventJournal::read(u64 after_seq, JournalEntry* out, u32* count) const noexcept {
    if (!count || (*count > 0 && !out)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const u32 cap = *count;
    *count = 0;
    if (cap == 0) {
        return ok_status();
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, kSelectSQL, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return make_status(StatusDomain::Db, StatusCode::Unknown);
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(after_seq));
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(cap));

    u32 n = 0;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW && n < cap) {
        JournalEntry& entry = out[n];
        entry = JournalEntry{};
        entry.seq = static_cast<u64>(sqlite3_column_int64(stmt, 0));
        entry.event.kind = static_cast<EventKind>(sqlite3_column_int(stmt, 1));
        const bool blobs_ok =
            column_bytes(stmt, 2, &entry.event.actor.b) &&
            column_bytes(stmt, 3, &entry.event.target.b) &&
            column_bytes(stmt, 4, &entry.event.recipient.b) &&
            column_bytes(stmt, 5, &entry.event.authorizer.b) &&
            column_bytes(stmt, 6, &entry.event.token_id.b) &&
            column_bytes(stmt, 7, &entry.event.nonce.b);
        if (!blobs_ok) {
            sqlite3_finalize(stmt);
            return make_status(StatusDomain::Db, StatusCode::Unknown, static_cast<u32>(entry.seq));
        }
        entry.event.old_value = static_cast<u64>(sqlite3_column_int64(stmt, 8));
        entry.event.new_value = static_cast<u64>(sqlite3_column_int64(stmt, 9));
        entry.recorded_at = static_cast<i64>(sqlite3_column_int64(stmt, 10));
        ++n;
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return make_status(StatusDomain::Db, StatusCode::Unknown);
    }
    *count = n;
    return ok_status();
}

u64 EventJournal::dropped() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

} // namespace mintgate::db
