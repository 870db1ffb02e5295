#pragma once

#include <mutex>
#include <type_traits>

#include "mintgate/core/errors.hpp"
#include "mintgate/core/events.hpp"
#include "mintgate/core/types.hpp"

struct sqlite3;
struct sqlite3_stmt;

namespace mintgate::db {
    using u32 = mintgate::core::u32;
    using u64 = mintgate::core::u64;

    struct JournalConfig {
        const char* path{nullptr};   // SQLite file; nullptr opens ":memory:"
    };

    struct JournalEntry {
        u64 seq{0};
        mintgate::core::i64 recorded_at{0};   // wall clock of the writer, unix seconds
        mintgate::core::Event event{};
    };

    // PRAGMA statement for a SQLite journal mode name (case-insensitive),
    // or nullptr when the name is not one of SQLite's journal modes.
    // open() reads the mode from MINTGATE_DB_JOURNAL_MODE and falls back to WAL.
    [[nodiscard]] const char* journal_mode_sql(const char* mode) noexcept;

    // Append-only event store for indexers. A failed insert is logged to
    // stderr and counted; it never fails the operation that emitted the event.
    class EventJournal final : public mintgate::core::EventSink {
    public:
        EventJournal() noexcept = default;
        ~EventJournal() noexcept override;

        EventJournal(const EventJournal&) = delete;
        EventJournal& operator=(const EventJournal&) = delete;

        [[nodiscard]] mintgate::core::Status open(const JournalConfig& cfg) noexcept;
        void close() noexcept;
        [[nodiscard]] bool is_open() const noexcept;

        // Every event is forwarded here after it is journaled; may be null.
        void set_next(mintgate::core::EventSink* next) noexcept;

        void emit(const mintgate::core::Event& e) noexcept override;

        [[nodiscard]] mintgate::core::Status count(u64* out) const noexcept;

        // Reads up to *count entries with seq > after_seq, oldest first.
        // count: input = capacity of `out`, output = entries written.
        [[nodiscard]] mintgate::core::Status read(u64 after_seq,
            JournalEntry* out,
            u32* count) const noexcept;

        [[nodiscard]] u64 dropped() const noexcept;

    private:
        mutable std::mutex mutex_;
        sqlite3* db_{nullptr};
        sqlite3_stmt* insert_{nullptr};
        mintgate::core::EventSink* next_{nullptr};
        u64 dropped_{0};
    };

    static_assert(std::is_trivially_copyable_v<JournalConfig>);
    static_assert(std::is_trivially_copyable_v<JournalEntry>);

} // namespace mintgate::db
