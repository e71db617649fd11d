#pragma once

#include "storage/store.hpp"

#include <memory>

struct sqlite3;
struct sqlite3_stmt;

namespace sortkv {

struct StatementFinalizer {
    void operator()(sqlite3_stmt* stmt) const noexcept;
};

using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

// ── SqliteStore ──────────────────────────────────────────────────────────────
//
// One SQLite database file per store:
//
//   CREATE TABLE kv (key BLOB PRIMARY KEY NOT NULL, value BLOB NOT NULL)
//       WITHOUT ROWID
//
// Keys and values only ever travel through the BLOB API with explicit
// lengths, so embedded '\0' bytes round-trip and no text encoding applies.
// BLOB comparison is memcmp-based, which makes ORDER BY key byte-wise order.
//
// put_many() runs in one BEGIN IMMEDIATE … COMMIT transaction.  Journal mode
// is WAL; StoreOptions::sync_writes selects synchronous=FULL over NORMAL.
//
// A scan is one SELECT stepped lazily.  Rows written through the same handle
// while a scan is running may or may not be returned by it.
//
// sync() checkpoints the WAL into the database file.  While a scan is open
// the checkpoint cannot run, so sync() fsyncs the WAL instead and close()
// leaves the checkpoint to the last scan's release of the connection.

class SqliteStore final : public Store {
public:
    explicit SqliteStore(StoreOptions options = {});
    ~SqliteStore() override;

    [[nodiscard]] Backend backend() const noexcept override {
        return Backend::Sqlite;
    }

private:
    void do_open(const std::filesystem::path& location) override;
    void do_close() override;
    void do_sync() override;

    [[nodiscard]] std::optional<std::string> do_get(
        std::string_view key) const override;
    void do_put(std::string_view key, std::string_view value) override;
    void do_put_many(std::span<const Entry> entries) override;

    [[nodiscard]] CursorPtr do_new_cursor() const override;

    [[nodiscard]] StatementPtr prepare(const char* sql) const;
    void exec(const char* sql) const;
    void upsert(std::string_view key, std::string_view value);
    void sync_wal() const;

    [[noreturn]] void raise(std::string_view what, int rc) const;

    StoreOptions             options_;
    std::shared_ptr<sqlite3> db_;
    StatementPtr             select_;
    StatementPtr             upsert_;
};

} // namespace sortkv
