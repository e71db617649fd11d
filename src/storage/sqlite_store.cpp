#include "storage/sqlite_store.hpp"

#include "common/error.hpp"
#include "common/logger.hpp"

#include <sqlite3.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <string>

namespace sortkv {

namespace {

constexpr const char* kCreateTableSql =
    "CREATE TABLE IF NOT EXISTS kv ("
    "    key   BLOB PRIMARY KEY NOT NULL,"
    "    value BLOB NOT NULL"
    ") WITHOUT ROWID;";

constexpr const char* kSelectSql  = "SELECT value FROM kv WHERE key = ?1;";
constexpr const char* kUpsertSql  =
    "INSERT OR REPLACE INTO kv (key, value) VALUES (?1, ?2);";
constexpr const char* kScanAllSql = "SELECT key, value FROM kv ORDER BY key;";
constexpr const char* kScanFromSql =
    "SELECT key, value FROM kv WHERE key >= ?1 ORDER BY key;";

// Bind `bytes` as a BLOB.  A null data pointer would bind SQL NULL, so an
// empty view is pointed at a static empty buffer to stay a zero-length BLOB.
int bind_bytes(sqlite3_stmt* stmt, int index, std::string_view bytes,
               sqlite3_destructor_type lifetime) {
    static constexpr char kEmpty[] = "";
    const char* data = bytes.data() != nullptr ? bytes.data() : kEmpty;
    return sqlite3_bind_blob64(stmt, index, data,
                               static_cast<sqlite3_uint64>(bytes.size()),
                               lifetime);
}

std::string_view column_bytes(sqlite3_stmt* stmt, int column) {
    // column_blob first, then column_bytes (order matters per SQLite docs).
    const void* data = sqlite3_column_blob(stmt, column);
    const int size   = sqlite3_column_bytes(stmt, column);
    if (data == nullptr || size <= 0) {
        return {};
    }
    return {static_cast<const char*>(data), static_cast<std::size_t>(size)};
}

// Resets a cached statement when leaving scope.
struct StatementReset {
    sqlite3_stmt* stmt;
    ~StatementReset() {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
};

std::string describe(sqlite3* db, int rc) {
    return fmt::format("{} (rc={})",
                       db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc),
                       rc);
}

// ── SqliteCursor ─────────────────────────────────────────────────────────────

class SqliteCursor final : public Cursor {
public:
    SqliteCursor(std::shared_ptr<sqlite3> db,
                 std::shared_ptr<spdlog::logger> logger)
        : db_(std::move(db)), logger_(std::move(logger)) {}

    void seek_first() override {
        prepare(kScanAllSql);
        step();
    }

    void seek(std::string_view key) override {
        prepare(kScanFromSql);
        check(bind_bytes(stmt_.get(), 1, key, SQLITE_TRANSIENT), "bind");
        step();
    }

    bool valid() const override { return has_row_; }

    void next() override { step(); }

    std::string_view key() const override {
        return column_bytes(stmt_.get(), 0);
    }

    std::string_view value() const override {
        return column_bytes(stmt_.get(), 1);
    }

private:
    void prepare(const char* sql) {
        sqlite3_stmt* raw = nullptr;
        int rc = sqlite3_prepare_v2(db_.get(), sql, -1, &raw, nullptr);
        stmt_.reset(raw);
        has_row_ = false;
        check(rc, "prepare scan");
    }

    void step() {
        has_row_ = false;
        int rc = sqlite3_step(stmt_.get());
        if (rc == SQLITE_ROW) {
            has_row_ = true;
        } else if (rc != SQLITE_DONE) {
            check(rc, "scan step");
        }
    }

    void check(int rc, std::string_view what) {
        if (rc == SQLITE_OK) {
            return;
        }
        const auto message = fmt::format("sqlite store: {} failed: {}", what,
                                         describe(db_.get(), rc));
        logger_->error("{}", message);
        throw BackendIOError(message);
    }

    // db_ is declared before stmt_ so the statement is finalized first.
    std::shared_ptr<sqlite3>        db_;
    std::shared_ptr<spdlog::logger> logger_;
    StatementPtr                    stmt_;
    bool                            has_row_ = false;
};

} // anonymous namespace

void StatementFinalizer::operator()(sqlite3_stmt* stmt) const noexcept {
    sqlite3_finalize(stmt);
}

SqliteStore::SqliteStore(StoreOptions options)
    : Store(make_store_logger("sqlite-store")), options_(options) {}

SqliteStore::~SqliteStore() {
    close_on_destroy();
}

void SqliteStore::do_open(const std::filesystem::path& location) {
    prepare_location(location, options_.create_if_missing);

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_NOMUTEX;
    if (options_.create_if_missing) {
        flags |= SQLITE_OPEN_CREATE;
    }

    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(location.c_str(), &raw, flags, nullptr);

    // sqlite3_close_v2 defers the close while cursors still hold statements.
    std::shared_ptr<sqlite3> db(raw, [](sqlite3* handle) {
        sqlite3_close_v2(handle);
    });

    if (rc != SQLITE_OK) {
        const auto message = fmt::format("sqlite store: cannot open {}: {}",
                                         location.string(),
                                         describe(raw, rc));
        log().error("{}", message);
        throw BackendIOError(message);
    }

    sqlite3_extended_result_codes(raw, 1);
    db_ = std::move(db);

    try {
        exec("PRAGMA journal_mode=WAL;");
        exec(options_.sync_writes ? "PRAGMA synchronous=FULL;"
                                  : "PRAGMA synchronous=NORMAL;");
        exec(kCreateTableSql);
        select_ = prepare(kSelectSql);
        upsert_ = prepare(kUpsertSql);
    } catch (const BackendIOError&) {
        select_.reset();
        upsert_.reset();
        db_.reset();
        throw;
    }
}

void SqliteStore::do_close() {
    auto release = [this] {
        select_.reset();
        upsert_.reset();
        db_.reset();
    };

    try {
        do_sync();
    } catch (const BackendIOError&) {
        release();
        throw;
    }
    release();
}

void SqliteStore::do_sync() {
    // Move the WAL into the main database file and fsync it.
    int rc = sqlite3_wal_checkpoint_v2(db_.get(), nullptr,
                                       SQLITE_CHECKPOINT_FULL, nullptr,
                                       nullptr);
    if (rc == SQLITE_OK) {
        return;
    }

    // An open scan on this connection holds a read transaction, which makes
    // any checkpoint fail.  Committed frames are made durable in the WAL
    // instead; the checkpoint happens when the connection finally closes.
    const int primary = rc & 0xff;
    if (primary != SQLITE_LOCKED && primary != SQLITE_BUSY) {
        raise("checkpoint", rc);
    }
    log().debug("sqlite store: checkpoint deferred ({}), syncing WAL",
                sqlite3_errstr(rc));
    sync_wal();
}

void SqliteStore::sync_wal() const {
    sqlite3_file* wal = nullptr;
    int rc = sqlite3_file_control(db_.get(), "main",
                                  SQLITE_FCNTL_JOURNAL_POINTER, &wal);
    if (rc != SQLITE_OK) {
        raise("locate WAL", rc);
    }
    if (wal == nullptr || wal->pMethods == nullptr) {
        return;  // No WAL open, nothing to sync.
    }
    rc = wal->pMethods->xSync(wal, SQLITE_SYNC_NORMAL);
    if (rc != SQLITE_OK) {
        raise("sync WAL", rc);
    }
}

std::optional<std::string> SqliteStore::do_get(std::string_view key) const {
    sqlite3_stmt* stmt = select_.get();
    StatementReset reset{stmt};

    int rc = bind_bytes(stmt, 1, key, SQLITE_STATIC);
    if (rc != SQLITE_OK) {
        raise("bind key", rc);
    }

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        raise("get", rc);
    }
    return std::string(column_bytes(stmt, 0));
}

void SqliteStore::do_put(std::string_view key, std::string_view value) {
    upsert(key, value);
}

void SqliteStore::do_put_many(std::span<const Entry> entries) {
    exec("BEGIN IMMEDIATE;");
    try {
        for (const auto& [key, value] : entries) {
            upsert(key, value);
        }
        exec("COMMIT;");
    } catch (const BackendIOError&) {
        char* err = nullptr;
        if (sqlite3_exec(db_.get(), "ROLLBACK;", nullptr, nullptr, &err) !=
            SQLITE_OK) {
            log().warn("sqlite store: rollback failed: {}",
                       err != nullptr ? err : "unknown error");
        }
        sqlite3_free(err);
        throw;
    }
}

CursorPtr SqliteStore::do_new_cursor() const {
    return std::make_unique<SqliteCursor>(db_, logger());
}

void SqliteStore::upsert(std::string_view key, std::string_view value) {
    sqlite3_stmt* stmt = upsert_.get();
    StatementReset reset{stmt};

    int rc = bind_bytes(stmt, 1, key, SQLITE_STATIC);
    if (rc == SQLITE_OK) {
        rc = bind_bytes(stmt, 2, value, SQLITE_STATIC);
    }
    if (rc != SQLITE_OK) {
        raise("bind entry", rc);
    }

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        raise("put", rc);
    }
}

StatementPtr SqliteStore::prepare(const char* sql) const {
    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_.get(), sql, -1, &raw, nullptr);
    StatementPtr stmt(raw);
    if (rc != SQLITE_OK) {
        raise(fmt::format("prepare '{}'", sql), rc);
    }
    return stmt;
}

void SqliteStore::exec(const char* sql) const {
    char* err = nullptr;
    int rc = sqlite3_exec(db_.get(), sql, nullptr, nullptr, &err);
    if (rc == SQLITE_OK) {
        return;
    }
    const std::string detail = err != nullptr ? err : sqlite3_errstr(rc);
    sqlite3_free(err);

    const auto message = fmt::format("sqlite store: '{}' failed: {} (rc={})",
                                     sql, detail, rc);
    log().error("{}", message);
    throw BackendIOError(message);
}

void SqliteStore::raise(std::string_view what, int rc) const {
    const auto message = fmt::format("sqlite store: {} failed: {}", what,
                                     describe(db_.get(), rc));
    log().error("{}", message);
    throw BackendIOError(message);
}

} // namespace sortkv
