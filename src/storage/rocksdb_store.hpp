#pragma once

#include "storage/store.hpp"

#include <memory>

namespace rocksdb {
class DB;
} // namespace rocksdb

namespace sortkv {

// ── RocksDBStore ─────────────────────────────────────────────────────────────
//
// Persistent sorted store backed by RocksDB.  The open() location is the
// database directory.
//
// RocksDB's default BytewiseComparator already orders keys byte-wise, and
// keys/values cross the boundary as rocksdb::Slice{data, size}, so '\0'
// bytes need no special handling.  Range scans seek a native iterator.
//
// put_many() is one WriteBatch.  StoreOptions::sync_writes sets
// WriteOptions::sync; otherwise durability comes from sync()/close(), which
// flush and fsync the WAL.
//
// Each scan iterates over the implicit snapshot RocksDB takes when the
// iterator is created: writes made after begin() are not observed.  Live
// scans keep the database alive after close() until they are destroyed.

class RocksDBStore final : public Store {
public:
    explicit RocksDBStore(StoreOptions options = {});
    ~RocksDBStore() override;

    [[nodiscard]] Backend backend() const noexcept override {
        return Backend::RocksDB;
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

    StoreOptions                 options_;
    std::shared_ptr<rocksdb::DB> db_;
};

} // namespace sortkv
