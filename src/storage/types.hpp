#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace sortkv {

// Keys and values are byte strings: any length, any byte value (including
// '\0').  std::string is used purely as an owning byte container.
using Entry = std::pair<std::string, std::string>;

// ── Backend ──────────────────────────────────────────────────────────────────

enum class Backend {
    File,     // std::map persisted as a single snapshot file
    Sqlite,   // SQLite table with BLOB columns
    RocksDB,  // RocksDB with the default bytewise comparator
};

// "file", "sqlite", "rocksdb".
[[nodiscard]] std::string_view to_string(Backend backend) noexcept;

// Inverse of to_string().  Throws std::invalid_argument on unknown names.
[[nodiscard]] Backend parse_backend(std::string_view name);

// ── StoreOptions ─────────────────────────────────────────────────────────────

struct StoreOptions {
    // Create the backing storage on open() if it does not exist yet.
    bool create_if_missing = true;

    // Make every put()/put_many() durable before returning instead of
    // deferring durability to sync()/close().
    bool sync_writes = false;
};

} // namespace sortkv
