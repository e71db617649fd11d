#include "storage/store_factory.hpp"

#include "storage/file_store.hpp"
#include "storage/rocksdb_store.hpp"
#include "storage/sqlite_store.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace sortkv {

StorePtr make_store(Backend backend, StoreOptions options) {
    switch (backend) {
        case Backend::File:    return std::make_unique<FileStore>(options);
        case Backend::Sqlite:  return std::make_unique<SqliteStore>(options);
        case Backend::RocksDB: return std::make_unique<RocksDBStore>(options);
    }
    throw std::invalid_argument(fmt::format(
        "Unsupported backend {}", static_cast<int>(backend)));
}

StorePtr open_store(Backend backend, const std::filesystem::path& location,
                    StoreOptions options) {
    auto store = make_store(backend, options);
    store->open(location);
    return store;
}

} // namespace sortkv
