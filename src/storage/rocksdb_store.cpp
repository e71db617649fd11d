#include "storage/rocksdb_store.hpp"

#include "common/error.hpp"
#include "common/logger.hpp"

#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>


namespace sortkv {

namespace {

rocksdb::Slice make_slice(std::string_view bytes) {
    return {bytes.data(), bytes.size()};
}

std::string_view make_view(const rocksdb::Slice& slice) {
    return {slice.data(), slice.size()};
}

[[noreturn]] void raise(spdlog::logger& log, std::string_view what,
                        const rocksdb::Status& status) {
    const auto message = fmt::format("rocksdb store: {} failed: {}", what,
                                     status.ToString());
    log.error("{}", message);
    throw BackendIOError(message, status.IsCorruption()
                                      ? StoreErrc::corrupt_data
                                      : StoreErrc::backend_io);
}

// ── RocksDBCursor ────────────────────────────────────────────────────────────

class RocksDBCursor final : public Cursor {
public:
    RocksDBCursor(std::shared_ptr<rocksdb::DB> db,
                  std::shared_ptr<spdlog::logger> logger)
        : db_(std::move(db)),
          logger_(std::move(logger)),
          it_(db_->NewIterator(rocksdb::ReadOptions{})) {}

    void seek_first() override {
        it_->SeekToFirst();
        check();
    }

    void seek(std::string_view key) override {
        it_->Seek(make_slice(key));
        check();
    }

    bool valid() const override { return it_->Valid(); }

    void next() override {
        it_->Next();
        check();
    }

    std::string_view key() const override { return make_view(it_->key()); }
    std::string_view value() const override { return make_view(it_->value()); }

private:
    // An iterator that stops being Valid() may have stopped on an error.
    void check() {
        if (!it_->Valid()) {
            auto status = it_->status();
            if (!status.ok()) {
                raise(*logger_, "iterate", status);
            }
        }
    }

    // The iterator must be destroyed before the database it reads.
    std::shared_ptr<rocksdb::DB>       db_;
    std::shared_ptr<spdlog::logger>    logger_;
    std::unique_ptr<rocksdb::Iterator> it_;
};

} // anonymous namespace

RocksDBStore::RocksDBStore(StoreOptions options)
    : Store(make_store_logger("rocksdb-store")), options_(options) {}

RocksDBStore::~RocksDBStore() {
    close_on_destroy();
}

void RocksDBStore::do_open(const std::filesystem::path& location) {
    prepare_location(location, options_.create_if_missing);

    rocksdb::Options options;
    options.create_if_missing = options_.create_if_missing;

    // Optimise for small-to-medium working sets typical of a KV store.
    options.IncreaseParallelism();
    options.OptimizeLevelStyleCompaction();

    rocksdb::DB* raw_db = nullptr;
    auto status = rocksdb::DB::Open(options, location.string(), &raw_db);
    if (!status.ok()) {
        raise(log(), fmt::format("open {}", location.string()), status);
    }
    db_.reset(raw_db);
}

void RocksDBStore::do_close() {
    // Release our reference even when the final flush fails.
    auto db = std::move(db_);

    auto status = db->FlushWAL(/*sync=*/true);
    if (!status.ok()) {
        raise(log(), "flush WAL on close", status);
    }

    // Close explicitly only when no scan still holds the database; otherwise
    // the last cursor's reference closes it on destruction.
    if (db.use_count() == 1) {
        status = db->Close();
        if (!status.ok()) {
            raise(log(), "close", status);
        }
    }
}

void RocksDBStore::do_sync() {
    auto status = db_->FlushWAL(/*sync=*/true);
    if (!status.ok()) {
        raise(log(), "sync", status);
    }
}

std::optional<std::string> RocksDBStore::do_get(std::string_view key) const {
    std::string value;
    auto status = db_->Get(rocksdb::ReadOptions{}, make_slice(key), &value);
    if (status.IsNotFound()) {
        return std::nullopt;
    }
    if (!status.ok()) {
        raise(log(), "get", status);
    }
    return value;
}

void RocksDBStore::do_put(std::string_view key, std::string_view value) {
    rocksdb::WriteOptions write_options;
    write_options.sync = options_.sync_writes;

    auto status = db_->Put(write_options, make_slice(key), make_slice(value));
    if (!status.ok()) {
        raise(log(), "put", status);
    }
}

void RocksDBStore::do_put_many(std::span<const Entry> entries) {
    rocksdb::WriteBatch batch;
    for (const auto& [key, value] : entries) {
        auto status = batch.Put(make_slice(key), make_slice(value));
        if (!status.ok()) {
            raise(log(), "batch put", status);
        }
    }

    rocksdb::WriteOptions write_options;
    write_options.sync = options_.sync_writes;

    auto status = db_->Write(write_options, &batch);
    if (!status.ok()) {
        raise(log(), "write batch", status);
    }
}

CursorPtr RocksDBStore::do_new_cursor() const {
    return std::make_unique<RocksDBCursor>(db_, logger());
}

} // namespace sortkv
