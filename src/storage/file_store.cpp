#include "storage/file_store.hpp"

#include "common/error.hpp"
#include "common/logger.hpp"
#include "persistence/binary_io.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <system_error>
#include <vector>

namespace sortkv {

namespace {

// Raise a BackendIOError for a failed file operation, keeping corrupt_data
// distinguishable from plain I/O errors.
[[noreturn]] void raise_io(spdlog::logger& log, std::string_view what,
                           const std::filesystem::path& path,
                           std::error_code ec) {
    const auto message = fmt::format("file store: {} {}: {}", what,
                                     path.string(), ec.message());
    log.error("{}", message);
    throw BackendIOError(message, ec == StoreErrc::corrupt_data
                                      ? StoreErrc::corrupt_data
                                      : StoreErrc::backend_io);
}

// ── MapCursor ────────────────────────────────────────────────────────────────
//
// Shares ownership of the map so a scan outlives close().

class MapCursor final : public Cursor {
public:
    explicit MapCursor(std::shared_ptr<const persistence::SnapshotData> map)
        : map_(std::move(map)), it_(map_->end()) {}

    void seek_first() override { it_ = map_->begin(); }

    void seek(std::string_view key) override { it_ = map_->lower_bound(key); }

    bool valid() const override { return it_ != map_->end(); }

    void next() override { ++it_; }

    std::string_view key() const override { return it_->first; }
    std::string_view value() const override { return it_->second; }

private:
    std::shared_ptr<const persistence::SnapshotData> map_;
    persistence::SnapshotData::const_iterator       it_;
};

// Journal and snapshot records carry u32 lengths.
void check_lengths(spdlog::logger& log, std::string_view key,
                   std::string_view value) {
    if (key.size() <= persistence::kMaxBytesLength &&
        value.size() <= persistence::kMaxBytesLength) {
        return;
    }
    const auto message = fmt::format(
        "file store: entry too large (key {} bytes, value {} bytes, limit {})",
        key.size(), value.size(), persistence::kMaxBytesLength);
    log.error("{}", message);
    throw BackendIOError(message);
}

// Bytes the replayed records occupy in the journal, header included.
std::uintmax_t replayed_size(const std::vector<Entry>& entries) {
    std::uintmax_t size = persistence::kJournalHeaderSize;
    for (const auto& [key, value] : entries) {
        size += 1 + 4 + key.size() + 4 + value.size() + 4;
    }
    return size;
}

std::uintmax_t journal_size(const std::filesystem::path& path) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : size;
}

} // anonymous namespace

FileStore::FileStore(StoreOptions options)
    : Store(make_store_logger("file-store")), options_(options) {}

FileStore::~FileStore() {
    close_on_destroy();
}

std::filesystem::path FileStore::journal_path(
    const std::filesystem::path& location) {
    auto path = location;
    path += ".journal";
    return path;
}

void FileStore::do_open(const std::filesystem::path& location) {
    const auto jpath = journal_path(location);
    const bool has_snapshot = persistence::Snapshot::exists(location);
    const bool has_journal  = persistence::Snapshot::exists(jpath);

    if (!has_snapshot && !has_journal) {
        if (!options_.create_if_missing) {
            raise_io(log(), "open", location,
                     std::make_error_code(std::errc::no_such_file_or_directory));
        }
        prepare_location(location, true);
    }

    auto map = std::make_shared<persistence::SnapshotData>();
    if (has_snapshot) {
        if (auto ec = persistence::Snapshot::load(location, *map)) {
            raise_io(log(), "load snapshot", location, ec);
        }
    }

    bool replayed = false;
    bool torn     = false;
    if (has_journal) {
        std::vector<Entry> entries;
        if (auto ec = persistence::Journal::replay(jpath, entries)) {
            raise_io(log(), "replay journal", jpath, ec);
        }
        for (auto& [key, value] : entries) {
            map->insert_or_assign(std::move(key), std::move(value));
        }
        replayed = !entries.empty();
        torn     = replayed_size(entries) < journal_size(jpath);
        log().debug("file store: replayed {} journal records from {}",
                    entries.size(), jpath.string());
    }

    auto journal = std::make_unique<persistence::Journal>(jpath);
    if (auto ec = journal->open()) {
        raise_io(log(), "open journal", jpath, ec);
    }

    path_    = location;
    map_     = std::move(map);
    journal_ = std::move(journal);
    dirty_   = replayed || !has_snapshot;

    // New records must not land behind a torn tail.
    if (torn) {
        log().warn("file store: discarding torn journal tail in {}",
                   jpath.string());
        compact();
    }
}

void FileStore::do_close() {
    auto release = [this] {
        journal_.reset();
        map_.reset();
        dirty_ = false;
    };

    try {
        if (dirty_) {
            compact();
        }
    } catch (const BackendIOError&) {
        release();
        throw;
    }
    release();
}

void FileStore::do_sync() {
    if (dirty_) {
        compact();
    }
}

std::optional<std::string> FileStore::do_get(std::string_view key) const {
    auto it = map_->find(key);
    if (it == map_->end()) {
        return std::nullopt;
    }
    return it->second;
}

void FileStore::do_put(std::string_view key, std::string_view value) {
    check_lengths(log(), key, value);
    const Entry entry{std::string(key), std::string(value)};
    append_to_journal(std::span<const Entry>(&entry, 1));
    map_->insert_or_assign(entry.first, entry.second);
}

void FileStore::do_put_many(std::span<const Entry> entries) {
    for (const auto& [key, value] : entries) {
        check_lengths(log(), key, value);
    }
    append_to_journal(entries);
    for (const auto& [key, value] : entries) {
        map_->insert_or_assign(key, value);
    }
}

CursorPtr FileStore::do_new_cursor() const {
    return std::make_unique<MapCursor>(map_);
}

void FileStore::append_to_journal(std::span<const Entry> entries) {
    if (auto ec = journal_->append(entries, options_.sync_writes)) {
        raise_io(log(), "append journal", journal_->path(), ec);
    }
    dirty_ = true;
}

void FileStore::compact() {
    if (auto ec = persistence::Snapshot::save(path_, *map_)) {
        raise_io(log(), "save snapshot", path_, ec);
    }
    if (auto ec = journal_->reset()) {
        raise_io(log(), "reset journal", journal_->path(), ec);
    }
    dirty_ = false;
    log().debug("file store: compacted {} entries into {}", map_->size(),
                path_.string());
}

} // namespace sortkv
