#pragma once

#include "persistence/journal.hpp"
#include "persistence/snapshot.hpp"
#include "storage/store.hpp"

#include <filesystem>
#include <memory>

namespace sortkv {

// ── FileStore ────────────────────────────────────────────────────────────────
//
// Sorted in-memory map persisted as a snapshot file at the open() location,
// plus a journal of puts at "<location>.journal" made since the last
// snapshot.  open() loads the snapshot and replays the journal; sync() and
// close() fold the journal into a fresh snapshot.
//
// With StoreOptions::sync_writes every put/put_many is fdatasync'ed to the
// journal before returning.
//
// Scans walk the live map: keys inserted ahead of a running scan are
// observed by it, keys behind it are not.

class FileStore final : public Store {
public:
    explicit FileStore(StoreOptions options = {});
    ~FileStore() override;

    [[nodiscard]] Backend backend() const noexcept override {
        return Backend::File;
    }

    [[nodiscard]] static std::filesystem::path journal_path(
        const std::filesystem::path& location);

private:
    void do_open(const std::filesystem::path& location) override;
    void do_close() override;
    void do_sync() override;

    [[nodiscard]] std::optional<std::string> do_get(
        std::string_view key) const override;
    void do_put(std::string_view key, std::string_view value) override;
    void do_put_many(std::span<const Entry> entries) override;

    [[nodiscard]] CursorPtr do_new_cursor() const override;

    // Write the snapshot and truncate the journal.
    void compact();

    void append_to_journal(std::span<const Entry> entries);

    StoreOptions                                 options_;
    std::filesystem::path                        path_;
    std::shared_ptr<persistence::SnapshotData>   map_;
    std::unique_ptr<persistence::Journal>        journal_;
    bool                                         dirty_ = false;
};

} // namespace sortkv
