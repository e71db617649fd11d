#pragma once

#include "storage/types.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <system_error>
#include <vector>

namespace sortkv::persistence {

// ── Journal record types ─────────────────────────────────────────────────────

static constexpr uint8_t kRecordTypePut = 0x01;

// ── Journal header constants ─────────────────────────────────────────────────

static constexpr char kJournalMagic[] = "SKVJ";           // 4 bytes (no NUL)
static constexpr std::size_t kJournalMagicSize = 4;
static constexpr uint16_t kJournalVersion = 1;
static constexpr std::size_t kJournalHeaderSize =
    kJournalMagicSize + sizeof(uint16_t);

// ── Journal ──────────────────────────────────────────────────────────────────
//
// Append-only log of puts made since the last snapshot.  Record layout:
//
//   [type: u8 = 0x01][key_len: u32 LE][key][value_len: u32 LE][value]
//   [crc32: u32 LE]   // CRC of type through value
//
// A batch is appended with a single write(); fdatasync() is issued only when
// the caller asks for a durable append or calls sync().  A failed append is
// truncated away so the file always ends on a record boundary; if that
// truncation fails the journal is closed.  After the snapshot
// has absorbed the logged puts, reset() truncates the file back to its header.
//
// Thread-safety: NOT thread-safe.  Caller must serialise access.

class Journal {
public:
    explicit Journal(const std::filesystem::path& path);
    ~Journal();

    Journal(const Journal&) = delete;
    Journal& operator=(const Journal&) = delete;
    Journal(Journal&&) = delete;
    Journal& operator=(Journal&&) = delete;

    // Opens the journal file.  Creates it with a fresh header if it doesn't
    // exist.
    [[nodiscard]] std::error_code open();

    void close();

    // Appends one put record per entry.
    [[nodiscard]] std::error_code append(std::span<const Entry> entries,
                                         bool durable);

    // fdatasync() the file.
    [[nodiscard]] std::error_code sync();

    // Drop every record, keeping only the header.
    [[nodiscard]] std::error_code reset();

    // Replay all records in order.  A record cut short at the tail (torn
    // write) ends the replay; a CRC mismatch or bad header is corrupt_data.
    [[nodiscard]] static std::error_code replay(
        const std::filesystem::path& path,
        std::vector<Entry>& entries);

    [[nodiscard]] bool is_open() const { return fd_ != -1; }

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    [[nodiscard]] std::error_code write_header();
    [[nodiscard]] static std::error_code validate_header(int fd);

    std::filesystem::path path_;
    int fd_ = -1;
};

// Serialise one put record (including type byte and CRC).
void serialise_put(std::vector<uint8_t>& buf, const Entry& entry);

} // namespace sortkv::persistence
