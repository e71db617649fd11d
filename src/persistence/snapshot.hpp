#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <system_error>

namespace sortkv::persistence {

// ── Snapshot header constants ────────────────────────────────────────────────

static constexpr char kSnapshotMagic[] = "SKVS";          // 4 bytes (no NUL)
static constexpr std::size_t kSnapshotMagicSize = 4;
static constexpr uint16_t kSnapshotVersion = 1;
static constexpr std::size_t kSnapshotHeaderSize =
    kSnapshotMagicSize + sizeof(uint16_t);                // 6 bytes

// Byte-wise ordered (char_traits<char> compares as unsigned char).
using SnapshotData = std::map<std::string, std::string, std::less<>>;

// ── Snapshot ─────────────────────────────────────────────────────────────────
//
// Full contents of a FileStore.  Binary format:
//
//   [magic: "SKVS" (4B)][version: u16 LE = 1]
//   [entry_count: u64 LE]
//     [key_length: u32 LE][key][value_length: u32 LE][value]  × entry_count
//   [crc32: u32 LE]     // CRC of everything from magic through last value
//
// Entries are written in ascending byte-wise key order.
// Atomic write: write to <path>.tmp, fsync, then rename.
//
// Format violations (magic, version, truncation, CRC) are reported as
// StoreErrc::corrupt_data; OS failures keep their errno.

class Snapshot {
public:
    [[nodiscard]] static std::error_code save(
        const std::filesystem::path& path,
        const SnapshotData& data);

    // Replaces the contents of `data` with the snapshot at `path`.
    [[nodiscard]] static std::error_code load(
        const std::filesystem::path& path,
        SnapshotData& data);

    [[nodiscard]] static bool exists(const std::filesystem::path& path);
};

} // namespace sortkv::persistence
