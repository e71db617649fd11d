#include "persistence/snapshot.hpp"

#include "common/error.hpp"
#include "persistence/binary_io.hpp"

#include <cstring>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace sortkv::persistence {

// ── Snapshot::save ───────────────────────────────────────────────────────────

std::error_code Snapshot::save(
    const std::filesystem::path& path,
    const SnapshotData& data) {

    // Build the binary payload (everything except the trailing CRC).
    std::vector<uint8_t> buf;
    buf.reserve(kSnapshotHeaderSize + 8 + data.size() * 64 + 4);

    append_raw(buf, kSnapshotMagic, kSnapshotMagicSize);
    append_u16(buf, kSnapshotVersion);
    append_u64(buf, static_cast<uint64_t>(data.size()));

    // std::map iterates in byte-wise key order already.
    for (const auto& [key, value] : data) {
        append_bytes(buf, key);
        append_bytes(buf, value);
    }

    uint32_t checksum = crc32(buf.data(), buf.size());
    append_u32(buf, checksum);

    // Atomic write: write to .tmp, fsync, rename.
    auto tmp_path = path;
    tmp_path += ".tmp";

    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        auto ec = errno_error();
        spdlog::error("Snapshot: failed to open tmp file {}: {}",
                      tmp_path.string(), ec.message());
        return ec;
    }

    std::error_code remove_ec;
    auto ec = write_all(fd, buf.data(), buf.size());
    if (ec) {
        spdlog::error("Snapshot: write failed: {}", ec.message());
        ::close(fd);
        std::filesystem::remove(tmp_path, remove_ec);
        return ec;
    }

    if (::fsync(fd) < 0) {
        ec = errno_error();
        spdlog::error("Snapshot: fsync failed: {}", ec.message());
        ::close(fd);
        std::filesystem::remove(tmp_path, remove_ec);
        return ec;
    }

    ::close(fd);

    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        spdlog::error("Snapshot: rename failed: {}", ec.message());
        std::filesystem::remove(tmp_path, remove_ec);
        return ec;
    }

    spdlog::debug("Snapshot: saved {} entries to {}", data.size(),
                  path.string());
    return {};
}

// ── Snapshot::load ───────────────────────────────────────────────────────────

std::error_code Snapshot::load(
    const std::filesystem::path& path,
    SnapshotData& data) {

    std::vector<uint8_t> buf;
    if (auto ec = read_file(path, buf)) {
        spdlog::error("Snapshot: failed to read {}: {}", path.string(),
                      ec.message());
        return ec;
    }

    // Minimum valid snapshot: header(6) + entry_count(8) + crc(4) = 18
    static constexpr std::size_t kMinSize = kSnapshotHeaderSize + 8 + 4;
    const auto corrupt = make_error_code(StoreErrc::corrupt_data);

    if (buf.size() < kMinSize) {
        spdlog::error("Snapshot: file too small ({} bytes)", buf.size());
        return corrupt;
    }

    const uint8_t* p = buf.data();
    const uint8_t* end = p + buf.size();

    if (std::memcmp(p, kSnapshotMagic, kSnapshotMagicSize) != 0) {
        spdlog::error("Snapshot: invalid magic");
        return corrupt;
    }
    p += kSnapshotMagicSize;

    uint16_t version = 0;
    read_u16(p, end, version);
    if (version != kSnapshotVersion) {
        spdlog::error("Snapshot: unsupported version {}", version);
        return corrupt;
    }

    uint64_t entry_count = 0;
    read_u64(p, end, entry_count);

    SnapshotData loaded;
    for (uint64_t i = 0; i < entry_count; ++i) {
        std::string key;
        std::string value;
        if (!read_bytes(p, end, key) || !read_bytes(p, end, value)) {
            spdlog::error("Snapshot: truncated at entry {}", i);
            return corrupt;
        }
        loaded.insert_or_assign(std::move(key), std::move(value));
    }

    // CRC32 covers everything from start through the last value.
    const std::size_t data_len = static_cast<std::size_t>(p - buf.data());
    uint32_t stored_crc = 0;
    if (!read_u32(p, end, stored_crc)) {
        spdlog::error("Snapshot: truncated at CRC");
        return corrupt;
    }

    uint32_t computed_crc = crc32(buf.data(), data_len);
    if (stored_crc != computed_crc) {
        spdlog::error("Snapshot: CRC mismatch (stored={:#010x}, computed={:#010x})",
                      stored_crc, computed_crc);
        return corrupt;
    }

    if (p != end) {
        spdlog::error("Snapshot: {} trailing bytes after CRC", end - p);
        return corrupt;
    }

    data = std::move(loaded);
    spdlog::debug("Snapshot: loaded {} entries from {}", data.size(),
                  path.string());
    return {};
}

// ── Snapshot::exists ─────────────────────────────────────────────────────────

bool Snapshot::exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

} // namespace sortkv::persistence
