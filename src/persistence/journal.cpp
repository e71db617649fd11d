#include "persistence/journal.hpp"

#include "common/error.hpp"
#include "persistence/binary_io.hpp"

#include <cstring>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace sortkv::persistence {

// ── Serialisation ────────────────────────────────────────────────────────────

void serialise_put(std::vector<uint8_t>& buf, const Entry& entry) {
    const std::size_t record_start = buf.size();

    append_u8(buf, kRecordTypePut);
    append_bytes(buf, entry.first);
    append_bytes(buf, entry.second);

    // CRC covers type through value.
    uint32_t c = crc32(buf.data() + record_start, buf.size() - record_start);
    append_u32(buf, c);
}

// ── Journal implementation ───────────────────────────────────────────────────

Journal::Journal(const std::filesystem::path& path) : path_(path) {}

Journal::~Journal() {
    close();
}

std::error_code Journal::open() {
    if (fd_ != -1) {
        return {};  // Already open.
    }

    std::error_code ec;
    const bool fresh = !std::filesystem::exists(path_, ec) ||
                       std::filesystem::file_size(path_, ec) == 0;

    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT, 0644);
    if (fd_ < 0) {
        return errno_error();
    }

    if (fresh) {
        ec = write_header();
    } else {
        ec = validate_header(fd_);
        if (!ec && ::lseek(fd_, 0, SEEK_END) < 0) {
            ec = errno_error();
        }
    }

    if (ec) {
        close();
        return ec;
    }
    return {};
}

void Journal::close() {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::error_code Journal::write_header() {
    std::vector<uint8_t> hdr;
    hdr.reserve(kJournalHeaderSize);
    append_raw(hdr, kJournalMagic, kJournalMagicSize);
    append_u16(hdr, kJournalVersion);
    if (auto ec = write_all(fd_, hdr.data(), hdr.size())) {
        return ec;
    }
    return sync();
}

std::error_code Journal::validate_header(int fd) {
    if (::lseek(fd, 0, SEEK_SET) < 0) {
        return errno_error();
    }

    uint8_t hdr[kJournalHeaderSize];
    auto n = ::read(fd, hdr, kJournalHeaderSize);
    if (n < 0) return errno_error();
    if (static_cast<std::size_t>(n) < kJournalHeaderSize ||
        std::memcmp(hdr, kJournalMagic, kJournalMagicSize) != 0) {
        return make_error_code(StoreErrc::corrupt_data);
    }

    uint16_t version = static_cast<uint16_t>(hdr[4]) |
                       (static_cast<uint16_t>(hdr[5]) << 8);
    if (version != kJournalVersion) {
        return make_error_code(StoreErrc::corrupt_data);
    }

    return {};
}

std::error_code Journal::append(std::span<const Entry> entries, bool durable) {
    if (fd_ == -1) return std::make_error_code(std::errc::bad_file_descriptor);

    std::vector<uint8_t> buf;
    for (const auto& entry : entries) {
        serialise_put(buf, entry);
    }

    const off_t start = ::lseek(fd_, 0, SEEK_CUR);
    if (start < 0) {
        return errno_error();
    }

    auto ec = write_all(fd_, buf.data(), buf.size());
    if (!ec && durable) {
        ec = sync();
    }
    if (ec) {
        // A partial record would swallow every record appended after it.
        if (::ftruncate(fd_, start) < 0 || ::lseek(fd_, start, SEEK_SET) < 0) {
            spdlog::error("Journal: rollback to offset {} failed in {}: {}",
                          start, path_.string(), errno_error().message());
            close();
        }
    }
    return ec;
}

std::error_code Journal::sync() {
    if (fd_ == -1) return std::make_error_code(std::errc::bad_file_descriptor);
    if (::fdatasync(fd_) < 0) {
        return errno_error();
    }
    return {};
}

std::error_code Journal::reset() {
    if (fd_ == -1) return std::make_error_code(std::errc::bad_file_descriptor);

    if (::ftruncate(fd_, static_cast<off_t>(kJournalHeaderSize)) < 0) {
        return errno_error();
    }
    if (::lseek(fd_, 0, SEEK_END) < 0) {
        return errno_error();
    }
    return sync();
}

std::error_code Journal::replay(
    const std::filesystem::path& path,
    std::vector<Entry>& entries)
{
    entries.clear();

    std::vector<uint8_t> data;
    if (auto ec = read_file(path, data)) {
        return ec;
    }

    const auto corrupt = make_error_code(StoreErrc::corrupt_data);
    if (data.size() < kJournalHeaderSize ||
        std::memcmp(data.data(), kJournalMagic, kJournalMagicSize) != 0) {
        return corrupt;
    }

    const uint8_t* ptr = data.data() + kJournalMagicSize;
    const uint8_t* end = data.data() + data.size();

    uint16_t version = 0;
    read_u16(ptr, end, version);
    if (version != kJournalVersion) {
        return corrupt;
    }

    while (ptr < end) {
        const uint8_t* record_start = ptr;

        uint8_t type = 0;
        read_u8(ptr, end, type);
        if (type != kRecordTypePut) {
            spdlog::warn("Journal: unknown record type 0x{:02X} in {}", type,
                         path.string());
            return corrupt;
        }

        Entry entry;
        uint32_t stored_crc = 0;
        if (!read_bytes(ptr, end, entry.first) ||
            !read_bytes(ptr, end, entry.second)) {
            spdlog::warn("Journal: truncated record after {} entries",
                         entries.size());
            break;
        }

        const std::size_t payload_len =
            static_cast<std::size_t>(ptr - record_start);
        if (!read_u32(ptr, end, stored_crc)) {
            spdlog::warn("Journal: truncated CRC after {} entries",
                         entries.size());
            break;
        }

        if (crc32(record_start, payload_len) != stored_crc) {
            spdlog::warn("Journal: CRC mismatch in record {}", entries.size());
            return corrupt;
        }

        entries.push_back(std::move(entry));
    }

    return {};
}

} // namespace sortkv::persistence
