#include "persistence/binary_io.hpp"

#include <array>
#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

namespace sortkv::persistence {

// ── CRC32 (ISO 3309 polynomial 0xEDB88320) ──────────────────────────────────

namespace {

constexpr std::array<uint32_t, 256> make_crc32_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            if (crc & 1)
                crc = (crc >> 1) ^ 0xEDB88320;
            else
                crc >>= 1;
        }
        table[i] = crc;
    }
    return table;
}

constexpr auto kCrc32Table = make_crc32_table();

} // anonymous namespace

uint32_t crc32(const uint8_t* data, std::size_t length) {
    uint32_t crc = 0xFFFFFFFF;
    for (std::size_t i = 0; i < length; ++i) {
        crc = kCrc32Table[(crc ^ data[i]) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

// ── Encoding ─────────────────────────────────────────────────────────────────

void append_raw(std::vector<uint8_t>& buf, const void* data, std::size_t len) {
    const auto* p = static_cast<const uint8_t*>(data);
    buf.insert(buf.end(), p, p + len);
}

void append_u8(std::vector<uint8_t>& buf, uint8_t v) {
    buf.push_back(v);
}

void append_u16(std::vector<uint8_t>& buf, uint16_t v) {
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void append_u32(std::vector<uint8_t>& buf, uint32_t v) {
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

void append_u64(std::vector<uint8_t>& buf, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        buf.push_back(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
    }
}

void append_bytes(std::vector<uint8_t>& buf, const std::string& bytes) {
    append_u32(buf, static_cast<uint32_t>(bytes.size()));
    append_raw(buf, bytes.data(), bytes.size());
}

// ── Decoding ─────────────────────────────────────────────────────────────────

bool read_u8(const uint8_t*& ptr, const uint8_t* end, uint8_t& out) {
    if (end - ptr < 1) return false;
    out = *ptr++;
    return true;
}

bool read_u16(const uint8_t*& ptr, const uint8_t* end, uint16_t& out) {
    if (end - ptr < 2) return false;
    out = static_cast<uint16_t>(ptr[0]) |
          (static_cast<uint16_t>(ptr[1]) << 8);
    ptr += 2;
    return true;
}

bool read_u32(const uint8_t*& ptr, const uint8_t* end, uint32_t& out) {
    if (end - ptr < 4) return false;
    out = static_cast<uint32_t>(ptr[0]) |
          (static_cast<uint32_t>(ptr[1]) << 8) |
          (static_cast<uint32_t>(ptr[2]) << 16) |
          (static_cast<uint32_t>(ptr[3]) << 24);
    ptr += 4;
    return true;
}

bool read_u64(const uint8_t*& ptr, const uint8_t* end, uint64_t& out) {
    if (end - ptr < 8) return false;
    out = 0;
    for (int i = 0; i < 8; ++i) {
        out |= static_cast<uint64_t>(ptr[i]) << (i * 8);
    }
    ptr += 8;
    return true;
}

bool read_bytes(const uint8_t*& ptr, const uint8_t* end, std::string& out) {
    uint32_t len = 0;
    if (!read_u32(ptr, end, len)) return false;
    if (static_cast<std::size_t>(end - ptr) < len) return false;
    out.assign(reinterpret_cast<const char*>(ptr), len);
    ptr += len;
    return true;
}

// ── File helpers ─────────────────────────────────────────────────────────────

std::error_code errno_error() {
    return {errno, std::system_category()};
}

std::error_code write_all(int fd, const uint8_t* data, std::size_t len) {
    std::size_t written = 0;
    while (written < len) {
        auto n = ::write(fd, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_error();
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code read_file(const std::filesystem::path& path,
                          std::vector<uint8_t>& out) {
    out.clear();

    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        return errno_error();
    }

    uint8_t buf[8192];
    while (true) {
        auto n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            auto ec = errno_error();
            ::close(fd);
            return ec;
        }
        if (n == 0) break;
        out.insert(out.end(), buf, buf + n);
    }

    ::close(fd);
    return {};
}

} // namespace sortkv::persistence
