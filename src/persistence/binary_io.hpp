#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace sortkv::persistence {

// ── CRC32 ────────────────────────────────────────────────────────────────────

// Compute CRC32 (ISO 3309 / ITU-T V.42, same polynomial as zlib).
[[nodiscard]] uint32_t crc32(const uint8_t* data, std::size_t length);

// ── Little-endian encoding ───────────────────────────────────────────────────

void append_raw(std::vector<uint8_t>& buf, const void* data, std::size_t len);
void append_u8(std::vector<uint8_t>& buf, uint8_t v);
void append_u16(std::vector<uint8_t>& buf, uint16_t v);
void append_u32(std::vector<uint8_t>& buf, uint32_t v);
void append_u64(std::vector<uint8_t>& buf, uint64_t v);

// Largest byte string a u32 length prefix can describe.
inline constexpr std::size_t kMaxBytesLength = UINT32_MAX;

// Length-prefixed byte string: [len: u32 LE][bytes].  Callers keep
// bytes.size() <= kMaxBytesLength.
void append_bytes(std::vector<uint8_t>& buf, const std::string& bytes);

// ── Bounded decoding ─────────────────────────────────────────────────────────
//
// Each read advances `ptr` on success and returns false (leaving `ptr`
// unspecified) if fewer bytes than needed remain before `end`.

bool read_u8(const uint8_t*& ptr, const uint8_t* end, uint8_t& out);
bool read_u16(const uint8_t*& ptr, const uint8_t* end, uint16_t& out);
bool read_u32(const uint8_t*& ptr, const uint8_t* end, uint32_t& out);
bool read_u64(const uint8_t*& ptr, const uint8_t* end, uint64_t& out);
bool read_bytes(const uint8_t*& ptr, const uint8_t* end, std::string& out);

// ── File helpers ─────────────────────────────────────────────────────────────

// Write all bytes to fd, retrying on EINTR and short writes.
[[nodiscard]] std::error_code write_all(int fd, const uint8_t* data,
                                        std::size_t len);

// Read a whole file into `out`.
[[nodiscard]] std::error_code read_file(const std::filesystem::path& path,
                                        std::vector<uint8_t>& out);

[[nodiscard]] std::error_code errno_error();

} // namespace sortkv::persistence
