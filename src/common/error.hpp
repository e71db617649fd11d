#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace sortkv {

// ── StoreErrc ────────────────────────────────────────────────────────────────
//
// Error conditions raised at the Store boundary.  Every engine fault is mapped
// onto one of these codes; the engine's own message travels in what().

enum class StoreErrc {
    ok = 0,
    not_found,      // reserved: misses are reported as std::nullopt, not raised
    backend_io,     // engine failed to open/read/write/sync/close
    corrupt_data,   // persisted state failed validation (magic, version, CRC)
    not_open,       // operation before open() or after close()
    already_open,   // open() on a handle that is already open
};

[[nodiscard]] const std::error_category& store_category() noexcept;

[[nodiscard]] std::error_code make_error_code(StoreErrc e) noexcept;

// ── Exceptions ───────────────────────────────────────────────────────────────

class StoreError : public std::system_error {
public:
    StoreError(StoreErrc code, const std::string& what)
        : std::system_error(make_error_code(code), what) {}
};

// The storage engine failed.  Never retried automatically.
class BackendIOError : public StoreError {
public:
    explicit BackendIOError(const std::string& what,
                            StoreErrc code = StoreErrc::backend_io)
        : StoreError(code, what) {}
};

// The handle is not in a state that allows the operation.
class InvalidStateError : public StoreError {
public:
    explicit InvalidStateError(const std::string& what,
                               StoreErrc code = StoreErrc::not_open)
        : StoreError(code, what) {}
};

} // namespace sortkv

template <>
struct std::is_error_code_enum<sortkv::StoreErrc> : std::true_type {};
