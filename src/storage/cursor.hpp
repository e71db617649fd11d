#pragma once

#include <memory>
#include <string_view>

namespace sortkv {

// ── Cursor ───────────────────────────────────────────────────────────────────
//
// Forward-only position over an engine's entries in ascending byte-wise key
// order.  Each backend provides one.  Operations that touch the engine throw
// BackendIOError on failure; a cursor that simply runs off the end becomes
// !valid() without error.
//
// key()/value() are only meaningful while valid() and stay valid until the
// next call that moves the cursor.

class Cursor {
public:
    virtual ~Cursor() = default;

    // Position at the smallest key.
    virtual void seek_first() = 0;

    // Position at the smallest key >= `key`.
    virtual void seek(std::string_view key) = 0;

    [[nodiscard]] virtual bool valid() const = 0;

    virtual void next() = 0;

    [[nodiscard]] virtual std::string_view key() const = 0;
    [[nodiscard]] virtual std::string_view value() const = 0;
};

using CursorPtr = std::unique_ptr<Cursor>;

} // namespace sortkv
