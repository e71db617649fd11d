#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace sortkv {

// ── KeyRange ─────────────────────────────────────────────────────────────────
//
// Inclusive bounds [from, to] in byte-wise key order.  A missing bound is
// unbounded on that side.  Bounds are cut points: they need not be keys that
// exist in the store.

struct KeyRange {
    std::optional<std::string> from;
    std::optional<std::string> to;

    [[nodiscard]] static KeyRange all() { return {}; }

    [[nodiscard]] static KeyRange from_key(std::string_view key) {
        return {std::string(key), std::nullopt};
    }

    [[nodiscard]] static KeyRange to_key(std::string_view key) {
        return {std::nullopt, std::string(key)};
    }

    [[nodiscard]] static KeyRange between(std::string_view from,
                                          std::string_view to) {
        return {std::string(from), std::string(to)};
    }

    // True if `key` does not exceed the upper bound.
    [[nodiscard]] bool below_upper(std::string_view key) const {
        return !to || key.compare(*to) <= 0;
    }

    [[nodiscard]] bool contains(std::string_view key) const {
        return (!from || key.compare(*from) >= 0) && below_upper(key);
    }

    // An inverted range (from > to) can never match a key.
    [[nodiscard]] bool empty() const {
        return from && to && from->compare(*to) > 0;
    }

    bool operator==(const KeyRange&) const = default;
};

} // namespace sortkv
