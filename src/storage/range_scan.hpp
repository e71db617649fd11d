#pragma once

#include "storage/cursor.hpp"
#include "storage/key_range.hpp"
#include "storage/types.hpp"

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sortkv {

// ── RangeScan ────────────────────────────────────────────────────────────────
//
// Drives a Cursor over an inclusive KeyRange:
//   1. seek(from) or seek_first()
//   2. yield while valid() and key <= to
//   3. stop at the first key past `to` or when the cursor is exhausted
//
// An inverted range never touches the cursor.  Engine faults propagate as
// BackendIOError from the constructor or advance().

class RangeScan {
public:
    RangeScan(CursorPtr cursor, KeyRange range);

    [[nodiscard]] bool done() const { return done_; }

    [[nodiscard]] std::string_view key() const { return cursor_->key(); }
    [[nodiscard]] std::string_view value() const { return cursor_->value(); }

    void advance();

private:
    // Mark the scan finished if the cursor ran off the end or past `to`.
    void settle();

    CursorPtr cursor_;
    KeyRange  range_;
    bool      done_ = false;
};

using CursorFactory = std::function<CursorPtr()>;

namespace detail {

template <typename T>
struct ScanProjection;

template <>
struct ScanProjection<std::string> {
    static std::string load(const RangeScan& scan) {
        return std::string(scan.key());
    }
};

template <>
struct ScanProjection<Entry> {
    static Entry load(const RangeScan& scan) {
        return {std::string(scan.key()), std::string(scan.value())};
    }
};

} // namespace detail

// ── RangeView ────────────────────────────────────────────────────────────────
//
// Lazy, restartable sequence over a key range.  Nothing is read until begin()
// is called; every begin() opens a fresh cursor and starts over.  Iterators
// are single-pass input iterators; copies share the underlying scan.
// Abandoning an iterator cancels the scan.

template <typename T>
class RangeView {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = T;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const T*;
        using reference         = const T&;

        iterator() = default;

        explicit iterator(std::shared_ptr<RangeScan> scan)
            : scan_(std::move(scan)) {
            load();
        }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++() {
            scan_->advance();
            load();
            return *this;
        }

        void operator++(int) { ++*this; }

        friend bool operator==(const iterator& a, const iterator& b) {
            return a.scan_ == b.scan_;
        }

    private:
        void load() {
            if (scan_->done()) {
                scan_.reset();
                current_.reset();
                return;
            }
            current_ = detail::ScanProjection<T>::load(*scan_);
        }

        std::shared_ptr<RangeScan> scan_;
        std::optional<T>           current_;
    };

    RangeView(CursorFactory factory, KeyRange range)
        : factory_(std::move(factory)), range_(std::move(range)) {}

    [[nodiscard]] iterator begin() const {
        if (range_.empty()) {
            return end();
        }
        return iterator{std::make_shared<RangeScan>(factory_(), range_)};
    }

    [[nodiscard]] iterator end() const { return {}; }

    // Drain the whole range into memory.
    [[nodiscard]] std::vector<T> to_vector() const {
        std::vector<T> out;
        for (auto it = begin(); it != end(); ++it) {
            out.push_back(*it);
        }
        return out;
    }

private:
    CursorFactory factory_;
    KeyRange      range_;
};

using KeysView  = RangeView<std::string>;
using ItemsView = RangeView<Entry>;

} // namespace sortkv
