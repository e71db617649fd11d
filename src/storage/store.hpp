#pragma once

#include "storage/cursor.hpp"
#include "storage/key_range.hpp"
#include "storage/range_scan.hpp"
#include "storage/types.hpp"

#include <filesystem>
#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
} // namespace spdlog

namespace sortkv {

// ── Store ────────────────────────────────────────────────────────────────────
//
// Sorted byte-string map over a pluggable storage engine.
//
// Every backend honours the same contract:
//   - keys and values are arbitrary bytes (empty and '\0' included)
//   - keys()/items() are ascending in byte-wise order, bounds inclusive
//   - a miss is std::nullopt (or the caller's default), never an exception
//   - engine faults raise BackendIOError with the engine's message
//   - any data operation outside open()..close() raises InvalidStateError
//
// Single writer: a Store is not synchronised internally.  Whether a running
// keys()/items() scan observes writes made after it started is backend
// defined (see each adapter).
//
// Concrete stores close themselves on destruction.

class Store {
public:
    virtual ~Store() = default;

    Store(const Store&)            = delete;
    Store& operator=(const Store&) = delete;
    Store(Store&&)                 = delete;
    Store& operator=(Store&&)      = delete;

    // ── Lifecycle ────────────────────────────────────────────────────────────

    // Acquires (or creates) the backing storage at `location`.
    void open(const std::filesystem::path& location);

    // Makes all prior writes durable and releases the engine.  A no-op on a
    // closed store.
    void close();

    // Makes all prior writes durable without closing.
    void sync();

    [[nodiscard]] bool is_open() const { return open_; }

    [[nodiscard]] const std::filesystem::path& location() const {
        return location_;
    }

    [[nodiscard]] virtual Backend backend() const noexcept = 0;

    // ── Data ─────────────────────────────────────────────────────────────────

    // Returns the value for `key`, or std::nullopt if not present.
    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    // Returns the value for `key`, or `default_value` if not present.
    [[nodiscard]] std::string get(std::string_view key,
                                  std::string_view default_value) const;

    // Inserts or replaces `key`.
    void put(std::string_view key, std::string_view value);

    // Same net effect as put() for each entry in order; later duplicates win.
    void put_many(std::span<const Entry> entries);
    void put_many(std::initializer_list<Entry> entries);

    // Lazy ascending sequences of the keys / entries inside `range`.  A view
    // may outlive the store; begin() then raises InvalidStateError.
    [[nodiscard]] KeysView keys(KeyRange range = {}) const;
    [[nodiscard]] ItemsView items(KeyRange range = {}) const;

protected:
    explicit Store(std::shared_ptr<spdlog::logger> logger);

    // Derived destructors call this: closes an open store and logs (rather
    // than throws) any failure.
    void close_on_destroy() noexcept;

    [[nodiscard]] spdlog::logger& log() const { return *logger_; }

    // Shared with cursors, which may outlive the store's open state.
    [[nodiscard]] const std::shared_ptr<spdlog::logger>& logger() const {
        return logger_;
    }

    // Create the parent directory of `location` when `create` is set.
    // Throws BackendIOError on failure.
    void prepare_location(const std::filesystem::path& location,
                          bool create) const;

private:
    // Throws InvalidStateError if the store is not open.
    void require_open(std::string_view operation) const;

    // Opens a fresh engine cursor for one scan.
    [[nodiscard]] CursorPtr open_cursor() const;

    // Cursor factory for a view; holds the store weakly.
    [[nodiscard]] CursorFactory cursor_factory() const;

    virtual void do_open(const std::filesystem::path& location) = 0;
    virtual void do_close() = 0;
    virtual void do_sync() = 0;

    [[nodiscard]] virtual std::optional<std::string> do_get(
        std::string_view key) const = 0;
    virtual void do_put(std::string_view key, std::string_view value) = 0;
    virtual void do_put_many(std::span<const Entry> entries) = 0;

    [[nodiscard]] virtual CursorPtr do_new_cursor() const = 0;

    std::shared_ptr<spdlog::logger> logger_;
    std::filesystem::path           location_;
    bool                            open_ = false;

    // Non-owning; expires with the store so views can detect its destruction.
    std::shared_ptr<const Store>    self_;
};

using StorePtr = std::unique_ptr<Store>;

} // namespace sortkv
