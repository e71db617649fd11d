#include "storage/store.hpp"

#include "common/error.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <stdexcept>
#include <utility>

namespace sortkv {

// ── Backend names ────────────────────────────────────────────────────────────

std::string_view to_string(Backend backend) noexcept {
    switch (backend) {
        case Backend::File:    return "file";
        case Backend::Sqlite:  return "sqlite";
        case Backend::RocksDB: return "rocksdb";
    }
    return "unknown";
}

Backend parse_backend(std::string_view name) {
    if (name == "file")    return Backend::File;
    if (name == "sqlite")  return Backend::Sqlite;
    if (name == "rocksdb") return Backend::RocksDB;
    throw std::invalid_argument(fmt::format(
        "Unknown backend '{}' (expected file, sqlite or rocksdb)", name));
}

// ── Store ────────────────────────────────────────────────────────────────────

Store::Store(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)), self_(this, [](const Store*) {}) {}

void Store::open(const std::filesystem::path& location) {
    if (open_) {
        throw InvalidStateError(
            fmt::format("{} store already open at {}",
                        to_string(backend()), location_.string()),
            StoreErrc::already_open);
    }
    do_open(location);
    location_ = location;
    open_     = true;
    logger_->info("{} store opened at {}", to_string(backend()),
                  location_.string());
}

void Store::close() {
    if (!open_) {
        return;
    }
    // The handle is released even if the final flush fails; the failure is
    // still reported to the caller.
    open_ = false;
    do_close();
    logger_->info("{} store closed at {}", to_string(backend()),
                  location_.string());
}

void Store::sync() {
    require_open("sync");
    do_sync();
}

void Store::close_on_destroy() noexcept {
    if (!open_) {
        return;
    }
    try {
        close();
    } catch (const std::exception& e) {
        logger_->error("{} store: close on destruction failed: {}",
                       to_string(backend()), e.what());
    }
}

std::optional<std::string> Store::get(std::string_view key) const {
    require_open("get");
    return do_get(key);
}

std::string Store::get(std::string_view key,
                       std::string_view default_value) const {
    auto value = get(key);
    if (!value) {
        return std::string(default_value);
    }
    return std::move(*value);
}

void Store::put(std::string_view key, std::string_view value) {
    require_open("put");
    do_put(key, value);
}

void Store::put_many(std::span<const Entry> entries) {
    require_open("put_many");
    if (entries.empty()) {
        return;
    }
    do_put_many(entries);
    logger_->debug("{} store: wrote batch of {} entries",
                   to_string(backend()), entries.size());
}

void Store::put_many(std::initializer_list<Entry> entries) {
    put_many(std::span<const Entry>(entries.begin(), entries.size()));
}

KeysView Store::keys(KeyRange range) const {
    require_open("keys");
    return KeysView{cursor_factory(), std::move(range)};
}

ItemsView Store::items(KeyRange range) const {
    require_open("items");
    return ItemsView{cursor_factory(), std::move(range)};
}

void Store::prepare_location(const std::filesystem::path& location,
                             bool create) const {
    if (!create || !location.has_parent_path()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(location.parent_path(), ec);
    if (ec) {
        const auto message = fmt::format(
            "{} store: cannot create directory {}: {}", to_string(backend()),
            location.parent_path().string(), ec.message());
        logger_->error("{}", message);
        throw BackendIOError(message);
    }
}

void Store::require_open(std::string_view operation) const {
    if (!open_) {
        logger_->error("{} store: {} called on a closed store",
                       to_string(backend()), operation);
        throw InvalidStateError(fmt::format(
            "{}: {} store is not open", operation, to_string(backend())));
    }
}

CursorPtr Store::open_cursor() const {
    require_open("scan");
    return do_new_cursor();
}

CursorFactory Store::cursor_factory() const {
    return [store = std::weak_ptr<const Store>(self_), logger = logger_] {
        auto self = store.lock();
        if (!self) {
            logger->error("scan: store was destroyed before the scan began");
            throw InvalidStateError("scan: store has been destroyed");
        }
        return self->open_cursor();
    };
}

} // namespace sortkv
