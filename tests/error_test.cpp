#include "common/error.hpp"
#include "common/logger.hpp"

#include <string>
#include <system_error>

#include <gtest/gtest.h>

namespace sortkv {

// ── StoreErrc ────────────────────────────────────────────────────────────────

TEST(ErrorTest, CategoryNameAndMessages) {
    const auto& cat = store_category();
    EXPECT_STREQ(cat.name(), "sortkv.store");
    EXPECT_EQ(cat.message(static_cast<int>(StoreErrc::backend_io)),
              "storage backend I/O error");
    EXPECT_EQ(cat.message(static_cast<int>(StoreErrc::not_open)),
              "store is not open");
    EXPECT_EQ(cat.message(999), "unknown store error");
}

TEST(ErrorTest, EnumConvertsToErrorCode) {
    std::error_code ec = StoreErrc::corrupt_data;
    EXPECT_EQ(ec.category(), store_category());
    EXPECT_EQ(ec, StoreErrc::corrupt_data);
    EXPECT_NE(ec, StoreErrc::backend_io);
    EXPECT_TRUE(ec);
    EXPECT_FALSE(make_error_code(StoreErrc::ok));
}

// ── Exceptions ───────────────────────────────────────────────────────────────

TEST(ErrorTest, BackendIOErrorDefaultsToBackendIO) {
    BackendIOError err("engine exploded");
    EXPECT_EQ(err.code(), StoreErrc::backend_io);
    EXPECT_NE(std::string(err.what()).find("engine exploded"),
              std::string::npos);
}

TEST(ErrorTest, BackendIOErrorCanCarryCorruptData) {
    BackendIOError err("bad crc", StoreErrc::corrupt_data);
    EXPECT_EQ(err.code(), StoreErrc::corrupt_data);
}

TEST(ErrorTest, InvalidStateErrorDefaultsToNotOpen) {
    InvalidStateError err("closed");
    EXPECT_EQ(err.code(), StoreErrc::not_open);
}

TEST(ErrorTest, ExceptionsShareStoreErrorBase) {
    EXPECT_THROW(throw BackendIOError("x"), StoreError);
    EXPECT_THROW(throw InvalidStateError("x"), StoreError);
    EXPECT_THROW(throw InvalidStateError("x"), std::system_error);
}

// ── Log levels ───────────────────────────────────────────────────────────────

TEST(LoggerTest, ParsesKnownLevels) {
    EXPECT_EQ(parse_log_level("trace"), spdlog::level::trace);
    EXPECT_EQ(parse_log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(parse_log_level("warn"), spdlog::level::warn);
    EXPECT_EQ(parse_log_level("critical"), spdlog::level::critical);
}

TEST(LoggerTest, UnknownLevelFallsBackToInfo) {
    EXPECT_EQ(parse_log_level("loud"), spdlog::level::info);
}

TEST(LoggerTest, StoreLoggerIsReusedByName) {
    auto a = make_store_logger("error-test-store");
    auto b = make_store_logger("error-test-store");
    EXPECT_EQ(a, b);
    EXPECT_EQ(a->name(), "error-test-store");
}

TEST(LoggerTest, InitDefaultLoggerSetsLevel) {
    init_default_logger(spdlog::level::err);
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::err);
    EXPECT_EQ(make_store_logger("error-test-late")->level(),
              spdlog::level::err);
    init_default_logger(spdlog::level::info);
}

} // namespace sortkv
