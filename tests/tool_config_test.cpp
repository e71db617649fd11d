#include "common/tool_config.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

// ── Helpers ───────────────────────────────────────────────────────────────────

// Build a fake argv array from a vector of strings.
// The returned pointers are valid as long as `args` is alive.
static std::vector<char*> make_argv(std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (auto& s : args) {
        argv.push_back(s.data());
    }
    return argv;
}

static sortkv::ToolConfig parse(std::vector<std::string> args) {
    auto argv = make_argv(args);
    return sortkv::parse_config(static_cast<int>(argv.size()), argv.data());
}

// ── Fixture ───────────────────────────────────────────────────────────────────

class ToolConfigTest : public ::testing::Test {
protected:
    // Minimal valid invocation.
    std::vector<std::string> valid_args_{
        "sortkv-cli",
        "--path", "./data/store.db",
        "keys",
    };
};

// ── Valid configuration ────────────────────────────────────────────────────────

TEST_F(ToolConfigTest, ParsesMinimalValidConfig) {
    auto cfg = parse(valid_args_);

    EXPECT_EQ(cfg.backend,           sortkv::Backend::Sqlite);  // default
    EXPECT_EQ(cfg.path,              "./data/store.db");
    EXPECT_EQ(cfg.log_level,         "warn");                  // default
    EXPECT_FALSE(cfg.sync_writes);
    EXPECT_TRUE(cfg.create_if_missing);
    EXPECT_FALSE(cfg.hex);
    EXPECT_FALSE(cfg.key_from.has_value());
    EXPECT_FALSE(cfg.key_to.has_value());
    EXPECT_EQ(cfg.command,           "keys");
    EXPECT_TRUE(cfg.args.empty());
}

TEST_F(ToolConfigTest, ParsesEveryBackend) {
    for (const auto& [name, backend] :
         std::vector<std::pair<std::string, sortkv::Backend>>{
             {"file", sortkv::Backend::File},
             {"sqlite", sortkv::Backend::Sqlite},
             {"rocksdb", sortkv::Backend::RocksDB}}) {
        auto cfg = parse({"sortkv-cli", "--backend", name, "-p", "db", "keys"});
        EXPECT_EQ(cfg.backend, backend) << name;
    }
}

TEST_F(ToolConfigTest, ParsesGetAndPutOperands) {
    auto get = parse({"sortkv-cli", "-p", "db", "get", "k"});
    EXPECT_EQ(get.command, "get");
    EXPECT_EQ(get.args, std::vector<std::string>{"k"});

    auto put = parse({"sortkv-cli", "-p", "db", "put", "k", "v w"});
    EXPECT_EQ(put.command, "put");
    EXPECT_EQ(put.args, (std::vector<std::string>{"k", "v w"}));
}

TEST_F(ToolConfigTest, ParsesRangeBounds) {
    valid_args_.insert(valid_args_.end(), {"--from", "fo", "--to", "si"});
    auto cfg = parse(valid_args_);
    EXPECT_EQ(cfg.key_from, "fo");
    EXPECT_EQ(cfg.key_to,   "si");
}

TEST_F(ToolConfigTest, ParsesSwitches) {
    valid_args_.insert(valid_args_.end(),
                       {"--sync-writes", "--must-exist", "--log-level", "debug"});
    auto cfg = parse(valid_args_);
    EXPECT_TRUE(cfg.sync_writes);
    EXPECT_FALSE(cfg.create_if_missing);
    EXPECT_EQ(cfg.log_level, "debug");

    auto options = cfg.store_options();
    EXPECT_TRUE(options.sync_writes);
    EXPECT_FALSE(options.create_if_missing);
}

TEST_F(ToolConfigTest, HexDecodesOperandsAndBounds) {
    auto cfg = parse({"sortkv-cli", "-p", "db", "--hex",
                      "--from", "00", "--to", "ff", "put", "006b", "00"});
    EXPECT_TRUE(cfg.hex);
    EXPECT_EQ(cfg.key_from, std::string("\x00", 1));
    EXPECT_EQ(cfg.key_to,   std::string("\xff", 1));
    ASSERT_EQ(cfg.args.size(), 2u);
    EXPECT_EQ(cfg.args[0], std::string("\x00k", 2));
    EXPECT_EQ(cfg.args[1], std::string("\x00", 1));
}

TEST_F(ToolConfigTest, ImportTakesNoOperands) {
    auto cfg = parse({"sortkv-cli", "-b", "file", "-p", "db", "import"});
    EXPECT_EQ(cfg.command, "import");
    EXPECT_EQ(cfg.backend, sortkv::Backend::File);
}

// ── Validation errors ─────────────────────────────────────────────────────────

TEST_F(ToolConfigTest, RejectsUnknownBackend) {
    EXPECT_THROW(parse({"sortkv-cli", "-b", "bsddb", "-p", "db", "keys"}),
                 std::runtime_error);
}

TEST_F(ToolConfigTest, RejectsMissingPath) {
    EXPECT_THROW(parse({"sortkv-cli", "keys"}), std::runtime_error);
}

TEST_F(ToolConfigTest, RejectsEmptyPath) {
    EXPECT_THROW(parse({"sortkv-cli", "-p", "", "keys"}), std::runtime_error);
}

TEST_F(ToolConfigTest, RejectsMissingCommand) {
    EXPECT_THROW(parse({"sortkv-cli", "-p", "db"}), std::runtime_error);
}

TEST_F(ToolConfigTest, RejectsUnknownCommand) {
    EXPECT_THROW(parse({"sortkv-cli", "-p", "db", "delete", "k"}),
                 std::runtime_error);
}

TEST_F(ToolConfigTest, RejectsWrongOperandCount) {
    EXPECT_THROW(parse({"sortkv-cli", "-p", "db", "get"}), std::runtime_error);
    EXPECT_THROW(parse({"sortkv-cli", "-p", "db", "put", "k"}),
                 std::runtime_error);
    EXPECT_THROW(parse({"sortkv-cli", "-p", "db", "keys", "extra"}),
                 std::runtime_error);
}

TEST_F(ToolConfigTest, RejectsInvalidHex) {
    EXPECT_THROW(parse({"sortkv-cli", "-p", "db", "--hex", "get", "abc"}),
                 std::runtime_error);
    EXPECT_THROW(parse({"sortkv-cli", "-p", "db", "--hex", "--from", "zz",
                        "keys"}),
                 std::runtime_error);
}

TEST_F(ToolConfigTest, RejectsUnknownOption) {
    valid_args_.push_back("--no-such-flag");
    EXPECT_THROW(parse(valid_args_), std::runtime_error);
}

TEST_F(ToolConfigTest, HelpThrowsWithUsage) {
    try {
        parse({"sortkv-cli", "--help"});
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        const std::string what = e.what();
        EXPECT_NE(what.find("Usage: sortkv-cli"), std::string::npos);
        EXPECT_NE(what.find("--backend"), std::string::npos);
    }
}

TEST_F(ToolConfigTest, AddOptionsRegistersAllFlags) {
    boost::program_options::options_description desc;
    sortkv::add_options(desc);
    for (const char* name : {"backend", "path", "from", "to", "hex",
                             "sync-writes", "must-exist", "log-level"}) {
        EXPECT_NE(desc.find_nothrow(name, false), nullptr) << name;
    }
}
