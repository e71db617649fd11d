#pragma once

#include "storage/types.hpp"

#include <optional>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

namespace sortkv {

// ── ToolConfig ────────────────────────────────────────────────────────────────
// Configuration for one sortkv-cli invocation.
// Populated by parse_config() from CLI arguments.

struct ToolConfig {
    Backend     backend;            // Storage engine to open
    std::string path;               // Backend location (file or directory)
    std::string log_level;          // spdlog level string
    bool        sync_writes;        // StoreOptions::sync_writes
    bool        create_if_missing;  // StoreOptions::create_if_missing
    bool        hex;                // Keys/values on the command line are hex

    std::optional<std::string> key_from;  // --from, decoded
    std::optional<std::string> key_to;    // --to, decoded

    std::string              command;    // get | put | keys | items | import
    std::vector<std::string> args;       // command operands, decoded

    [[nodiscard]] StoreOptions store_options() const {
        return {create_if_missing, sync_writes};
    }
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a ToolConfig.
//
// Usage: sortkv-cli [options] <command> [operands...]
//   get KEY | put KEY VALUE | keys | items | import
//
// On success: returns a fully validated ToolConfig.
// On error  : throws std::runtime_error with a human-readable message
//             (also for --help, whose message is the help text).
//
// Validates:
//   - --backend is file, sqlite or rocksdb
//   - --path is not empty
//   - the command is known and has the right number of operands
//   - with --hex, every key/value/bound is valid hex

[[nodiscard]] ToolConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with sortkv-cli
// options.  Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace sortkv
