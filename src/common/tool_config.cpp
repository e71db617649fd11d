#include "common/tool_config.hpp"

#include "common/bytes.hpp"

#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>
#include <fmt/format.h>

namespace po = boost::program_options;

namespace sortkv {

namespace {

// ── Helpers ───────────────────────────────────────────────────────────────────

struct CommandSpec {
    std::string_view name;
    std::size_t      operands;
    std::string_view usage;
};

constexpr CommandSpec kCommands[] = {
    {"get",    1, "get KEY"},
    {"put",    2, "put KEY VALUE"},
    {"keys",   0, "keys"},
    {"items",  0, "items"},
    {"import", 0, "import   (reads key<TAB>value lines from stdin)"},
};

[[nodiscard]] const CommandSpec& find_command(const std::string& name) {
    for (const auto& spec : kCommands) {
        if (spec.name == name) {
            return spec;
        }
    }
    throw std::runtime_error(fmt::format(
        "Unknown command '{}' (expected get, put, keys, items or import)",
        name));
}

// Decode a command-line byte string, honouring --hex.
[[nodiscard]] std::string decode(const std::string& s, bool hex,
                                 std::string_view field_name) {
    if (!hex) {
        return s;
    }
    try {
        return from_hex(s);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(
            fmt::format("Invalid hex for {}: {}", field_name, e.what()));
    }
}

// Validate the fully populated ToolConfig.
void validate(const ToolConfig& cfg) {
    if (cfg.path.empty()) {
        throw std::runtime_error("--path must not be empty");
    }

    const auto& spec = find_command(cfg.command);
    if (cfg.args.size() != spec.operands) {
        throw std::runtime_error(fmt::format(
            "'{}' takes {} operand(s), got {} (usage: {})",
            spec.name, spec.operands, cfg.args.size(), spec.usage));
    }
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("backend,b",
            po::value<std::string>()->default_value("sqlite"),
            "Storage engine: file | sqlite | rocksdb")
        ("path,p",
            po::value<std::string>()->required(),
            "Store location: snapshot file, SQLite file or RocksDB directory")
        ("from",
            po::value<std::string>(),
            "Inclusive lower key bound for keys/items")
        ("to",
            po::value<std::string>(),
            "Inclusive upper key bound for keys/items")
        ("hex",
            po::bool_switch()->default_value(false),
            "Keys, values and bounds on the command line are hex encoded")
        ("sync-writes",
            po::bool_switch()->default_value(false),
            "Make every write durable before returning")
        ("must-exist",
            po::bool_switch()->default_value(false),
            "Fail instead of creating a missing store")
        ("log-level",
            po::value<std::string>()->default_value("warn"),
            "Log level: trace|debug|info|warn|error|critical");
}

// ── parse_config ──────────────────────────────────────────────────────────────

ToolConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("sortkv-cli options");
    add_options(desc);

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::string>())
        ("args",    po::value<std::vector<std::string>>());

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1).add("args", -1);

    po::variables_map vm;
    try {
        po::store(
            po::command_line_parser(argc, argv)
                .options(all)
                .positional(positional)
                .run(),
            vm);

        // Handle --help before notify() so missing required options don't error.
        if (vm.count("help")) {
            std::ostringstream oss;
            oss << "Usage: sortkv-cli [options] <command> [operands...]\n"
                << "Commands: get KEY | put KEY VALUE | keys | items | import\n\n"
                << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    if (!vm.count("command")) {
        throw std::runtime_error(
            "Missing command (expected get, put, keys, items or import)");
    }

    ToolConfig cfg;
    try {
        cfg.backend = parse_backend(vm["backend"].as<std::string>());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(e.what());
    }
    cfg.path              = vm["path"].as<std::string>();
    cfg.log_level         = vm["log-level"].as<std::string>();
    cfg.sync_writes       = vm["sync-writes"].as<bool>();
    cfg.create_if_missing = !vm["must-exist"].as<bool>();
    cfg.hex               = vm["hex"].as<bool>();
    cfg.command           = vm["command"].as<std::string>();

    if (vm.count("from")) {
        cfg.key_from = decode(vm["from"].as<std::string>(), cfg.hex, "--from");
    }
    if (vm.count("to")) {
        cfg.key_to = decode(vm["to"].as<std::string>(), cfg.hex, "--to");
    }
    if (vm.count("args")) {
        for (const auto& arg : vm["args"].as<std::vector<std::string>>()) {
            cfg.args.push_back(decode(arg, cfg.hex, "operand"));
        }
    }

    validate(cfg);
    return cfg;
}

} // namespace sortkv
