#include "common/bytes.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"
#include "common/tool_config.hpp"
#include "storage/store_factory.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr std::size_t kImportBatchSize = 10'000;

// Render bytes for display: hex with --hex, otherwise printable escapes.
std::string render(std::string_view bytes, bool hex) {
    return hex ? sortkv::to_hex(bytes) : sortkv::escape_bytes(bytes);
}

// ── Commands ──────────────────────────────────────────────────────────────────

int cmd_get(sortkv::Store& store, const sortkv::ToolConfig& cfg) {
    auto value = store.get(cfg.args[0]);
    if (!value) {
        fprintf(stderr, "NOT_FOUND\n");
        return 2;
    }
    fprintf(stdout, "%s\n", render(*value, cfg.hex).c_str());
    return 0;
}

int cmd_put(sortkv::Store& store, const sortkv::ToolConfig& cfg) {
    store.put(cfg.args[0], cfg.args[1]);
    return 0;
}

int cmd_keys(const sortkv::Store& store, const sortkv::ToolConfig& cfg) {
    for (const auto& key : store.keys({cfg.key_from, cfg.key_to})) {
        fprintf(stdout, "%s\n", render(key, cfg.hex).c_str());
    }
    return 0;
}

int cmd_items(const sortkv::Store& store, const sortkv::ToolConfig& cfg) {
    for (const auto& [key, value] : store.items({cfg.key_from, cfg.key_to})) {
        fprintf(stdout, "%s\t%s\n", render(key, cfg.hex).c_str(),
                render(value, cfg.hex).c_str());
    }
    return 0;
}

// Reads key<TAB>value lines from stdin and writes them in batches.
int cmd_import(sortkv::Store& store, const sortkv::ToolConfig& cfg) {
    std::vector<sortkv::Entry> batch;
    batch.reserve(kImportBatchSize);

    std::size_t line_no = 0;
    std::size_t total   = 0;
    std::string line;
    while (std::getline(std::cin, line)) {
        ++line_no;
        if (line.empty()) {
            continue;
        }

        const auto tab = line.find('\t');
        if (tab == std::string::npos) {
            fprintf(stderr, "line %zu: expected key<TAB>value\n", line_no);
            return 1;
        }

        std::string key   = line.substr(0, tab);
        std::string value = line.substr(tab + 1);
        if (cfg.hex) {
            try {
                key   = sortkv::from_hex(key);
                value = sortkv::from_hex(value);
            } catch (const std::invalid_argument& e) {
                fprintf(stderr, "line %zu: %s\n", line_no, e.what());
                return 1;
            }
        }
        batch.emplace_back(std::move(key), std::move(value));

        if (batch.size() == kImportBatchSize) {
            store.put_many(batch);
            total += batch.size();
            batch.clear();
        }
    }

    store.put_many(batch);
    total += batch.size();

    spdlog::info("sortkv-cli: imported {} entries", total);
    return 0;
}

int run(sortkv::Store& store, const sortkv::ToolConfig& cfg) {
    if (cfg.command == "get")    return cmd_get(store, cfg);
    if (cfg.command == "put")    return cmd_put(store, cfg);
    if (cfg.command == "keys")   return cmd_keys(store, cfg);
    if (cfg.command == "items")  return cmd_items(store, cfg);
    return cmd_import(store, cfg);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    sortkv::ToolConfig cfg;
    try {
        cfg = sortkv::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    sortkv::init_default_logger(sortkv::parse_log_level(cfg.log_level));

    // ── Store ────────────────────────────────────────────────────────────────
    try {
        auto store = sortkv::open_store(cfg.backend, cfg.path,
                                        cfg.store_options());
        const int rc = run(*store, cfg);
        store->close();
        return rc;
    } catch (const sortkv::StoreError& e) {
        fprintf(stderr, "sortkv-cli: %s (%s)\n", e.what(),
                e.code().message().c_str());
        return 1;
    }
}
