#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace sortkv {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger (tools, early startup messages, tests).
// All sortkv loggers write to stderr so tool output on stdout stays clean.
// Also sets `level` on every registered logger.
// Safe to call more than once; later calls only adjust the level.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) a named logger, e.g. one per backend.
//   name   – embedded in every log line as [<name>]
// New loggers start at the global level set by init_default_logger().
std::shared_ptr<spdlog::logger> make_store_logger(const std::string& name);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace sortkv
