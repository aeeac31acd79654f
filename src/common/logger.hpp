#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace polykv {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger (used by sessions, the server loop, the
// CLI and tests).
// Call once at program start before any logging.  Calling it again replaces
// the previous default logger.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) a named component logger.
//   name   – embedded in every log line as [<name>]
//   level  – initial log level
std::shared_ptr<spdlog::logger> make_logger(
    const std::string& name,
    spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

// True if `s` is one of the level names accepted by parse_log_level().
[[nodiscard]] bool is_known_log_level(const std::string& s);

} // namespace polykv
