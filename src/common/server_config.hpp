#pragma once

#include <cstdint>
#include <string>

#include <boost/program_options.hpp>

namespace polykv {

// ── ServerConfig ──────────────────────────────────────────────────────────────
// Full configuration for one polykv-server process.
// Populated by parse_config() from CLI arguments.

struct ServerConfig {
    std::string host;       // Bind address for client connections
    uint16_t    port;       // Port for RESP client connections
    uint32_t    threads;    // io_context worker threads (0 = hardware concurrency)
    std::string log_level;  // spdlog level string
};

// Upper bound accepted for --threads.
inline constexpr uint32_t kMaxThreads = 1024;

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a ServerConfig.
//
// On success: returns a fully validated ServerConfig.
// On error  : throws std::runtime_error with a human-readable message.
//             --help also throws; the message is the option description.
//
// Validates:
//   - port in [1, 65535]
//   - threads in [0, kMaxThreads]
//   - log level is one of trace|debug|info|warn|error|critical

[[nodiscard]] ServerConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with server options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace polykv
