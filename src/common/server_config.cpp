#include "common/server_config.hpp"
#include "common/logger.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>
#include <spdlog/fmt/fmt.h>

namespace po = boost::program_options;

namespace polykv {

namespace {

// Validate the fully populated ServerConfig.
void validate(const ServerConfig& cfg) {
    if (cfg.port == 0) {
        throw std::runtime_error("Port for --port must be in [1, 65535], got 0");
    }
    // uint16_t max is 65535 by definition – no upper bound check needed.

    if (cfg.host.empty()) {
        throw std::runtime_error("--host must not be empty");
    }

    if (cfg.threads > kMaxThreads) {
        throw std::runtime_error(
            fmt::format("--threads must be in [0, {}], got {}", kMaxThreads, cfg.threads));
    }

    if (!is_known_log_level(cfg.log_level)) {
        throw std::runtime_error(
            fmt::format("--log-level must be one of trace|debug|info|warn|error|critical, "
                        "got '{}'", cfg.log_level));
    }
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("host",
            po::value<std::string>()->default_value("0.0.0.0"),
            "Bind address for client connections")
        ("port,p",
            po::value<uint16_t>()->default_value(6379),
            "Port for RESP client connections")
        ("threads",
            po::value<uint32_t>()->default_value(0),
            "Worker threads running the event loop (0 = hardware concurrency)")
        ("log-level",
            po::value<std::string>()->default_value("info"),
            "Log level: trace|debug|info|warn|error|critical");
}

// ── parse_config ──────────────────────────────────────────────────────────────

ServerConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("polykv-server options");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(
            po::parse_command_line(argc, argv, desc),
            vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    ServerConfig cfg;
    cfg.host      = vm["host"].as<std::string>();
    cfg.port      = vm["port"].as<uint16_t>();
    cfg.threads   = vm["threads"].as<uint32_t>();
    cfg.log_level = vm["log-level"].as<std::string>();

    validate(cfg);
    return cfg;
}

} // namespace polykv
