#include "common/logger.hpp"
#include "common/server_config.hpp"
#include "network/server.hpp"
#include "storage/store.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <exception>
#include <stdexcept>

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    polykv::ServerConfig cfg;
    try {
        cfg = polykv::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    const auto level = polykv::parse_log_level(cfg.log_level);
    polykv::init_default_logger(level);
    auto logger = polykv::make_logger("polykv-server", level);

    logger->info("polykv-server starting – bind={}:{} threads={}",
        cfg.host, cfg.port, cfg.threads == 0 ? "auto" : std::to_string(cfg.threads));

    // ── Store + server ───────────────────────────────────────────────────────
    polykv::Store store;

    try {
        polykv::network::Server server{cfg.host, cfg.port, store, cfg.threads};
        server.run();
    } catch (const std::exception& e) {
        logger->error("polykv-server failed: {}", e.what());
        return 1;
    }

    logger->info("polykv-server stopped");
    return 0;
}
