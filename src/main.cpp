#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "health/http_health_probe.hpp"
#include "routing/region_router.hpp"
#include "server/http_server.hpp"

#include <memory>
#include <csignal>
#include <cstdlib>
#include <format>

using namespace regionrouter;

// Global instances for signal handling
std::shared_ptr<RegionRouter> g_router;
std::shared_ptr<HttpServer> g_server;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));

    // Stop background probing first so no round outlives the server
    if (g_router) {
        g_router->stop_health_checks();
    }
    if (g_server) {
        g_server->stop();
    }
}

int main(int argc, char* argv[]) {
    try {
        utils::log::info("Region Router starting...");

        // Configuration
        std::string config_file = "config/regions.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/3] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        auto config = std::move(config_result.config);

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }
        const ServerConfig server_config = config.server;

        utils::log::info("[2/3] Building region router");
        g_router = std::make_shared<RegionRouter>(std::move(config),
                                                  std::make_shared<HttpHealthProbe>());
        g_router->start_health_checks();

        utils::log::info("[3/3] Starting HTTP server");
        g_server = std::make_shared<HttpServer>(*g_router, server_config);

        // Setup signal handlers
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        g_server->start();   // Blocks until stop()

        g_router->stop_health_checks();
        g_server.reset();
        g_router.reset();
        utils::log::info("Region Router stopped");

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
