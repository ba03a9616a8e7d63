// 1. Standard Library
#include <cstdlib>
#include <exception>
#include <string>

// 2. Third Party
#include <spdlog/spdlog.h>

// 3. Local Headers
#include "DemoRoutes.hpp"
#include "Errors.hpp"
#include "Logging.hpp"
#include "ProcessSupervisor.hpp"
#include "Router.hpp"
#include "config.hpp"

int main(int argc, char* argv[]) {
    try {
        // 1. Argument Validation
        if (argc > 3) {
            spdlog::critical("Usage: vireo_server [config.toml] | vireo_server <address> <port>");
            spdlog::critical("Example: vireo_server 0.0.0.0 8080");
            return EXIT_FAILURE;
        }

        // 2. Configuration
        auto config = vireo::config::LoadConfig(argc == 2 ? argv[1] : "config.toml");
        if (argc == 3) {
            config.server.address = argv[1];
            const int port = std::stoi(argv[2]);
            if (port < 1 || port > 65535) {  // NOLINT
                throw vireo::ConfigError("port must be between 1 and 65535");
            }
            config.server.port = static_cast<uint16_t>(port);
        }
        vireo::logging::SetupLogging(config.logging);

        // 3. Routes, built once before the workers fork
        vireo::core::Router router;
        vireo::app::RegisterDemoRoutes(router);

        // 4. Run until SIGINT / SIGTERM
        vireo::supervisor::ProcessSupervisor supervisor(config.server, router);
        return supervisor.run();

    } catch (const std::exception& e) {
        spdlog::critical("Fatal Error: {}", e.what());
        return EXIT_FAILURE;
    }
}
