#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace vireo::config {

static constexpr std::size_t ONE_KILOBYTE = 1024;
static constexpr std::size_t DEFAULT_MAX_BODY_SIZE = ONE_KILOBYTE * ONE_KILOBYTE * 10;
static constexpr std::size_t DEFAULT_MAX_HEADER_SIZE = ONE_KILOBYTE * 8;
static constexpr std::size_t MAX_HEADER_SIZE_LIMIT = ONE_KILOBYTE * 64;
static constexpr int DEFAULT_BACKLOG = 1000;

struct ServerConfig {
    std::string address = "127.0.0.1";
    uint16_t port = 8080;  // NOLINT
    // 0 means one worker per hardware thread
    unsigned int workers = 0;
    int backlog = DEFAULT_BACKLOG;

    bool keep_alive = true;
    std::chrono::seconds keep_alive_timeout{30};
    std::chrono::seconds worker_timeout{60};
    std::chrono::seconds drain_timeout{10};
    std::chrono::seconds scheduled_close_timeout{30};
    // A response write that makes no progress for this long closes the connection
    std::chrono::seconds write_timeout{30};
    std::chrono::seconds necromancer_interval{5};

    std::size_t max_body_size = DEFAULT_MAX_BODY_SIZE;
    std::size_t max_header_size = DEFAULT_MAX_HEADER_SIZE;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/vireo.log";
};

struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
};

/**
 * @brief Loads configuration from a TOML file.
 * @param path Path to the .toml file (default: "config.toml")
 * @return Parsed AppConfig object. A missing file yields the defaults.
 * @throws vireo::ConfigError if the file cannot be parsed or holds invalid values.
 */
AppConfig LoadConfig(const std::string& path = "config.toml");

// Same as LoadConfig, from an in-memory document.
AppConfig ParseConfig(std::string_view document);

// Number of worker processes to spawn: the configured count, or the hardware concurrency.
unsigned int ResolveWorkerCount(const ServerConfig& server);

}  // namespace vireo::config
