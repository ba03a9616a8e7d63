#include "config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <thread>
#include <toml++/toml.hpp>

#include "Errors.hpp"

namespace vireo::config {

namespace {

template <typename View>
int64_t ReadInteger(const View& table, std::string_view key, int64_t fallback, int64_t min,
                    int64_t max) {
    auto node = table[key];
    if (!node) {
        return fallback;
    }
    std::optional<int64_t> value = node.template value<int64_t>();
    if (!value) {
        throw ConfigError("server." + std::string(key) + " must be an integer");
    }
    if (*value < min || *value > max) {
        throw ConfigError("server." + std::string(key) + " is out of range [" +
                          std::to_string(min) + ", " + std::to_string(max) + "]");
    }
    return *value;
}

template <typename View>
std::chrono::seconds ReadSeconds(const View& table, std::string_view key,
                                 std::chrono::seconds fallback) {
    return std::chrono::seconds{ReadInteger(table, key, fallback.count(), 0,
                                            std::numeric_limits<int32_t>::max())};
}

AppConfig FromTable(const toml::table& tbl) {
    AppConfig config;

    // 1. Server Settings
    if (auto server = tbl["server"]) {
        if (!server.is_table()) {
            throw ConfigError("[server] must be a table");
        }
        config.server.address = server["address"].value_or(config.server.address);
        config.server.port = static_cast<uint16_t>(
            ReadInteger(server, "port", config.server.port, 1, std::numeric_limits<uint16_t>::max()));
        config.server.workers = static_cast<unsigned int>(
            ReadInteger(server, "workers", config.server.workers, 0, 1024));  // NOLINT
        config.server.backlog = static_cast<int>(
            ReadInteger(server, "backlog", config.server.backlog, 1, std::numeric_limits<int>::max()));
        config.server.keep_alive = server["keep_alive"].value_or(config.server.keep_alive);

        config.server.keep_alive_timeout =
            ReadSeconds(server, "keep_alive_timeout", config.server.keep_alive_timeout);
        config.server.worker_timeout =
            ReadSeconds(server, "worker_timeout", config.server.worker_timeout);
        config.server.drain_timeout =
            ReadSeconds(server, "drain_timeout", config.server.drain_timeout);
        config.server.scheduled_close_timeout =
            ReadSeconds(server, "scheduled_close_timeout", config.server.scheduled_close_timeout);
        config.server.write_timeout =
            ReadSeconds(server, "write_timeout", config.server.write_timeout);
        config.server.necromancer_interval =
            ReadSeconds(server, "necromancer_interval", config.server.necromancer_interval);

        config.server.max_body_size = static_cast<std::size_t>(
            ReadInteger(server, "max_body_size", static_cast<int64_t>(config.server.max_body_size),
                        0, std::numeric_limits<int64_t>::max()));
        config.server.max_header_size = static_cast<std::size_t>(ReadInteger(
            server, "max_header_size", static_cast<int64_t>(config.server.max_header_size), 1,
            static_cast<int64_t>(MAX_HEADER_SIZE_LIMIT)));
    }

    // 2. Logging Settings
    if (auto logging = tbl["logging"]) {
        config.logging.level = logging["level"].value_or(config.logging.level);
        config.logging.file = logging["file"].value_or(config.logging.file);
    }

    // The reaper counts whole seconds, a zero worker timeout would fire on every tick.
    if (config.server.worker_timeout.count() == 0) {
        throw ConfigError("server.worker_timeout must be at least one second");
    }
    if (config.server.write_timeout.count() == 0) {
        throw ConfigError("server.write_timeout must be at least one second");
    }
    if (config.server.necromancer_interval.count() == 0) {
        throw ConfigError("server.necromancer_interval must be at least one second");
    }
    return config;
}

}  // namespace

AppConfig ParseConfig(std::string_view document) {
    try {
        return FromTable(toml::parse(document));
    } catch (const toml::parse_error& err) {
        throw ConfigError("Config parse error: " + std::string(err.description()));
    }
}

AppConfig LoadConfig(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        spdlog::warn("Config file '{}' not found. Using defaults.", path);
        return AppConfig{};
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& err) {
        spdlog::critical("Failed to parse config file: {}", err.description());
        throw ConfigError("Config parse error: " + std::string(err.description()));
    }

    AppConfig config = FromTable(tbl);
    spdlog::info("Loaded configuration from {}", path);
    return config;
}

unsigned int ResolveWorkerCount(const ServerConfig& server) {
    if (server.workers != 0) {
        return server.workers;
    }
    return std::max(1U, std::thread::hardware_concurrency());
}

}  // namespace vireo::config
