#include "Logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <unistd.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vireo::logging {

namespace {

// Set by SetupLogging, read again by ReopenAfterFork in each worker
std::optional<config::LoggingConfig>& ActiveConfig() {
    static std::optional<config::LoggingConfig> config;
    return config;
}

void InstallLogger(const config::LoggingConfig& cfg, const std::string& file) {
    const auto level = ParseLevel(cfg.level);
    std::vector<spdlog::sink_ptr> sinks;
    std::string file_error;

    // A. Console Sink
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(level);
    sinks.push_back(console_sink);

    // B. Rotating File Sink (Max 5MB, 3 files)
    if (!file.empty()) {
        constexpr size_t MAX_SIZE = 1024 * 1024 * 5;
        constexpr size_t MAX_FILES = 3;
        try {
            auto file_sink =
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, MAX_SIZE, MAX_FILES);
            file_sink->set_level(spdlog::level::trace);
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            // Console logging still works; a read-only cwd must not stop the server.
            file_error = e.what();
        }
    }

    // C. Register Logger
    auto logger = std::make_shared<spdlog::logger>("vireo", sinks.begin(), sinks.end());
    spdlog::drop("vireo");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    // D. Global Formatting
    // No flush_every(): its background thread would not survive fork().
    spdlog::set_level(level);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [pid %P] [thread %t] %v");
    spdlog::flush_on(level);

    if (!file_error.empty()) {
        spdlog::warn("File logging disabled: {}", file_error);
    }
}

}  // namespace

spdlog::level::level_enum ParseLevel(std::string_view name) {
    auto level = spdlog::level::from_str(std::string(name));
    // from_str answers "off" for anything it does not know
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

void SetupLogging(const config::LoggingConfig& cfg) {
    ActiveConfig() = cfg;
    InstallLogger(cfg, cfg.file);
}

void ReopenAfterFork() {
    const auto& cfg = ActiveConfig();
    if (!cfg || cfg->file.empty()) {
        return;
    }
    InstallLogger(*cfg, PerProcessLogFile(cfg->file, ::getpid()));
}

std::string PerProcessLogFile(const std::string& file, pid_t pid) {
    const std::filesystem::path path(file);
    const auto name = path.stem().string() + "." + std::to_string(pid) + path.extension().string();
    return (path.parent_path() / name).string();
}

}  // namespace vireo::logging
