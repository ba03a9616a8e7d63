#pragma once

#include <spdlog/common.h>
#include <sys/types.h>

#include <string>
#include <string_view>

#include "config.hpp"

namespace vireo::logging {

/**
 * @brief Installs the process-wide "vireo" logger (console + rotating file).
 * Must run before the first worker is forked. The configuration is remembered for
 * ReopenAfterFork().
 */
void SetupLogging(const config::LoggingConfig& cfg);

/**
 * @brief Called in a freshly forked worker: swaps the inherited rotating file sink for
 * one on the worker's own file, so no two processes rotate the same file.
 * Does nothing when file logging is off.
 */
void ReopenAfterFork();

// "logs/vireo.log" -> "logs/vireo.<pid>.log"
std::string PerProcessLogFile(const std::string& file, pid_t pid);

// Maps "trace".."critical"/"off" to a spdlog level, falling back to info.
spdlog::level::level_enum ParseLevel(std::string_view name);

}  // namespace vireo::logging
