#pragma once

#include <sys/types.h>

#include <memory>
#include <vector>

#include "Router.hpp"
#include "config.hpp"

namespace vireo::supervisor {

/**
 * @brief Parent process facade.
 * Forks the worker pool, keeps it full through the Necromancer, and on SIGINT or
 * SIGTERM stops the Necromancer, sends SIGTERM to every worker and reaps them.
 */
class ProcessSupervisor {
   public:
    ProcessSupervisor(const config::ServerConfig& config, const core::Router& router);
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    // Blocks until a stop signal has been handled and every worker has exited.
    int run();

    // Same as receiving SIGTERM. Safe from any thread.
    void stop();

    std::vector<pid_t> worker_pids() const;

   private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace vireo::supervisor
