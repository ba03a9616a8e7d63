#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <chrono>
#include <memory>

#include "ConnectionRegistry.hpp"
#include "Listener.hpp"
#include "Reaper.hpp"
#include "ServerContext.hpp"
#include "Types.hpp"
#include "config.hpp"

namespace vireo::worker {

/**
 * @brief Body of one worker process.
 *
 * @details
 * Owns a single-threaded event loop with its listener, connection registry and
 * Reaper. SIGTERM starts a graceful drain:
 * 1. close the acceptor and stop the Reaper;
 * 2. soft-stop every open connection;
 * 3. poll once per second until the registry is empty or the drain timeout passes;
 * 4. stop the event loop.
 */
class Worker {
   public:
    Worker(const config::ServerConfig& config, const core::Router& router,
           Reaper::KillFunction kill = {});
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    // Blocks until the worker has drained. Returns the process exit code.
    int run();

    // Same as receiving SIGTERM. Safe from any thread.
    void request_stop();

    tcp::endpoint local_endpoint() const { return listener_->local_endpoint(); }
    ConnectionRegistry& registry() noexcept { return registry_; }
    asio::io_context& io_context() noexcept { return ioc_; }

   private:
    asio::awaitable<void> drain();

    asio::io_context ioc_{1};
    ServerContext context_;
    ConnectionRegistry registry_;
    Reaper reaper_;
    asio::signal_set signals_;
    std::shared_ptr<core::Listener> listener_;
    bool draining_ = false;
};

}  // namespace vireo::worker
