#pragma once

#include <atomic>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstddef>
#include <memory>

#include "ServerContext.hpp"
#include "Types.hpp"

namespace vireo::worker {
class ConnectionRegistry;
}

namespace vireo::core {

/**
 * @brief The TCP connection acceptor of one worker process.
 * @details
 * **Architecture: one acceptor per worker, one shared port**
 * - Every worker binds the same address with `SO_REUSEPORT`; the kernel spreads
 *   incoming connections across the workers' accept queues.
 * - Accepted sockets stay on the worker's single `io_context`; each one becomes a
 *   Connection registered in the worker's ConnectionRegistry.
 * - A failed accept (EMFILE, ENFILE, ENOBUFS...) leaves the pending connection in the
 *   queue, so the loop sleeps ACCEPT_BACKOFF before retrying instead of spinning.
 */
class Listener : public std::enable_shared_from_this<Listener> {
   public:
    // @throws boost::system::system_error when the address cannot be bound.
    Listener(asio::io_context& ioc, const tcp::endpoint& endpoint, const ServerContext& context,
             worker::ConnectionRegistry& registry);

    // Start accepting incoming connections
    void run();

    // Close the acceptor; connections already accepted are left alone.
    void stop();

    tcp::endpoint local_endpoint() const;

    // Failed accepts since construction
    std::size_t accept_errors() const noexcept { return accept_errors_.load(); }

   private:
    asio::awaitable<void> do_accept();

    tcp::acceptor acceptor_;
    asio::steady_timer backoff_;
    std::atomic<std::size_t> accept_errors_{0};
    const ServerContext& context_;
    worker::ConnectionRegistry& registry_;
};

}  // namespace vireo::core
