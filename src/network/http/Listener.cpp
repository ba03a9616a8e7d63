#include "Listener.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>

#include "Connection.hpp"
#include "ConnectionRegistry.hpp"

namespace vireo::core {

namespace {

constexpr std::chrono::milliseconds ACCEPT_BACKOFF{100};

// SO_REUSEPORT has no portable Asio option
using reuse_port = asio::detail::socket_option::boolean<SOL_SOCKET, SO_REUSEPORT>;

void fail(beast::error_code ec, const char* what) {
    if (ec != beast::errc::not_connected && ec != asio::error::eof &&
        ec != asio::error::connection_reset) {
        spdlog::error("[Listener] {} : {}", what, ec.message());
    }
}

}  // namespace

Listener::Listener(asio::io_context& ioc, const tcp::endpoint& endpoint,
                   const ServerContext& context, worker::ConnectionRegistry& registry)
    : acceptor_(ioc), backoff_(ioc), context_(context), registry_(registry) {
    acceptor_.open(endpoint.protocol());

    // SO_REUSEADDR avoids "Address already in use" while old sockets sit in TIME_WAIT.
    acceptor_.set_option(asio::socket_base::reuse_address(true));
    // SO_REUSEPORT lets every worker process bind the same port.
    acceptor_.set_option(reuse_port(true));

    acceptor_.bind(endpoint);
    acceptor_.listen(context_.limits.backlog);

    spdlog::debug("Listener successfully bound to {} {}", endpoint.address().to_string(),
                  acceptor_.local_endpoint().port());
}

void Listener::run() {
    spdlog::debug("Starting to accept connections..");

    // fire and forget coroutine and continue listening
    asio::co_spawn(
        acceptor_.get_executor(), [this, self = shared_from_this()]() { return do_accept(); },
        asio::detached);
}

void Listener::stop() {
    beast::error_code ec;
    backoff_.cancel();
    acceptor_.close(ec);
    if (ec) {
        fail(ec, "close");
    }
}

tcp::endpoint Listener::local_endpoint() const { return acceptor_.local_endpoint(); }

asio::awaitable<void> Listener::do_accept() {
    for (;;) {
        auto [ec, socket] = co_await acceptor_.async_accept(asio::as_tuple(asio::use_awaitable));

        if (ec) {
            if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
                break;
            }
            ++accept_errors_;
            fail(ec, "accept");

            backoff_.expires_after(ACCEPT_BACKOFF);
            co_await backoff_.async_wait(asio::as_tuple(asio::use_awaitable));
            continue;
        }

        beast::error_code opt_ec;
        // Disable Nagle (TCP_NODELAY) for lower latency
        socket.set_option(tcp::no_delay(true), opt_ec);

        try {
            auto connection = std::make_shared<Connection>(std::move(socket), context_, &registry_);
            registry_.add(connection);
            connection->run();
        } catch (const std::exception& e) {
            spdlog::error("[Listener] Failed to set up connection: {}", e.what());
        }
    }
    spdlog::debug("[Listener] Accept loop finished");
}

}  // namespace vireo::core
