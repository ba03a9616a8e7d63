#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "Connection.hpp"
#include "ConnectionRegistry.hpp"
#include "Listener.hpp"
#include "Router.hpp"
#include "ServerContext.hpp"
#include "Types.hpp"
#include "config.hpp"

namespace vireo::test {

using namespace std::chrono_literals;

inline core::Handler Text(std::string body, unsigned int status = 200) {
    return [body = std::move(body), status](core::Request&) -> asio::awaitable<core::Response> {
        co_return core::Response(body, status);
    };
}

// Runs one coroutine to completion on the given context and returns its result.
template <typename T>
T RunAwaitable(asio::io_context& ioc, asio::awaitable<T> task) {
    auto future = asio::co_spawn(ioc, std::move(task), asio::use_future);
    ioc.restart();
    ioc.run();
    return future.get();
}

// Polls pred until it holds or the timeout expires.
inline bool WaitFor(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 5s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

inline config::ServerConfig TestLimits() {
    config::ServerConfig limits;
    limits.address = "127.0.0.1";
    limits.port = 0;
    return limits;
}

// Asks the kernel for an unused loopback port, for servers that must bind by number.
inline std::uint16_t FreePort() {
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw std::runtime_error("socket() failed");
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    socklen_t len = sizeof(addr);
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        ::close(fd);
        throw std::runtime_error("could not reserve a port");
    }
    ::close(fd);
    return ntohs(addr.sin_port);
}

/**
 * @brief One worker's event loop on a background thread, listening on an ephemeral port.
 */
class TestServer {
   public:
    explicit TestServer(const core::Router& router, config::ServerConfig limits = TestLimits())
        : context_{std::move(limits), &router} {
        auto address = asio::ip::make_address(context_.limits.address);
        listener_ = std::make_shared<core::Listener>(ioc_, tcp::endpoint{address, 0}, context_,
                                                     registry_);
        port_ = listener_->local_endpoint().port();
        listener_->run();
        thread_ = std::thread([this] { ioc_.run(); });
    }

    ~TestServer() { stop(); }

    TestServer(const TestServer&) = delete;
    TestServer& operator=(const TestServer&) = delete;

    void stop() {
        if (!thread_.joinable()) {
            return;
        }
        run_on_loop([this] {
            listener_->stop();
            std::vector<worker::ConnectionRegistry::ConnectionPtr> open;
            registry_.for_each([&](const auto& c) { open.push_back(c); });
            for (auto& c : open) {
                c->close();
            }
        });
        ioc_.stop();
        thread_.join();
    }

    // Runs fn on the event loop thread and waits for it.
    void run_on_loop(std::function<void()> fn) {
        std::promise<void> done;
        asio::post(ioc_, [&] {
            fn();
            done.set_value();
        });
        done.get_future().wait();
    }

    std::uint16_t port() const noexcept { return port_; }
    worker::ConnectionRegistry& registry() noexcept { return registry_; }
    const ServerContext& context() const noexcept { return context_; }

   private:
    asio::io_context ioc_{1};
    ServerContext context_;
    worker::ConnectionRegistry registry_;
    std::shared_ptr<core::Listener> listener_;
    std::uint16_t port_ = 0;
    std::thread thread_;
};

struct ParsedResponse {
    unsigned int status = 0;
    std::map<std::string, std::string> headers;  // lower-case names
    std::string body;

    std::string header(const std::string& name) const {
        auto it = headers.find(name);
        return it == headers.end() ? std::string{} : it->second;
    }
};

/**
 * @brief Blocking loopback client with receive timeouts.
 */
class ClientConnection {
   public:
    explicit ClientConnection(std::uint16_t port, std::chrono::milliseconds timeout = 5s) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) {
            throw std::runtime_error("socket() failed");
        }
        timeval tv{};
        tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
        ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
            ::close(fd_);
            throw std::runtime_error("connect() failed");
        }
    }

    ~ClientConnection() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    ClientConnection(const ClientConnection&) = delete;
    ClientConnection& operator=(const ClientConnection&) = delete;

    void send(std::string_view data) {
        while (!data.empty()) {
            auto n = ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL);
            if (n <= 0) {
                throw std::runtime_error("send() failed");
            }
            data.remove_prefix(static_cast<std::size_t>(n));
        }
    }

    // One Content-Length framed response. status == 0 when the peer closed first.
    ParsedResponse read_response() {
        ParsedResponse res;
        std::size_t head_end;
        while ((head_end = buffer_.find("\r\n\r\n")) == std::string::npos) {
            if (!fill()) {
                return res;
            }
        }

        std::string_view head(buffer_.data(), head_end);
        auto line_end = head.find("\r\n");
        std::string_view status_line = head.substr(0, line_end);
        res.status = static_cast<unsigned int>(std::stoul(std::string(status_line.substr(9, 3))));

        std::size_t pos = line_end == std::string_view::npos ? head.size() : line_end + 2;
        while (pos < head.size()) {
            auto end = head.find("\r\n", pos);
            if (end == std::string_view::npos) {
                end = head.size();
            }
            std::string_view line = head.substr(pos, end - pos);
            auto colon = line.find(':');
            if (colon != std::string_view::npos) {
                std::string name(line.substr(0, colon));
                for (auto& c : name) {
                    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                }
                std::string_view value = line.substr(colon + 1);
                while (!value.empty() && value.front() == ' ') {
                    value.remove_prefix(1);
                }
                res.headers[name] = std::string(value);
            }
            pos = end + 2;
        }

        const std::size_t length = std::stoul(res.header("content-length").empty()
                                                  ? std::string("0")
                                                  : res.header("content-length"));
        const std::size_t body_start = head_end + 4;
        while (buffer_.size() < body_start + length) {
            if (!fill()) {
                res.status = 0;
                return res;
            }
        }
        res.body = buffer_.substr(body_start, length);
        buffer_.erase(0, body_start + length);
        return res;
    }

    // True when the server closed the connection without sending anything more.
    bool closed_by_peer() {
        if (!buffer_.empty()) {
            return false;
        }
        char c;
        auto n = ::recv(fd_, &c, 1, 0);
        if (n > 0) {
            buffer_.push_back(c);
        }
        return n == 0 || (n < 0 && errno == ECONNRESET);
    }

    int fd() const noexcept { return fd_; }

   private:
    bool fill() {
        char chunk[4096];  // NOLINT
        auto n = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (n <= 0) {
            return false;
        }
        buffer_.append(chunk, static_cast<std::size_t>(n));
        return true;
    }

    int fd_ = -1;
    std::string buffer_;
};

inline std::string Get(std::string_view path, std::string_view extra_headers = {}) {
    std::string req = "GET ";
    req += path;
    req += " HTTP/1.1\r\nHost: localhost\r\n";
    req += extra_headers;
    req += "\r\n";
    return req;
}

// Retries until something accepts on the port; nullptr after the timeout.
inline std::unique_ptr<ClientConnection> ConnectWhenListening(std::uint16_t port,
                                                              std::chrono::milliseconds timeout = 5s) {
    std::unique_ptr<ClientConnection> client;
    WaitFor(
        [&] {
            try {
                client = std::make_unique<ClientConnection>(port);
            } catch (const std::runtime_error&) {
                return false;
            }
            return true;
        },
        timeout);
    return client;
}

}  // namespace vireo::test
