#include "Worker.hpp"

#include <signal.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <vector>

#include "Connection.hpp"

namespace vireo::worker {

namespace {

constexpr std::chrono::seconds DRAIN_POLL{1};

}  // namespace

Worker::Worker(const config::ServerConfig& config, const core::Router& router,
               Reaper::KillFunction kill)
    : context_{config, &router},
      reaper_(registry_, config.keep_alive_timeout, config.worker_timeout, std::move(kill)),
      signals_(ioc_, SIGTERM) {
    auto address = asio::ip::make_address(config.address);
    listener_ = std::make_shared<core::Listener>(ioc_, tcp::endpoint{address, config.port},
                                                 context_, registry_);
}

Worker::~Worker() { reaper_.stop(); }

int Worker::run() {
    spdlog::info("[Worker {}] Listening on {}:{}", ::getpid(),
                 listener_->local_endpoint().address().to_string(),
                 listener_->local_endpoint().port());

    signals_.async_wait([this](const beast::error_code& ec, int signo) {
        if (ec) {
            return;
        }
        spdlog::info("[Worker {}] Received signal {}, draining", ::getpid(), signo);
        request_stop();
    });

    listener_->run();
    reaper_.start();

    try {
        ioc_.run();
    } catch (const std::exception& e) {
        spdlog::critical("[Worker {}] Event loop crashed: {}", ::getpid(), e.what());
        reaper_.stop();
        return 1;
    }

    reaper_.stop();
    spdlog::info("[Worker {}] Stopped", ::getpid());
    return 0;
}

void Worker::request_stop() {
    asio::post(ioc_, [this]() {
        if (draining_) {
            return;
        }
        draining_ = true;
        asio::co_spawn(ioc_, drain(), asio::detached);
    });
}

asio::awaitable<void> Worker::drain() {
    // 1. No new connections, no more reaping
    listener_->stop();
    signals_.cancel();
    reaper_.stop();

    // 2. Soft-stop what is open; busy connections close after their response
    std::vector<ConnectionRegistry::ConnectionPtr> open;
    registry_.for_each([&](const ConnectionRegistry::ConnectionPtr& c) { open.push_back(c); });
    for (auto& connection : open) {
        connection->stop();
    }
    open.clear();

    // 3. Wait for them, bounded by the drain timeout
    asio::steady_timer poll(ioc_);
    const auto deadline = std::chrono::steady_clock::now() + context_.limits.drain_timeout;
    while (!registry_.empty() && std::chrono::steady_clock::now() < deadline) {
        poll.expires_after(DRAIN_POLL);
        co_await poll.async_wait(asio::as_tuple(asio::use_awaitable));
    }
    if (!registry_.empty()) {
        spdlog::warn("[Worker {}] Drain timeout, {} connections still open", ::getpid(),
                     registry_.size());
    }

    // 4. Done
    ioc_.stop();
}

}  // namespace vireo::worker
