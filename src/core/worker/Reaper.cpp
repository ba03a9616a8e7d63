#include "Reaper.hpp"

#include <signal.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

#include <boost/asio/post.hpp>

#include "Connection.hpp"

namespace vireo::worker {

namespace {

void KillSelf() {
    spdlog::critical("[Reaper] Worker {} is stuck, killing it", ::getpid());
    spdlog::default_logger()->flush();
    ::kill(::getpid(), SIGKILL);
}

}  // namespace

Reaper::Reaper(ConnectionRegistry& registry, std::chrono::seconds keep_alive_timeout,
               std::chrono::seconds worker_timeout, KillFunction kill,
               std::chrono::milliseconds tick)
    : registry_(registry),
      keep_alive_timeout_(keep_alive_timeout),
      worker_timeout_(worker_timeout),
      kill_(kill ? std::move(kill) : KillFunction(KillSelf)),
      tick_(tick) {}

Reaper::~Reaper() { stop(); }

void Reaper::start() {
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::jthread([this](const std::stop_token& token) { run(token); });
    spdlog::debug("[Reaper] Started (keep-alive {}s, worker timeout {}s)",
                  keep_alive_timeout_.count(), worker_timeout_.count());
}

void Reaper::stop() {
    if (!thread_.joinable()) {
        return;
    }
    thread_.request_stop();
    cv_.notify_all();
    thread_.join();
    spdlog::debug("[Reaper] Stopped");
}

void Reaper::run(const std::stop_token& token) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!token.stop_requested()) {
        // Interruptible sleep: returns early when a stop is requested
        cv_.wait_for(lock, token, tick_, [] { return false; });
        if (token.stop_requested()) {
            break;
        }
        lock.unlock();
        tick();
        lock.lock();
    }
}

void Reaper::tick(Clock::time_point now) {
    const std::uint64_t count = ++counter_;

    const auto keep_alive_ticks = static_cast<std::uint64_t>(keep_alive_timeout_.count());
    if (keep_alive_ticks > 0 && count % keep_alive_ticks == 0) {
        kill_idles(now);
    }

    const auto worker_ticks = static_cast<std::uint64_t>(worker_timeout_.count());
    if (worker_ticks > 0 && count % worker_ticks == 0) {
        check_workers(now);
    }
}

std::size_t Reaper::kill_idles(Clock::time_point now) {
    if (keep_alive_timeout_.count() == 0) {
        return 0;
    }

    std::size_t stopped = 0;
    registry_.for_each([&](const ConnectionRegistry::ConnectionPtr& connection) {
        if (connection->status() != core::ConnectionStatus::Pending) {
            return;
        }
        if (now - connection->last_activity() <= keep_alive_timeout_) {
            return;
        }
        // The connection belongs to the event loop thread
        asio::post(connection->get_executor(), [connection]() { connection->stop(); });
        ++stopped;
    });

    if (stopped > 0) {
        spdlog::debug("[Reaper] Stopping {} idle connections", stopped);
    }
    return stopped;
}

bool Reaper::check_workers(Clock::time_point now) {
    bool stuck = false;
    registry_.for_each([&](const ConnectionRegistry::ConnectionPtr& connection) {
        // A blocked write is bounded by the connection's own write deadline
        if (connection->status() == core::ConnectionStatus::Processing &&
            !connection->writing() && now - connection->last_activity() >= worker_timeout_) {
            stuck = true;
        }
    });

    if (stuck) {
        kill_();
    }
    return stuck;
}

}  // namespace vireo::worker
