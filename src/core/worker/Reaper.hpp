#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

#include "ConnectionRegistry.hpp"

namespace vireo::worker {

/**
 * @brief Per-worker watchdog thread.
 *
 * @details
 * Wakes once per tick and, on its own schedule:
 * - every `keep_alive_timeout` ticks, soft-stops Pending connections idle for longer
 *   than `keep_alive_timeout` (disabled when that timeout is zero);
 * - every `worker_timeout` ticks, kills the whole worker process when a Processing
 *   connection has seen no activity for `worker_timeout` (a handler is stuck and the
 *   event loop cannot be trusted any more).
 *
 * The Reaper never touches a socket: stops are posted onto the connection's executor.
 */
class Reaper {
   public:
    using Clock = std::chrono::steady_clock;
    using KillFunction = std::function<void()>;

    Reaper(ConnectionRegistry& registry, std::chrono::seconds keep_alive_timeout,
           std::chrono::seconds worker_timeout, KillFunction kill = {},
           std::chrono::milliseconds tick = std::chrono::seconds(1));
    ~Reaper();

    Reaper(const Reaper&) = delete;
    Reaper& operator=(const Reaper&) = delete;

    void start();
    void stop();

    // One scheduler step: advances the counter and runs whatever is due.
    void tick(Clock::time_point now = Clock::now());

    // Posts stop() for every idle Pending connection. Returns how many.
    std::size_t kill_idles(Clock::time_point now);

    // Returns true when a stuck connection was found and the kill function ran.
    bool check_workers(Clock::time_point now);

    std::uint64_t ticks() const noexcept { return counter_; }

   private:
    void run(const std::stop_token& token);

    ConnectionRegistry& registry_;
    std::chrono::seconds keep_alive_timeout_;
    std::chrono::seconds worker_timeout_;
    KillFunction kill_;
    std::chrono::milliseconds tick_;

    std::atomic<std::uint64_t> counter_{0};

    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::jthread thread_;
};

}  // namespace vireo::worker
