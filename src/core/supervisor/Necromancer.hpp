#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

#include "WorkerPool.hpp"

namespace vireo::supervisor {

/**
 * @brief Supervisor-side thread that brings dead workers back.
 * Every interval it replaces each dead worker through the pool's spawn function,
 * so the pool never shrinks.
 */
class Necromancer {
   public:
    Necromancer(WorkerPool& pool, std::chrono::milliseconds interval);
    ~Necromancer();

    Necromancer(const Necromancer&) = delete;
    Necromancer& operator=(const Necromancer&) = delete;

    void start();
    void stop();

    // One pass over the pool. Returns how many workers were replaced.
    std::size_t tick();

   private:
    void run(const std::stop_token& token);

    WorkerPool& pool_;
    std::chrono::milliseconds interval_;

    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::jthread thread_;
};

}  // namespace vireo::supervisor
