#include "Necromancer.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace vireo::supervisor {

Necromancer::Necromancer(WorkerPool& pool, std::chrono::milliseconds interval)
    : pool_(pool), interval_(interval) {}

Necromancer::~Necromancer() { stop(); }

void Necromancer::start() {
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::jthread([this](const std::stop_token& token) { run(token); });
    spdlog::debug("[Necromancer] Watching {} workers every {}ms", pool_.size(), interval_.count());
}

void Necromancer::stop() {
    if (!thread_.joinable()) {
        return;
    }
    thread_.request_stop();
    cv_.notify_all();
    thread_.join();
}

std::size_t Necromancer::tick() {
    try {
        return pool_.replace_dead();
    } catch (const std::system_error& e) {
        // fork() failed; the next pass tries again
        spdlog::error("[Necromancer] Could not respawn a worker: {}", e.what());
        return 0;
    }
}

void Necromancer::run(const std::stop_token& token) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!token.stop_requested()) {
        cv_.wait_for(lock, token, interval_, [] { return false; });
        if (token.stop_requested()) {
            break;
        }
        lock.unlock();
        tick();
        lock.lock();
    }
}

}  // namespace vireo::supervisor
