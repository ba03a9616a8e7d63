#include "WorkerPool.hpp"

#include <spdlog/spdlog.h>
#include <sys/wait.h>

#include <stdexcept>
#include <utility>

namespace vireo::supervisor {

WorkerPool::WorkerPool(SpawnFunction spawn) : spawn_(std::move(spawn)) {
    if (!spawn_) {
        throw std::invalid_argument("WorkerPool requires a spawn function");
    }
}

void WorkerPool::start(std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    workers_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        workers_.push_back(spawn_());
        spdlog::debug("[Supervisor] Spawned worker {}", workers_.back().pid());
    }
}

std::size_t WorkerPool::replace_dead() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t replaced = 0;

    for (auto& worker : workers_) {
        if (worker.is_alive()) {
            continue;
        }
        const pid_t dead = worker.pid();
        const int status = worker.exit_status().value_or(0);
        worker = spawn_();
        ++replaced;

        if (WIFSIGNALED(status)) {
            spdlog::warn("[Necromancer] Worker {} killed by signal {}, replaced by {}", dead,
                         WTERMSIG(status), worker.pid());
        } else {
            spdlog::warn("[Necromancer] Worker {} exited with code {}, replaced by {}", dead,
                         WEXITSTATUS(status), worker.pid());
        }
    }
    return replaced;
}

void WorkerPool::terminate_all(int signo) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& worker : workers_) {
        worker.terminate(signo);
    }
}

void WorkerPool::wait_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& worker : workers_) {
        worker.wait();
    }
}

std::vector<pid_t> WorkerPool::pids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<pid_t> result;
    result.reserve(workers_.size());
    for (const auto& worker : workers_) {
        result.push_back(worker.pid());
    }
    return result;
}

std::size_t WorkerPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

}  // namespace vireo::supervisor
