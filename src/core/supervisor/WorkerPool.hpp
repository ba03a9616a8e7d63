#pragma once

#include <sys/types.h>

#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>

#include "WorkerProcess.hpp"

namespace vireo::supervisor {

/**
 * @brief Fixed-size list of live worker processes.
 * Shared by the supervisor thread and the Necromancer thread, hence the mutex.
 */
class WorkerPool {
   public:
    using SpawnFunction = std::function<WorkerProcess()>;

    explicit WorkerPool(SpawnFunction spawn);

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void start(std::size_t count);

    // Replaces every dead worker in place. Returns how many were replaced.
    std::size_t replace_dead();

    void terminate_all(int signo);
    void wait_all();

    std::vector<pid_t> pids() const;
    std::size_t size() const;

   private:
    SpawnFunction spawn_;
    mutable std::mutex mutex_;
    std::vector<WorkerProcess> workers_;
};

}  // namespace vireo::supervisor
