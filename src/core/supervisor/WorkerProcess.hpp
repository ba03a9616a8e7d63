#pragma once

#include <sys/types.h>

#include <functional>
#include <optional>

namespace vireo::supervisor {

/**
 * @brief Handle on one forked worker process, owned by the supervisor.
 * Not copyable: exactly one handle reaps a given pid.
 */
class WorkerProcess {
   public:
    explicit WorkerProcess(pid_t pid) : pid_(pid) {}
    ~WorkerProcess() = default;

    WorkerProcess(const WorkerProcess&) = delete;
    WorkerProcess& operator=(const WorkerProcess&) = delete;
    WorkerProcess(WorkerProcess&& other) noexcept;
    WorkerProcess& operator=(WorkerProcess&& other) noexcept;

    pid_t pid() const noexcept { return pid_; }

    // Non-blocking; reaps the child as soon as it has exited.
    bool is_alive();

    // Sends a signal if the process is still running.
    void terminate(int signo);

    // Blocks until the process exits. Returns the raw wait status.
    int wait();

    // Raw wait status once reaped
    std::optional<int> exit_status() const noexcept { return status_; }

   private:
    pid_t pid_;
    std::optional<int> status_;
};

/**
 * @brief Forks a child that runs `body` and exits with its return value.
 * The child flushes the logger and leaves through `_Exit`, skipping the parent's
 * static destructors and atexit handlers.
 * @throws std::system_error when fork() fails.
 */
WorkerProcess ForkWorker(const std::function<int()>& body);

}  // namespace vireo::supervisor
