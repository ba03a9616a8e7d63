#include "WorkerProcess.hpp"

#include <signal.h>
#include <spdlog/spdlog.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <system_error>
#include <utility>

namespace vireo::supervisor {

WorkerProcess::WorkerProcess(WorkerProcess&& other) noexcept
    : pid_(std::exchange(other.pid_, -1)), status_(std::exchange(other.status_, std::nullopt)) {}

WorkerProcess& WorkerProcess::operator=(WorkerProcess&& other) noexcept {
    if (this != &other) {
        pid_ = std::exchange(other.pid_, -1);
        status_ = std::exchange(other.status_, std::nullopt);
    }
    return *this;
}

bool WorkerProcess::is_alive() {
    if (pid_ <= 0 || status_) {
        return false;
    }

    int status = 0;
    pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == 0) {
        return true;
    }
    if (result == pid_) {
        status_ = status;
        return false;
    }
    // ECHILD: someone else reaped it
    status_ = 0;
    return false;
}

void WorkerProcess::terminate(int signo) {
    if (!is_alive()) {
        return;
    }
    if (::kill(pid_, signo) != 0 && errno != ESRCH) {
        spdlog::warn("[Supervisor] kill({}, {}) failed: {}", pid_, signo,
                     std::generic_category().message(errno));
    }
}

int WorkerProcess::wait() {
    if (pid_ <= 0) {
        return 0;
    }
    while (!status_) {
        int status = 0;
        pid_t result = ::waitpid(pid_, &status, 0);
        if (result == pid_) {
            status_ = status;
        } else if (result < 0 && errno != EINTR) {
            status_ = 0;
        }
    }
    return *status_;
}

WorkerProcess ForkWorker(const std::function<int()>& body) {
    // Buffered log lines would otherwise be written twice
    spdlog::default_logger()->flush();

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::system_error(errno, std::generic_category(), "fork");
    }
    if (pid > 0) {
        return WorkerProcess(pid);
    }

    // Child
    int code = 1;
    try {
        code = body();
    } catch (const std::exception& e) {
        spdlog::critical("[Worker {}] Fatal: {}", ::getpid(), e.what());
    }
    spdlog::default_logger()->flush();
    std::_Exit(code);
}

}  // namespace vireo::supervisor
