#include "ProcessSupervisor.hpp"

#include <signal.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

#include <boost/asio.hpp>
#include <cstdlib>

#include "Logging.hpp"
#include "Necromancer.hpp"
#include "Worker.hpp"
#include "WorkerPool.hpp"
#include "WorkerProcess.hpp"

namespace vireo::supervisor {

struct ProcessSupervisor::Impl {
    const config::ServerConfig config_;
    const core::Router& router_;

    asio::io_context ioc_;
    asio::signal_set signals_;

    // Components
    WorkerPool pool_;
    Necromancer necromancer_;

    Impl(const config::ServerConfig& config, const core::Router& router)
        : config_(config),
          router_(router),
          signals_(ioc_, SIGINT, SIGTERM),
          pool_([this]() { return spawn(); }),
          necromancer_(pool_, config_.necromancer_interval) {}

    WorkerProcess spawn() {
        return ForkWorker([this]() {
            // The parent's reactor and signal pipe must not be shared with the child
            ioc_.notify_fork(asio::execution_context::fork_child);
            logging::ReopenAfterFork();
            worker::Worker worker(config_, router_);
            return worker.run();
        });
    }

    int Run() {
        const auto count = config::ResolveWorkerCount(config_);

        // 1. Graceful Shutdown Signal
        signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            spdlog::info("Stop signal ({}) received. Shutting down...", signal_number);
            Shutdown();
        });

        // 2. Workers and their keeper
        pool_.start(count);
        necromancer_.start();
        spdlog::info("Vireo serving on {}:{} with {} workers (supervisor pid {})",
                     config_.address, config_.port, count, ::getpid());

        // 3. Run until a stop signal
        ioc_.run();

        spdlog::info("Server shutdown complete.");
        return EXIT_SUCCESS;
    }

    void Shutdown() {
        necromancer_.stop();
        pool_.terminate_all(SIGTERM);
        pool_.wait_all();
        ioc_.stop();
    }
};

ProcessSupervisor::ProcessSupervisor(const config::ServerConfig& config,
                                     const core::Router& router)
    : pImpl_(std::make_unique<Impl>(config, router)) {}

ProcessSupervisor::~ProcessSupervisor() = default;

int ProcessSupervisor::run() { return pImpl_->Run(); }

void ProcessSupervisor::stop() {
    asio::post(pImpl_->ioc_, [this]() {
        pImpl_->signals_.cancel();
        pImpl_->Shutdown();
    });
}

std::vector<pid_t> ProcessSupervisor::worker_pids() const { return pImpl_->pool_.pids(); }

}  // namespace vireo::supervisor
