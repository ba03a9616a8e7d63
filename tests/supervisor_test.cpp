#include <gtest/gtest.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "Logging.hpp"
#include "ProcessSupervisor.hpp"
#include "Router.hpp"
#include "WorkerProcess.hpp"
#include "test_util.hpp"

using namespace vireo;
using namespace vireo::supervisor;
using namespace std::chrono_literals;

namespace {

bool Reaped(pid_t pid) {
    errno = 0;
    return ::waitpid(pid, nullptr, WNOHANG) == -1 && errno == ECHILD;
}

}  // namespace

class SupervisorTest : public ::testing::Test {
   protected:
    SupervisorTest() {
        router_.route("/", test::Text("root"));
        config_ = test::TestLimits();
        config_.port = test::FreePort();
        config_.workers = 2;
        config_.necromancer_interval = 1s;
        config_.drain_timeout = 2s;
    }

    core::Router router_;
    config::ServerConfig config_;
};

TEST_F(SupervisorTest, StopFromAnotherThreadReapsEveryWorker) {
    ProcessSupervisor supervisor(config_, router_);
    auto exit_code = std::async(std::launch::async, [&] { return supervisor.run(); });

    ASSERT_TRUE(test::WaitFor([&] { return supervisor.worker_pids().size() == 2; }));
    const auto pids = supervisor.worker_pids();

    auto client = test::ConnectWhenListening(config_.port);
    ASSERT_NE(client, nullptr);
    client->send(test::Get("/"));
    EXPECT_EQ(client->read_response().body, "root");

    supervisor.stop();
    ASSERT_EQ(exit_code.wait_for(10s), std::future_status::ready);
    EXPECT_EQ(exit_code.get(), EXIT_SUCCESS);

    for (const pid_t pid : pids) {
        EXPECT_TRUE(Reaped(pid)) << "worker " << pid << " was not reaped";
    }
}

TEST(Logging, ForkedWorkerWritesItsOwnFile) {
    const auto dir = std::filesystem::temp_directory_path() /
                     ("vireo-logs-" + std::to_string(::getpid()));
    std::filesystem::create_directories(dir);
    const auto file = (dir / "vireo.log").string();

    logging::SetupLogging({.level = "info", .file = file});
    auto child = ForkWorker([] {
        logging::ReopenAfterFork();
        spdlog::info("worker log line");
        return 0;
    });
    const int status = child.wait();
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);

    EXPECT_TRUE(std::filesystem::exists(logging::PerProcessLogFile(file, child.pid())));

    logging::SetupLogging({.level = "info", .file = ""});
    std::filesystem::remove_all(dir);
}
