#include <gtest/gtest.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <vector>

#include "Necromancer.hpp"
#include "WorkerPool.hpp"
#include "WorkerProcess.hpp"
#include "test_util.hpp"

using namespace vireo;
using namespace vireo::supervisor;
using namespace std::chrono_literals;

namespace {

WorkerProcess SpawnSleeper() {
    return ForkWorker([] {
        ::pause();
        return 0;
    });
}

bool Contains(const std::vector<pid_t>& pids, pid_t pid) {
    return std::find(pids.begin(), pids.end(), pid) != pids.end();
}

}  // namespace

class NecromancerTest : public ::testing::Test {
   protected:
    void TearDown() override {
        pool_.terminate_all(SIGKILL);
        pool_.wait_all();
    }

    WorkerPool pool_{SpawnSleeper};
};

TEST(WorkerProcess, ExitCodeIsReported) {
    auto child = ForkWorker([] { return 3; });
    const int status = child.wait();
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 3);
    EXPECT_FALSE(child.is_alive());
}

TEST(WorkerProcess, UncaughtExceptionExitsWithOne) {
    auto child = ForkWorker([]() -> int { throw std::runtime_error("boom"); });
    const int status = child.wait();
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 1);
}

TEST(WorkerProcess, TerminateSignalsALiveChild) {
    auto child = SpawnSleeper();
    EXPECT_TRUE(child.is_alive());
    child.terminate(SIGTERM);
    const int status = child.wait();
    ASSERT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(WTERMSIG(status), SIGTERM);

    // Reaped already; a second terminate is a no-op
    EXPECT_NO_THROW(child.terminate(SIGTERM));
}

TEST(WorkerPool, RequiresASpawnFunction) {
    EXPECT_THROW(WorkerPool(WorkerPool::SpawnFunction{}), std::invalid_argument);
}

TEST_F(NecromancerTest, DeadWorkerIsReplaced) {
    pool_.start(4);
    auto before = pool_.pids();
    ASSERT_EQ(before.size(), 4U);

    const pid_t victim = before[1];
    ASSERT_EQ(::kill(victim, SIGKILL), 0);

    Necromancer necromancer(pool_, 1s);
    std::size_t replaced = 0;
    ASSERT_TRUE(test::WaitFor([&] {
        replaced += necromancer.tick();
        return replaced == 1;
    }));

    auto after = pool_.pids();
    EXPECT_EQ(after.size(), 4U);
    EXPECT_FALSE(Contains(after, victim));
    EXPECT_EQ(after[0], before[0]);
    EXPECT_EQ(after[2], before[2]);
    EXPECT_EQ(after[3], before[3]);
    for (pid_t pid : after) {
        EXPECT_EQ(::kill(pid, 0), 0) << "pid " << pid << " is not running";
    }
}

TEST_F(NecromancerTest, HealthyPoolIsLeftAlone) {
    pool_.start(2);
    auto before = pool_.pids();

    Necromancer necromancer(pool_, 1s);
    EXPECT_EQ(necromancer.tick(), 0U);
    EXPECT_EQ(pool_.pids(), before);
}

TEST_F(NecromancerTest, BackgroundThreadKeepsThePoolFull) {
    pool_.start(3);
    const pid_t victim = pool_.pids().front();

    Necromancer necromancer(pool_, 50ms);
    necromancer.start();
    ASSERT_EQ(::kill(victim, SIGKILL), 0);

    EXPECT_TRUE(test::WaitFor([&] { return !Contains(pool_.pids(), victim); }));
    necromancer.stop();
    EXPECT_EQ(pool_.size(), 3U);
}
