#include <gtest/gtest.h>
#include <signal.h>

#include <atomic>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <string>

#include "Connection.hpp"
#include "Reaper.hpp"
#include "Router.hpp"
#include "test_util.hpp"

using namespace vireo;
using namespace vireo::core;
using namespace std::chrono_literals;
using worker::Reaper;

namespace {

asio::awaitable<Response> Stuck(Request&) {
    asio::steady_timer timer(co_await asio::this_coro::executor);
    timer.expires_after(std::chrono::hours(1));
    co_await timer.async_wait(asio::use_awaitable);
    co_return Response("never");
}

constexpr std::size_t BIG_RESPONSE_SIZE = 32 * 1024 * 1024;

bool AnyWriting(worker::ConnectionRegistry& registry) {
    bool found = false;
    registry.for_each([&](const auto& c) { found = found || c->writing(); });
    return found;
}

bool AnyIn(worker::ConnectionRegistry& registry, ConnectionStatus status) {
    bool found = false;
    registry.for_each([&](const auto& c) { found = found || c->status() == status; });
    return found;
}

}  // namespace

class ReaperTest : public ::testing::Test {
   protected:
    ReaperTest() {
        router_.route("/", test::Text("root"));
        router_.route("/stuck", Stuck);
        router_.route("/big", test::Text(std::string(BIG_RESPONSE_SIZE, 'x')));
    }

    Router router_;
};

TEST_F(ReaperTest, IdleConnectionIsStopped) {
    test::TestServer server(router_);
    test::ClientConnection client(server.port());
    ASSERT_TRUE(test::WaitFor([&] { return server.registry().size() == 1; }));

    Reaper reaper(server.registry(), 1s, 60s, [] {});
    EXPECT_EQ(reaper.kill_idles(Reaper::Clock::now() + 2s), 1U);

    EXPECT_TRUE(client.closed_by_peer());
    EXPECT_TRUE(test::WaitFor([&] { return server.registry().empty(); }));
}

TEST_F(ReaperTest, RecentConnectionSurvives) {
    test::TestServer server(router_);
    test::ClientConnection client(server.port());
    ASSERT_TRUE(test::WaitFor([&] { return server.registry().size() == 1; }));

    Reaper reaper(server.registry(), 30s, 60s, [] {});
    EXPECT_EQ(reaper.kill_idles(Reaper::Clock::now()), 0U);

    client.send(test::Get("/"));
    EXPECT_EQ(client.read_response().status, 200U);
}

TEST_F(ReaperTest, ZeroKeepAliveTimeoutDisablesReaping) {
    test::TestServer server(router_);
    test::ClientConnection client(server.port());
    ASSERT_TRUE(test::WaitFor([&] { return server.registry().size() == 1; }));

    Reaper reaper(server.registry(), 0s, 60s, [] {});
    EXPECT_EQ(reaper.kill_idles(Reaper::Clock::now() + 1h), 0U);
    EXPECT_EQ(server.registry().size(), 1U);
}

TEST_F(ReaperTest, BusyConnectionIsNotIdle) {
    test::TestServer server(router_);
    test::ClientConnection client(server.port());
    client.send(test::Get("/stuck"));
    ASSERT_TRUE(test::WaitFor([&] { return AnyIn(server.registry(), ConnectionStatus::Processing); }));

    Reaper reaper(server.registry(), 1s, 60s, [] {});
    EXPECT_EQ(reaper.kill_idles(Reaper::Clock::now() + 1h), 0U);
}

TEST_F(ReaperTest, StuckHandlerTriggersTheKill) {
    test::TestServer server(router_);
    test::ClientConnection client(server.port());
    client.send(test::Get("/stuck"));
    ASSERT_TRUE(test::WaitFor([&] { return AnyIn(server.registry(), ConnectionStatus::Processing); }));

    int kills = 0;
    Reaper reaper(server.registry(), 30s, 3s, [&] { ++kills; });

    EXPECT_FALSE(reaper.check_workers(Reaper::Clock::now()));
    EXPECT_EQ(kills, 0);
    EXPECT_TRUE(reaper.check_workers(Reaper::Clock::now() + 3s));
    EXPECT_EQ(kills, 1);
}

TEST_F(ReaperTest, ClientThatStopsReadingIsClosedWithoutKillingTheWorker) {
    auto limits = test::TestLimits();
    limits.write_timeout = 1s;
    test::TestServer server(router_, limits);

    // The client never reads, so the response fills both socket buffers
    test::ClientConnection client(server.port());
    client.send(test::Get("/big"));
    ASSERT_TRUE(test::WaitFor([&] { return AnyWriting(server.registry()); }));

    int kills = 0;
    Reaper reaper(server.registry(), 30s, 1s, [&] { ++kills; });
    EXPECT_FALSE(reaper.check_workers(Reaper::Clock::now() + 1h));
    EXPECT_EQ(kills, 0);

    EXPECT_TRUE(test::WaitFor([&] { return server.registry().empty(); }, 10s));
    EXPECT_EQ(kills, 0);
}

TEST_F(ReaperTest, IdleConnectionsNeverTriggerTheKill) {
    test::TestServer server(router_);
    test::ClientConnection client(server.port());
    ASSERT_TRUE(test::WaitFor([&] { return server.registry().size() == 1; }));

    int kills = 0;
    Reaper reaper(server.registry(), 30s, 1s, [&] { ++kills; });
    EXPECT_FALSE(reaper.check_workers(Reaper::Clock::now() + 1h));
    EXPECT_EQ(kills, 0);
}

TEST_F(ReaperTest, WorkerCheckRunsEveryWorkerTimeoutTicks) {
    test::TestServer server(router_);
    test::ClientConnection client(server.port());
    client.send(test::Get("/stuck"));
    ASSERT_TRUE(test::WaitFor([&] { return AnyIn(server.registry(), ConnectionStatus::Processing); }));

    int kills = 0;
    Reaper reaper(server.registry(), 0s, 3s, [&] { ++kills; });
    const auto late = Reaper::Clock::now() + 1h;

    reaper.tick(late);
    reaper.tick(late);
    EXPECT_EQ(kills, 0);
    reaper.tick(late);
    EXPECT_EQ(kills, 1);
    EXPECT_EQ(reaper.ticks(), 3U);
}

TEST_F(ReaperTest, IdleCheckRunsEveryKeepAliveTicks) {
    test::TestServer server(router_);
    test::ClientConnection client(server.port());
    ASSERT_TRUE(test::WaitFor([&] { return server.registry().size() == 1; }));

    Reaper reaper(server.registry(), 2s, 60s, [] {});
    const auto late = Reaper::Clock::now() + 1h;

    reaper.tick(late);
    EXPECT_EQ(server.registry().size(), 1U);
    reaper.tick(late);
    EXPECT_TRUE(client.closed_by_peer());
}

TEST_F(ReaperTest, ThreadTicksUntilStopped) {
    worker::ConnectionRegistry registry;
    Reaper reaper(registry, 1s, 1s, [] {}, 10ms);

    reaper.start();
    EXPECT_TRUE(test::WaitFor([&] { return reaper.ticks() >= 3; }));
    reaper.stop();

    const auto frozen = reaper.ticks();
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(reaper.ticks(), frozen);
}

TEST_F(ReaperTest, DefaultKillTakesTheProcessDown) {
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    EXPECT_EXIT(
        {
            test::TestServer server(router_);
            test::ClientConnection client(server.port());
            client.send(test::Get("/stuck"));
            test::WaitFor([&] { return AnyIn(server.registry(), ConnectionStatus::Processing); });

            Reaper reaper(server.registry(), 30s, 1s);
            reaper.check_workers(Reaper::Clock::now() + 1h);
        },
        ::testing::KilledBySignal(SIGKILL), "");
}
