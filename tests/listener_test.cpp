#include <fcntl.h>
#include <gtest/gtest.h>
#include <sys/resource.h>
#include <sys/wait.h>

#include <cerrno>
#include <chrono>
#include <memory>

#include "ConnectionRegistry.hpp"
#include "Listener.hpp"
#include "Router.hpp"
#include "WorkerProcess.hpp"
#include "test_util.hpp"

using namespace vireo;
using namespace vireo::core;
using namespace std::chrono_literals;

namespace {

constexpr rlim_t FD_LIMIT = 256;

// Uses up every descriptor the process may still open.
bool ExhaustDescriptors() {
    rlimit limit{};
    if (::getrlimit(RLIMIT_NOFILE, &limit) != 0) {
        return false;
    }
    if (limit.rlim_cur > FD_LIMIT) {
        limit.rlim_cur = FD_LIMIT;
        if (::setrlimit(RLIMIT_NOFILE, &limit) != 0) {
            return false;
        }
    }
    while (::open("/dev/null", O_RDONLY) >= 0) {
    }
    return errno == EMFILE;
}

}  // namespace

TEST(Listener, AcceptsAndRegistersConnections) {
    Router router;
    router.route("/", test::Text("root"));
    test::TestServer server(router);

    test::ClientConnection client(server.port());
    client.send(test::Get("/"));
    EXPECT_EQ(client.read_response().body, "root");
    EXPECT_EQ(server.registry().size(), 1U);
}

TEST(Listener, AcceptErrorsBackOffInsteadOfSpinning) {
    // The descriptor limit is lowered in a child so the test runner keeps its own
    auto child = supervisor::ForkWorker([] {
        Router router;
        router.route("/", test::Text("root"));
        ServerContext context{test::TestLimits(), &router};
        worker::ConnectionRegistry registry;

        asio::io_context ioc{1};
        auto listener = std::make_shared<Listener>(
            ioc, tcp::endpoint{asio::ip::make_address("127.0.0.1"), 0}, context, registry);
        listener->run();

        // The client socket exists before the table fills up; the accepted side cannot
        const int client = ::socket(AF_INET, SOCK_STREAM, 0);
        if (client < 0 || !ExhaustDescriptors()) {
            return 2;
        }
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(listener->local_endpoint().port());
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (::connect(client, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
            return 3;
        }

        ioc.run_for(500ms);

        // Roughly one retry per backoff period; a spinning loop fails thousands of times
        const auto errors = listener->accept_errors();
        return errors >= 1 && errors <= 20 ? 0 : 4;
    });

    const int status = child.wait();
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}

TEST(Listener, StopEndsTheAcceptLoop) {
    Router router;
    router.route("/", test::Text("root"));
    test::TestServer server(router);
    const auto port = server.port();

    server.stop();
    EXPECT_THROW(test::ClientConnection client(port), std::runtime_error);
}
