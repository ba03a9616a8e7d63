#include "DemoRoutes.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/json.hpp>
#include <chrono>
#include <string>

#include "Blueprint.hpp"
#include "Request.hpp"
#include "Response.hpp"

namespace vireo::app {

using core::Request;
using core::Response;

namespace {

constexpr std::chrono::seconds SLOW_HANDLER_DELAY{5};
constexpr std::chrono::seconds SLOW_ROUTE_TIMEOUT{1};

asio::awaitable<Response> Hello(Request& /*request*/) {
    co_return Response("Hello from vireo\n", 200, {{"Content-Type", "text/plain"}});
}

asio::awaitable<Response> AdminHello(Request& request) {
    co_return Response("Admin area on " + request.host() + "\n", 200,
                       {{"Content-Type", "text/plain"}});
}

// Streams the body back; each chunk pulled from the stream re-enables socket reads.
asio::awaitable<Response> Echo(Request& request) {
    std::string body = co_await request.stream().read();
    auto content_type = request.header("Content-Type").value_or("application/octet-stream");
    co_return Response(std::move(body), 200, {{"Content-Type", content_type}});
}

asio::awaitable<Response> GetUser(Request& request) {
    json::object body;
    body["id"] = request.param("id").value_or("");
    body["verbose"] = request.arg("verbose").has_value();
    co_return Response(json::serialize(body), 200, {{"Content-Type", "application/json"}});
}

// Sleeps past its route timeout; the engine answers 503.
asio::awaitable<Response> Slow(Request& /*request*/) {
    asio::steady_timer timer(co_await asio::this_coro::executor);
    timer.expires_after(SLOW_HANDLER_DELAY);
    co_await timer.async_wait(asio::use_awaitable);
    co_return Response("Finally done\n");
}

asio::awaitable<Response> Status(Request& /*request*/) {
    json::object body;
    body["status"] = "ok";
    co_return Response(json::serialize(body), 200, {{"Content-Type", "application/json"}});
}

}  // namespace

void RegisterDemoRoutes(core::Router& router) {
    // Host routes are checked first
    router.route("/", AdminHello, {.hosts = {R"(admin\..*)"}});

    router.route("/", Hello);
    router.route("/echo", Echo, {.methods = {"POST"}});
    router.route("/users/{id}", GetUser, {.name = "get_user"});
    router.route("/slow", Slow, {.timeout = SLOW_ROUTE_TIMEOUT});

    core::Blueprint api;
    core::Blueprint v1;
    v1.route("/status", Status, {.name = "status"});
    api.add_blueprint(v1, {{"v1", "/v1"}});
    api.register_into(router, {{"api", "/api"}});

    spdlog::info("Registered {} routes; user 42 lives at {}", router.size(),
                 router.url_for("get_user", 42));
}

}  // namespace vireo::app
