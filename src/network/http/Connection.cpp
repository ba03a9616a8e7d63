#include "Connection.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <optional>
#include <stdexcept>

#include "ConnectionRegistry.hpp"
#include "Errors.hpp"
#include "response_builder.hpp"

namespace vireo::core {

namespace {

constexpr std::size_t READ_BUFFER_SIZE = 64 * 1024;
constexpr std::chrono::milliseconds SCHEDULED_CLOSE_POLL{500};

void fail(beast::error_code ec, const char* what) {
    if (ec == asio::error::operation_aborted) {
        return;
    }
    if (ec != beast::errc::not_connected && ec != asio::error::eof &&
        ec != asio::error::connection_reset && ec != asio::error::broken_pipe) {
        spdlog::error("[Connection] {} error: {}", what, ec.message());
    }
}

}  // namespace

using ResponseBuilder = models::ResponseBuilder;

Connection::Connection(tcp::socket&& socket, const ServerContext& context,
                       worker::ConnectionRegistry* registry)
    : socket_(std::move(socket)),
      context_(context),
      registry_(registry),
      parser_(*this, context.limits.max_header_size, context.limits.max_body_size),
      stream_(socket_.get_executor(), this),
      read_gate_(socket_.get_executor()),
      write_permission_(socket_.get_executor()),
      timeout_timer_(socket_.get_executor()),
      write_deadline_(socket_.get_executor()) {
    if (context_.router == nullptr) {
        throw std::invalid_argument("Connection requires a router");
    }
    touch();

    beast::error_code ec;
    auto remote = socket_.remote_endpoint(ec);
    if (!ec) {
        spdlog::debug("New HTTP connection: {}:{}", remote.address().to_string(), remote.port());
    }
}

Connection::~Connection() { spdlog::trace("[Connection] Destroyed"); }

void Connection::run() {
    asio::co_spawn(
        socket_.get_executor(), [self = shared_from_this()]() { return self->do_read(); },
        asio::detached);
}

void Connection::touch() noexcept {
    last_activity_.store(Clock::now().time_since_epoch().count(), std::memory_order_release);
}

// ---------------------------------------------------------------------------
// Reading
// ---------------------------------------------------------------------------

asio::awaitable<void> Connection::do_read() {
    auto self = shared_from_this();
    std::array<char, READ_BUFFER_SIZE> buffer{};

    while (!closed_) {
        // 1. Wait until reading is allowed again
        if (!readable_) {
            read_gate_.expires_at(asio::steady_timer::time_point::max());
            co_await read_gate_.async_wait(asio::as_tuple(asio::use_awaitable));
            continue;
        }

        // 2. Parse bytes left behind by the previous request first
        if (drain_pending_) {
            drain_pending_ = false;
            if (auto ec = parser_.resume()) {
                on_parse_error(ec);
            }
            continue;
        }

        // 3. Read from the socket
        auto [ec, n] = co_await socket_.async_read_some(asio::buffer(buffer),
                                                        asio::as_tuple(asio::use_awaitable));
        if (ec) {
            fail(ec, "read");
            close();
            break;
        }
        on_data(std::string_view(buffer.data(), n));
    }
}

void Connection::on_data(std::string_view data) {
    touch();
    if (status() != ConnectionStatus::Processing) {
        set_status(ConnectionStatus::Receiving);
    }
    if (auto ec = parser_.feed(data)) {
        on_parse_error(ec);
    }
}

void Connection::on_parse_error(const beast::error_code& ec) {
    spdlog::debug("[Connection] Malformed request: {}", ec.message());
    pause_reading();
    close();
}

void Connection::pause_reading() { readable_ = false; }

void Connection::resume_reading() {
    if (readable_) {
        return;
    }
    readable_ = true;
    read_gate_.cancel();
}

// ---------------------------------------------------------------------------
// Parser callbacks
// ---------------------------------------------------------------------------

void Connection::on_headers_complete(http::fields headers, std::string url, std::string method,
                                     bool /*upgrade*/) {
    keep_alive_ = context_.limits.keep_alive && parser_.keep_alive();
    request_ = std::make_unique<Request>(std::move(method), std::move(url), std::move(headers),
                                         stream_, keep_alive_);
    touch();
    task_in_flight_ = true;
    spdlog::debug("[Connection] {} {}", request_->method(), request_->url());

    try {
        auto match = context_.router->get_route(*request_);
        request_->set_params(std::move(match.params));
        spawn_task(handle_request(match.route));
        if (match.route->timeout()) {
            arm_timeout(*match.route->timeout());
        }
    } catch (const MethodNotAllowed& e) {
        spawn_task(send_response(ResponseBuilder::method_not_allowed(e.allowed())));
    } catch (const ReverseNotFound&) {
        spawn_task(send_response(ResponseBuilder::not_found()));
    }
}

void Connection::on_body(std::string_view chunk) {
    stream_.put(std::string(chunk));
    pause_reading();
}

void Connection::on_message_complete() {
    stream_.end();
    set_status(ConnectionStatus::Processing);
    pause_reading();
}

// ---------------------------------------------------------------------------
// Handler task
// ---------------------------------------------------------------------------

void Connection::spawn_task(asio::awaitable<void> task) {
    auto signal = std::make_shared<asio::cancellation_signal>();
    task_signal_ = signal;

    asio::co_spawn(socket_.get_executor(), std::move(task),
                   asio::bind_cancellation_slot(
                       signal->slot(),
                       [self = shared_from_this(), signal](const std::exception_ptr& ep) {
                           if (!ep) {
                               return;
                           }
                           try {
                               std::rethrow_exception(ep);
                           } catch (const std::exception& e) {
                               spdlog::error("[Connection] Request task died: {}", e.what());
                           }
                           self->close();
                       }));
}

void Connection::arm_timeout(std::chrono::milliseconds timeout) {
    timed_out_ = false;
    timeout_timer_.expires_after(timeout);
    timeout_timer_.async_wait([weak = weak_from_this(), signal = task_signal_](
                                  const beast::error_code& ec) {
        auto self = weak.lock();
        if (ec || !self || !self->task_in_flight_ || self->task_signal_ != signal) {
            return;
        }
        spdlog::warn("[Connection] Handler timed out, cancelling");
        self->timed_out_ = true;
        signal->emit(asio::cancellation_type::terminal);
    });
}

asio::awaitable<void> Connection::handle_request(const Route* route) {
    auto self = shared_from_this();
    std::optional<Response> response;

    try {
        response.emplace(co_await route->handler()(*request_));
    } catch (const boost::system::system_error& e) {
        if (!timed_out_ && !closed_) {
            spdlog::error("[Connection] Handler for {} failed: {}", route->path(), e.what());
        }
    } catch (const std::exception& e) {
        spdlog::error("[Connection] Handler for {} failed: {}", route->path(), e.what());
    }

    if (closed_) {
        co_return;
    }
    timeout_timer_.cancel();

    if (timed_out_) {
        // The task was cancelled; clear that before writing the 503.
        co_await asio::this_coro::reset_cancellation_state();
        response = ResponseBuilder::service_unavailable();
    } else if (!response) {
        response = ResponseBuilder::internal_error();
    }
    co_await response->send(*this);
}

asio::awaitable<void> Connection::send_response(Response response) {
    auto self = shared_from_this();
    co_await response.send(*this);
}

// ---------------------------------------------------------------------------
// Writing
// ---------------------------------------------------------------------------

void Connection::pause_writing() { writable_ = false; }

void Connection::resume_writing() {
    writable_ = true;
    write_permission_.cancel();
}

asio::awaitable<void> Connection::write(std::string data) {
    auto self = shared_from_this();

    while (!writable_ && !closed_) {
        write_permission_.expires_at(asio::steady_timer::time_point::max());
        co_await write_permission_.async_wait(asio::as_tuple(asio::use_awaitable));
    }
    if (closed_) {
        co_return;
    }

    pause_writing();
    writing_.store(true, std::memory_order_release);

    std::size_t offset = 0;
    while (offset < data.size() && !closed_) {
        // 1. Each chunk gets a fresh deadline; a reader that stalls runs it out
        arm_write_deadline();

        // 2. Partial writes keep the connection looking alive to the Reaper
        auto [ec, bytes] = co_await socket_.async_write_some(
            asio::buffer(data.data() + offset, data.size() - offset),
            asio::as_tuple(asio::use_awaitable));
        if (ec) {
            fail(ec, "write");
            close();
            break;
        }
        offset += bytes;
        touch();
    }

    write_deadline_.cancel();
    writing_.store(false, std::memory_order_release);
    resume_writing();
    spdlog::trace("[Connection] Sent {} of {} bytes", offset, data.size());
}

void Connection::arm_write_deadline() {
    write_deadline_.expires_after(context_.limits.write_timeout);
    write_deadline_.async_wait([weak = weak_from_this()](const beast::error_code& ec) {
        auto self = weak.lock();
        // A deadline re-armed after this wait fired has moved into the future
        if (ec || !self || self->closed_ || self->write_deadline_.expiry() > Clock::now()) {
            return;
        }
        spdlog::warn("[Connection] Client stopped reading for {}s, closing",
                     self->context_.limits.write_timeout.count());
        self->close();
    });
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void Connection::after_response() {
    if (closed_) {
        return;
    }
    set_status(ConnectionStatus::Pending);
    task_in_flight_ = false;
    timed_out_ = false;
    timeout_timer_.cancel();

    // A request whose body was never fully read leaves the parser mid-message.
    const bool complete = parser_.message_done();
    stream_.clear();
    request_.reset();
    touch();

    if (!keep_alive_ || !complete) {
        close();
        return;
    }
    parser_.reset();

    if (stopped_) {
        asio::co_spawn(
            socket_.get_executor(), [self = shared_from_this()]() { return self->scheduled_close(); },
            asio::detached);
        return;
    }

    drain_pending_ = parser_.buffered() > 0;
    resume_reading();
}

asio::awaitable<void> Connection::scheduled_close() {
    auto self = shared_from_this();
    asio::steady_timer poll(socket_.get_executor());
    const auto deadline = Clock::now() + context_.limits.scheduled_close_timeout;

    while (!writable_ && !closed_ && Clock::now() < deadline) {
        poll.expires_after(SCHEDULED_CLOSE_POLL);
        co_await poll.async_wait(asio::as_tuple(asio::use_awaitable));
    }
    close();
}

void Connection::stop() {
    stopped_ = true;
    if (status() == ConnectionStatus::Pending && !task_in_flight_) {
        close();
    }
}

void Connection::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    auto self = shared_from_this();

    beast::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);

    read_gate_.cancel();
    write_permission_.cancel();
    timeout_timer_.cancel();
    write_deadline_.cancel();
    if (task_signal_ && task_in_flight_) {
        task_signal_->emit(asio::cancellation_type::terminal);
    }
    spdlog::debug("[Connection] Closed");

    if (registry_ != nullptr) {
        registry_->discard(this);
    }
}

}  // namespace vireo::core
