#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "BodyStream.hpp"
#include "Request.hpp"
#include "RequestParser.hpp"
#include "Response.hpp"
#include "Route.hpp"
#include "ServerContext.hpp"
#include "Types.hpp"

namespace vireo::worker {
class ConnectionRegistry;
}

namespace vireo::core {

enum class ConnectionStatus : int {
    Pending = 1,     // idle between requests
    Receiving = 2,   // request bytes are arriving
    Processing = 3,  // request complete, handler running
};

/**
 * @brief One client socket: an HTTP/1.1 state machine with read and write backpressure.
 *
 * @details
 * **States:** Pending -> Receiving -> Processing -> Pending (keep-alive) or closed.
 *
 * **Coroutines on the socket's executor:**
 * - the reader (`do_read`) feeds socket bytes to the parser while reading is enabled;
 * - at most one handler task per request (`handle_request` or an error response),
 *   cancellable through its own cancellation signal.
 *
 * **Flow control:**
 * - Reading is paused on every body chunk and resumed only when the handler pulls
 *   the next one from the BodyStream, and after the response has been sent.
 * - One write at a time; `write()` suspends while the transport is busy.
 * - Every partial write counts as activity. A write that makes no progress for
 *   `write_timeout` closes the connection.
 *
 * Requests are served strictly in sequence: bytes that arrive past the end of a
 * request are parsed only after its response has gone out.
 *
 * `status()`, `last_activity()` and `writing()` are atomics; everything else is touched on the
 * event loop only. The Reaper reads the atomics and posts `stop()` onto the loop.
 */
class Connection : public std::enable_shared_from_this<Connection>,
                   private ParserListener,
                   public IReadFlowControl {
   public:
    using Clock = std::chrono::steady_clock;

    Connection(tcp::socket&& socket, const ServerContext& context,
               worker::ConnectionRegistry* registry = nullptr);
    ~Connection() override;

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Entry point: launches the reader coroutine
    void run();

    // Soft stop: closes now when idle, otherwise once the current response is out.
    void stop();
    void close();

    // Writes raw bytes; suspends while another write is in flight.
    asio::awaitable<void> write(std::string data);

    // Called once the response of the current request has been written.
    void after_response();

    void pause_reading() override;
    void resume_reading() override;
    void pause_writing();
    void resume_writing();

    ConnectionStatus status() const noexcept { return status_.load(std::memory_order_acquire); }
    Clock::time_point last_activity() const noexcept {
        return Clock::time_point(Clock::duration(last_activity_.load(std::memory_order_acquire)));
    }
    // True while response bytes are being handed to a slow client.
    bool writing() const noexcept { return writing_.load(std::memory_order_acquire); }
    bool readable() const noexcept { return readable_; }
    bool writable() const noexcept { return writable_; }
    bool closed() const noexcept { return closed_; }
    bool stopped() const noexcept { return stopped_; }
    bool keep_alive() const noexcept { return keep_alive_; }

    const BodyStream& stream() const noexcept { return stream_; }

    asio::any_io_executor get_executor() { return socket_.get_executor(); }

   private:
    // ParserListener
    void on_headers_complete(http::fields headers, std::string url, std::string method,
                             bool upgrade) override;
    void on_body(std::string_view chunk) override;
    void on_message_complete() override;

    asio::awaitable<void> do_read();
    void on_data(std::string_view data);
    void on_parse_error(const beast::error_code& ec);

    asio::awaitable<void> handle_request(const Route* route);
    asio::awaitable<void> send_response(Response response);
    asio::awaitable<void> scheduled_close();

    void spawn_task(asio::awaitable<void> task);
    void arm_timeout(std::chrono::milliseconds timeout);
    void arm_write_deadline();

    void set_status(ConnectionStatus status) noexcept {
        status_.store(status, std::memory_order_release);
    }
    void touch() noexcept;

    tcp::socket socket_;
    const ServerContext& context_;
    worker::ConnectionRegistry* registry_;

    RequestParser parser_;
    BodyStream stream_;
    std::unique_ptr<Request> request_;

    // Events as never-expiring timers: cancel() wakes the waiter.
    asio::steady_timer read_gate_;
    asio::steady_timer write_permission_;
    asio::steady_timer timeout_timer_;
    asio::steady_timer write_deadline_;
    std::shared_ptr<asio::cancellation_signal> task_signal_;

    std::atomic<ConnectionStatus> status_{ConnectionStatus::Pending};
    std::atomic<Clock::rep> last_activity_{0};
    std::atomic<bool> writing_{false};

    bool readable_ = true;
    bool writable_ = true;
    bool closed_ = false;
    bool stopped_ = false;
    bool keep_alive_ = true;
    bool task_in_flight_ = false;
    bool timed_out_ = false;
    // Bytes past the previous request are waiting in the parser.
    bool drain_pending_ = false;
};

}  // namespace vireo::core
