#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <string>

#include "Types.hpp"

namespace vireo::core {

/**
 * @brief Read-side flow control of the transport feeding a BodyStream.
 * Implemented by Connection; the stream only ever borrows it.
 */
struct IReadFlowControl {
    virtual ~IReadFlowControl() = default;

    virtual void pause_reading() = 0;
    virtual void resume_reading() = 0;
};

/**
 * @brief Single-producer / single-consumer queue of request body chunks.
 *
 * @details
 * - **Producer:** the parser callbacks (`put`, `end`), on the connection's event loop.
 * - **Consumer:** the request handler (`get`, `next`, `read`), on the same loop.
 * - **Backpressure:** `next()` resumes transport reads only while it waits for a chunk
 *   and pauses them again once a chunk is handed out, so a slow consumer stops the socket
 *   instead of growing this queue.
 * - An empty chunk is the terminal value; it is never queued as data.
 */
class BodyStream {
   public:
    explicit BodyStream(const asio::any_io_executor& executor, IReadFlowControl* flow = nullptr);

    BodyStream(const BodyStream&) = delete;
    BodyStream& operator=(const BodyStream&) = delete;

    // Producer side
    void put(std::string chunk);
    void end();

    // Pops the oldest chunk, parking the caller while the queue is empty and not ended.
    // Returns the empty terminal chunk once the stream is ended and drained.
    asio::awaitable<std::string> get();

    // Iteration step with flow control. std::nullopt marks exhaustion.
    // @throws StreamAlreadyConsumed when iterated again after exhaustion.
    asio::awaitable<std::optional<std::string>> next();

    // Concatenates every chunk up to the terminal value.
    // @throws StreamAlreadyConsumed when called again after exhaustion.
    asio::awaitable<std::string> read();

    // Drops buffered chunks and resets every flag, ready for the next keep-alive request.
    void clear();

    bool waiting() const noexcept { return waiting_; }
    bool dirty() const noexcept { return dirty_; }
    bool finished() const noexcept { return finished_; }
    bool consumed() const noexcept { return consumed_; }
    std::size_t pending_chunks() const noexcept { return chunks_.size(); }

   private:
    void wake();

    std::deque<std::string> chunks_;
    // Never expires on its own; cancel() is the wake-up.
    asio::steady_timer signal_;
    IReadFlowControl* flow_;

    bool waiting_ = false;
    bool dirty_ = false;
    bool finished_ = false;
    bool consumed_ = false;
};

}  // namespace vireo::core
