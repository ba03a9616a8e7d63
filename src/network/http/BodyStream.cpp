#include "BodyStream.hpp"

#include <utility>

#include "Errors.hpp"

namespace vireo::core {

BodyStream::BodyStream(const asio::any_io_executor& executor, IReadFlowControl* flow)
    : signal_(executor), flow_(flow) {}

void BodyStream::put(std::string chunk) {
    if (chunk.empty()) {
        return;
    }
    dirty_ = true;
    chunks_.push_back(std::move(chunk));
    if (waiting_) {
        wake();
    }
}

void BodyStream::end() {
    finished_ = true;
    if (waiting_) {
        wake();
    }
}

void BodyStream::wake() { signal_.cancel(); }

asio::awaitable<std::string> BodyStream::get() {
    while (chunks_.empty() && !finished_) {
        waiting_ = true;
        signal_.expires_at(asio::steady_timer::time_point::max());
        auto [ec] = co_await signal_.async_wait(asio::as_tuple(asio::use_awaitable));
        waiting_ = false;

        // A wake-up completes with operation_aborted too; only a cancelled task ends here.
        asio::cancellation_state state = co_await asio::this_coro::cancellation_state;
        if (state.cancelled() != asio::cancellation_type::none) {
            throw boost::system::system_error(asio::error::operation_aborted);
        }
    }

    if (chunks_.empty()) {
        co_return std::string{};
    }
    std::string chunk = std::move(chunks_.front());
    chunks_.pop_front();
    co_return chunk;
}

asio::awaitable<std::optional<std::string>> BodyStream::next() {
    if (consumed_) {
        throw StreamAlreadyConsumed();
    }

    if (flow_ && !finished_) {
        flow_->resume_reading();
    }
    std::string chunk = co_await get();
    if (chunk.empty()) {
        consumed_ = true;
        co_return std::nullopt;
    }
    if (flow_ && !finished_) {
        flow_->pause_reading();
    }
    co_return chunk;
}

asio::awaitable<std::string> BodyStream::read() {
    if (consumed_) {
        throw StreamAlreadyConsumed();
    }

    std::string data;
    while (auto chunk = co_await next()) {
        data += *chunk;
    }
    co_return data;
}

void BodyStream::clear() {
    if (dirty_) {
        chunks_.clear();
        dirty_ = false;
    }
    finished_ = false;
    consumed_ = false;
}

}  // namespace vireo::core
