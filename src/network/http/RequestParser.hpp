#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "Types.hpp"

namespace vireo::core {

/**
 * @brief The three events a Connection consumes from the parser.
 * Called synchronously from inside RequestParser::feed().
 */
struct ParserListener {
    virtual ~ParserListener() = default;

    virtual void on_headers_complete(http::fields headers, std::string url, std::string method,
                                     bool upgrade) = 0;
    virtual void on_body(std::string_view chunk) = 0;
    virtual void on_message_complete() = 0;
};

/**
 * @brief Incremental HTTP/1.1 request parser.
 *
 * @details
 * Wraps a Beast `basic_parser<true>` and forwards its hooks to a ParserListener.
 * Bytes are buffered; `feed()` parses as far as it can and stops at the end of one
 * message, keeping any following bytes for the next request (no pipelining: the
 * caller decides when to `reset()` and `resume()`).
 */
class RequestParser {
   public:
    RequestParser(ParserListener& listener, std::size_t header_limit, std::uint64_t body_limit);
    ~RequestParser();

    RequestParser(const RequestParser&) = delete;
    RequestParser& operator=(const RequestParser&) = delete;

    // Appends bytes and parses them. Returns the parse error, if any.
    beast::error_code feed(std::string_view data);

    // Parses bytes left over from a previous feed().
    beast::error_code resume() { return drive(); }

    // Prepares for the next message on the same connection. Buffered bytes are kept.
    void reset();

    bool message_done() const noexcept;
    bool keep_alive() const noexcept;
    unsigned int version() const noexcept;
    std::size_t buffered() const noexcept { return buffer_.size(); }

   private:
    class Impl;

    beast::error_code drive();

    ParserListener& listener_;
    std::size_t header_limit_;
    std::uint64_t body_limit_;
    beast::flat_buffer buffer_;
    std::unique_ptr<Impl> impl_;
};

}  // namespace vireo::core
