#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "Types.hpp"

namespace vireo::core {

class Connection;

// RFC 1123 date in GMT, e.g. "Sun, 06 Nov 1994 08:49:37 GMT".
std::string HttpDate(std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

/**
 * @brief A complete HTTP/1.1 response, framed with Content-Length (no chunked encoding).
 *
 * Wire layout:
 *   HTTP/1.1 <code> <reason>\r\n
 *   Content-Length: <n>\r\n
 *   Date: <rfc1123>\r\n
 *   <caller headers, in insertion order>\r\n
 *   <pre-rendered cookie lines>\r\n
 *   \r\n
 *   <content>
 */
class Response {
   public:
    using Headers = std::vector<std::pair<std::string, std::string>>;

    explicit Response(std::string content = {}, unsigned int status = 200,  // NOLINT
                      Headers headers = {}, std::vector<std::string> cookies = {});

    unsigned int status() const noexcept { return status_; }
    const std::string& content() const noexcept { return content_; }
    const Headers& headers() const noexcept { return headers_; }
    const std::vector<std::string>& cookies() const noexcept { return cookies_; }

    Response& set_status(unsigned int status) {
        status_ = status;
        return *this;
    }
    Response& set_content(std::string content) {
        content_ = std::move(content);
        return *this;
    }
    Response& add_header(std::string name, std::string value);
    // A full header line such as "Set-Cookie: id=1; Path=/".
    Response& add_cookie(std::string rendered);

    std::string serialize(std::string_view date) const;
    std::string serialize() const { return serialize(HttpDate()); }

    // Writes the framed response through the connection, then runs its after-response step.
    asio::awaitable<void> send(Connection& connection) const;

   private:
    std::string content_;
    unsigned int status_;
    Headers headers_;
    std::vector<std::string> cookies_;
};

}  // namespace vireo::core
