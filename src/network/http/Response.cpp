#include "Response.hpp"

#include <array>
#include <ctime>

#include "Connection.hpp"

namespace vireo::core {

namespace {

constexpr std::string_view CRLF = "\r\n";

std::string_view ReasonPhrase(unsigned int code) {
    auto status = http::int_to_status(code);
    if (status == http::status::unknown) {
        return "Unknown";
    }
    auto reason = http::obsolete_reason(status);
    return {reason.data(), reason.size()};
}

bool IsFramingHeader(std::string_view name) {
    beast::string_view view(name.data(), name.size());
    return beast::iequals(view, "Content-Length") || beast::iequals(view, "Date");
}

}  // namespace

std::string HttpDate(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    ::gmtime_r(&t, &tm);

    std::array<char, 64> buf{};  // NOLINT
    std::size_t n = std::strftime(buf.data(), buf.size(), "%a, %d %b %Y %H:%M:%S GMT", &tm);
    return {buf.data(), n};
}

Response::Response(std::string content, unsigned int status, Headers headers,
                   std::vector<std::string> cookies)
    : content_(std::move(content)),
      status_(status),
      headers_(std::move(headers)),
      cookies_(std::move(cookies)) {}

Response& Response::add_header(std::string name, std::string value) {
    headers_.emplace_back(std::move(name), std::move(value));
    return *this;
}

Response& Response::add_cookie(std::string rendered) {
    cookies_.push_back(std::move(rendered));
    return *this;
}

std::string Response::serialize(std::string_view date) const {
    std::string out;
    out.reserve(128 + content_.size());  // NOLINT

    out += "HTTP/1.1 ";
    out += std::to_string(status_);
    out += ' ';
    out += ReasonPhrase(status_);
    out += CRLF;

    out += "Content-Length: ";
    out += std::to_string(content_.size());
    out += CRLF;
    out += "Date: ";
    out += date;
    out += CRLF;

    // Framing headers are always computed here
    for (const auto& [name, value] : headers_) {
        if (IsFramingHeader(name)) {
            continue;
        }
        out += name;
        out += ": ";
        out += value;
        out += CRLF;
    }
    for (const auto& cookie : cookies_) {
        out += cookie;
        out += CRLF;
    }

    out += CRLF;
    out += content_;
    return out;
}

asio::awaitable<void> Response::send(Connection& connection) const {
    co_await connection.write(serialize());
    connection.after_response();
}

}  // namespace vireo::core
