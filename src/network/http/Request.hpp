#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "BodyStream.hpp"
#include "Types.hpp"

namespace vireo::core {

using PathParams = std::unordered_map<std::string, std::string>;

/**
 * @brief What a handler sees of one HTTP request.
 * Borrows the connection's BodyStream; valid until the response has been sent.
 */
class Request {
   public:
    Request(std::string method, std::string url, http::fields headers, BodyStream& stream,
            bool keep_alive = true);

    const std::string& method() const noexcept { return method_; }
    // Raw request target, query string included.
    const std::string& url() const noexcept { return url_; }
    // Encoded path without query.
    const std::string& path() const noexcept { return path_; }
    const std::string& query() const noexcept { return query_; }

    const http::fields& headers() const noexcept { return headers_; }
    std::optional<std::string> header(std::string_view name) const;
    std::string host() const;

    bool keep_alive() const noexcept { return keep_alive_; }

    BodyStream& stream() noexcept { return stream_; }

    // Values captured by the {placeholders} of a dynamic route.
    const PathParams& params() const noexcept { return params_; }
    std::optional<std::string> param(const std::string& name) const;
    void set_params(PathParams params) { params_ = std::move(params); }

    // Decoded query string arguments; first value wins for arg().
    std::optional<std::string> arg(std::string_view name) const;
    std::vector<std::string> args(std::string_view name) const;

    const std::map<std::string, std::string>& cookies() const;

   private:
    std::string method_;
    std::string url_;
    std::string path_;
    std::string query_;
    http::fields headers_;
    BodyStream& stream_;
    bool keep_alive_;
    PathParams params_;
    mutable std::optional<std::map<std::string, std::string>> cookies_;
};

}  // namespace vireo::core
