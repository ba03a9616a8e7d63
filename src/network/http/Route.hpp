#pragma once

#include <boost/regex.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "Request.hpp"
#include "Response.hpp"
#include "Types.hpp"

namespace vireo::core {

using Handler = std::function<asio::awaitable<Response>(Request&)>;
using MethodSet = std::vector<std::string>;

// Upper-cases and validates one method token.
// @throws RouteConfigurationError on an empty or non-token method.
std::string NormalizeMethod(std::string_view method);

// Sorted, de-duplicated, upper-case. An empty input means {"GET"}.
MethodSet NormalizeMethods(const std::vector<std::string>& methods);

// One piece of a path template: literal text or a {name} placeholder.
struct PathSegment {
    bool is_param = false;
    std::string text;
};

struct LiteralPath {
    std::string path;
};

struct DynamicPath {
    std::string pattern;
    std::vector<PathSegment> segments;
    std::vector<std::string> params;
    // Backtracking state lives on the heap, long paths cannot exhaust the stack
    boost::regex matcher;
};

using PathPattern = std::variant<LiteralPath, DynamicPath>;

// Splits "/users/{id}" into segments; Literal when there is no placeholder.
// @throws RouteConfigurationError on a malformed template.
PathPattern CompilePath(const std::string& path);

struct RouteOptions {
    std::vector<std::string> methods;
    // Regular expressions fully matched against the Host header.
    std::vector<std::string> hosts;
    std::string name;
    std::optional<std::chrono::milliseconds> timeout;
};

/**
 * @brief One registered endpoint. Immutable once handed to a Router.
 */
class Route {
   public:
    enum class Kind { Literal, Dynamic };

    Route(std::string path, Handler handler, RouteOptions options = {});

    Kind kind() const noexcept;
    const std::string& path() const noexcept { return path_; }
    const PathPattern& pattern() const noexcept { return pattern_; }
    const Handler& handler() const noexcept { return handler_; }
    const MethodSet& methods() const noexcept { return methods_; }
    const std::vector<std::string>& hosts() const noexcept { return hosts_; }
    const std::string& name() const noexcept { return name_; }
    const std::optional<std::chrono::milliseconds>& timeout() const noexcept { return timeout_; }

    // Full match of a request path; the captured parameters on success.
    std::optional<PathParams> match(std::string_view path) const;
    bool matches(std::string_view path) const { return match(path).has_value(); }

    // Copy of this route mounted under a blueprint prefix.
    Route with_prefix(std::string_view name_prefix, std::string_view path_prefix) const;

    // Positional arguments fill placeholders in order, then keyword arguments by name.
    // Keyword arguments that are not placeholders become the query string.
    // @throws RouteConfigurationError when a placeholder has no value.
    std::string build_url(const std::vector<std::string>& args,
                          const std::map<std::string, std::string>& kwargs) const;

   private:
    std::string path_;
    PathPattern pattern_;
    Handler handler_;
    MethodSet methods_;
    std::vector<std::string> hosts_;
    std::string name_;
    std::optional<std::chrono::milliseconds> timeout_;
};

}  // namespace vireo::core
