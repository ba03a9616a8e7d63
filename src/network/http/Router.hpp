#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "Request.hpp"
#include "Route.hpp"

namespace vireo::core {

struct RouteMatch {
    const Route* route = nullptr;
    PathParams params;
};

/**
 * @brief Process-wide routing table.
 *
 * @details
 * Built once before the workers fork and read-only afterwards, so every worker
 * inherits an identical copy. Resolution order for a request:
 * 1. host-restricted routes, when any were registered;
 * 2. literal paths (hash lookup);
 * 3. dynamic paths, in registration order;
 * 4. otherwise MethodNotAllowed or ReverseNotFound.
 */
class Router {
   public:
    // (name prefix, path prefix) pairs; empty means a single ("", "").
    using Prefixes = std::vector<std::pair<std::string, std::string>>;

    Router() = default;

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    void add_route(const Route& route, const Prefixes& prefixes = {});

    // Shorthand for add_route(Route(...)).
    void route(std::string path, Handler handler, RouteOptions options = {});

    // @throws MethodNotAllowed when the path exists under other methods only.
    // @throws ReverseNotFound when nothing matches.
    RouteMatch get_route(std::string_view method, std::string_view path,
                         std::string_view host = {}) const;
    RouteMatch get_route(const Request& request) const;

    // @throws ReverseNotFound for an unknown name.
    std::string build_url(const std::string& name, const std::vector<std::string>& args = {},
                          const std::map<std::string, std::string>& kwargs = {}) const;

    // build_url with positional arguments of any printable type, e.g. url_for("get_user", 42).
    template <typename... Args>
    std::string url_for(const std::string& name, const Args&... args) const {
        return build_url(name, {ToUrlArgument(args)...});
    }

    bool check_host() const noexcept { return check_host_; }
    std::size_t size() const noexcept { return routes_.size(); }
    const Route* find(const std::string& name) const;

   private:
    struct HostTable {
        std::string pattern;
        boost::regex matcher;
        std::map<std::string, std::vector<const Route*>> routes;
    };

    template <typename T>
    static std::string ToUrlArgument(const T& value) {
        if constexpr (std::is_arithmetic_v<T>) {
            return std::to_string(value);
        } else {
            return std::string(value);
        }
    }

    void register_route(const Route& route);
    HostTable& host_table(const std::string& pattern);

    std::vector<std::unique_ptr<Route>> routes_;
    std::unordered_map<std::string, std::unordered_map<std::string, const Route*>> literal_;
    std::unordered_map<std::string, std::vector<const Route*>> dynamic_;
    std::vector<HostTable> hosts_;
    std::unordered_map<std::string, const Route*> reverse_;
    bool check_host_ = false;
};

}  // namespace vireo::core
