#include "Router.hpp"

#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>

#include "Errors.hpp"

namespace vireo::core {

namespace {

template <typename Table>
bool HostMatches(const Table& table, std::string_view host) {
    try {
        return boost::regex_match(host.begin(), host.end(), table.matcher);
    } catch (const std::runtime_error& e) {
        spdlog::warn("[Router] Host pattern '{}' gave up on a {} byte host: {}", table.pattern,
                     host.size(), e.what());
        return false;
    }
}

}  // namespace

void Router::add_route(const Route& route, const Prefixes& prefixes) {
    if (prefixes.empty()) {
        register_route(route);
        return;
    }
    for (const auto& [name_prefix, path_prefix] : prefixes) {
        register_route(route.with_prefix(name_prefix, path_prefix));
    }
}

void Router::route(std::string path, Handler handler, RouteOptions options) {
    add_route(Route(std::move(path), std::move(handler), std::move(options)));
}

void Router::register_route(const Route& route) {
    routes_.push_back(std::make_unique<Route>(route));
    const Route* stored = routes_.back().get();

    if (!stored->hosts().empty()) {
        check_host_ = true;
        for (const auto& pattern : stored->hosts()) {
            auto& table = host_table(pattern);
            for (const auto& method : stored->methods()) {
                table.routes[method].push_back(stored);
            }
        }
    } else {
        for (const auto& method : stored->methods()) {
            switch (stored->kind()) {
                case Route::Kind::Literal: {
                    auto& slot = literal_[method][stored->path()];
                    if (slot != nullptr) {
                        spdlog::warn("[Router] {} {} registered twice; the last one wins", method,
                                     stored->path());
                    }
                    slot = stored;
                    break;
                }
                case Route::Kind::Dynamic:
                    dynamic_[method].push_back(stored);
                    break;
            }
        }
    }

    if (!stored->name().empty()) {
        auto [it, inserted] = reverse_.try_emplace(stored->name(), stored);
        if (!inserted) {
            spdlog::warn("[Router] Route name '{}' reused by {}; the last one wins",
                         stored->name(), stored->path());
            it->second = stored;
        }
    }

    spdlog::debug("[Router] Registered {} [{}]{}", stored->path(),
                  fmt::join(stored->methods(), ","),
                  stored->name().empty() ? "" : " as " + stored->name());
}

Router::HostTable& Router::host_table(const std::string& pattern) {
    auto it = std::find_if(hosts_.begin(), hosts_.end(),
                           [&](const HostTable& t) { return t.pattern == pattern; });
    if (it != hosts_.end()) {
        return *it;
    }
    try {
        hosts_.push_back(HostTable{pattern, boost::regex(pattern, boost::regex::ECMAScript), {}});
    } catch (const boost::regex_error& e) {
        throw RouteConfigurationError("Invalid host pattern '" + pattern + "': " + e.what());
    }
    return hosts_.back();
}

RouteMatch Router::get_route(std::string_view method, std::string_view path,
                             std::string_view host) const {
    const std::string method_key(method);
    const std::string path_key(path);

    // 1. Host restricted routes
    if (check_host_) {
        for (const auto& table : hosts_) {
            if (!HostMatches(table, host)) {
                continue;
            }
            if (auto it = table.routes.find(method_key); it != table.routes.end()) {
                for (const Route* candidate : it->second) {
                    if (auto params = candidate->match(path)) {
                        return {candidate, std::move(*params)};
                    }
                }
            }
            std::vector<std::string> allowed;
            for (const auto& [other, candidates] : table.routes) {
                if (other == method_key) {
                    continue;
                }
                bool hit = std::any_of(candidates.begin(), candidates.end(),
                                       [&](const Route* r) { return r->matches(path); });
                if (hit) {
                    allowed.push_back(other);
                }
            }
            if (!allowed.empty()) {
                throw MethodNotAllowed(std::move(allowed));
            }
            break;
        }
    }

    // 2. Literal paths
    if (auto by_method = literal_.find(method_key); by_method != literal_.end()) {
        if (auto it = by_method->second.find(path_key); it != by_method->second.end()) {
            return {it->second, {}};
        }
    }

    // 3. Dynamic paths, first registered wins
    if (auto it = dynamic_.find(method_key); it != dynamic_.end()) {
        for (const Route* candidate : it->second) {
            if (auto params = candidate->match(path)) {
                return {candidate, std::move(*params)};
            }
        }
    }

    // 4. Same path under other methods
    std::vector<std::string> allowed;
    for (const auto& [other, table] : literal_) {
        if (other != method_key && table.count(path_key) != 0) {
            allowed.push_back(other);
        }
    }
    for (const auto& [other, candidates] : dynamic_) {
        if (other == method_key) {
            continue;
        }
        bool hit = std::any_of(candidates.begin(), candidates.end(),
                               [&](const Route* r) { return r->matches(path); });
        if (hit) {
            allowed.push_back(other);
        }
    }
    if (!allowed.empty()) {
        std::sort(allowed.begin(), allowed.end());
        allowed.erase(std::unique(allowed.begin(), allowed.end()), allowed.end());
        throw MethodNotAllowed(std::move(allowed));
    }
    throw ReverseNotFound();
}

RouteMatch Router::get_route(const Request& request) const {
    return get_route(request.method(), request.path(), request.host());
}

const Route* Router::find(const std::string& name) const {
    auto it = reverse_.find(name);
    return it == reverse_.end() ? nullptr : it->second;
}

std::string Router::build_url(const std::string& name, const std::vector<std::string>& args,
                              const std::map<std::string, std::string>& kwargs) const {
    const Route* route = find(name);
    if (route == nullptr) {
        throw ReverseNotFound(name);
    }
    return route->build_url(args, kwargs);
}

}  // namespace vireo::core
