#pragma once

#include <string>
#include <utility>
#include <vector>

#include "Route.hpp"
#include "Router.hpp"

namespace vireo::core {

/**
 * @brief A named group of routes that can be mounted under prefixes.
 *
 * @details
 * Blueprints nest: a child added with prefixes {"v1", "/v1"} under a parent mounted
 * with {"api", "/api"} registers its route "users" as "api:v1:users" at "/api/v1/...".
 * A blueprint has at most one parent. Children are borrowed and must stay alive
 * until register_into() has run.
 */
class Blueprint {
   public:
    using Prefixes = Router::Prefixes;

    // Hosts applied to every route that does not declare its own.
    explicit Blueprint(std::vector<std::string> hosts = {});

    Blueprint(const Blueprint&) = delete;
    Blueprint& operator=(const Blueprint&) = delete;

    Blueprint& route(std::string path, Handler handler, RouteOptions options = {});

    // @throws DuplicatedBlueprint when the child already has a parent.
    // @throws ConflictingPrefixes when a name prefix is already used by a sibling.
    void add_blueprint(Blueprint& child, Prefixes prefixes = {});

    // Registers this blueprint and every nested one into the router.
    void register_into(Router& router, const Prefixes& prefixes = {}) const;

    const Blueprint* parent() const noexcept { return parent_; }
    const std::vector<Route>& routes() const noexcept { return routes_; }
    const std::vector<std::pair<Blueprint*, Prefixes>>& blueprints() const noexcept {
        return children_;
    }

   private:
    std::vector<std::string> hosts_;
    std::vector<Route> routes_;
    std::vector<std::pair<Blueprint*, Prefixes>> children_;
    Blueprint* parent_ = nullptr;
};

}  // namespace vireo::core
