#include "Blueprint.hpp"

#include <spdlog/spdlog.h>

#include "Errors.hpp"

namespace vireo::core {

namespace {

const Blueprint::Prefixes& OrRoot(const Blueprint::Prefixes& prefixes) {
    static const Blueprint::Prefixes root{{"", ""}};
    return prefixes.empty() ? root : prefixes;
}

std::string MergeNames(const std::string& outer, const std::string& inner) {
    if (!outer.empty() && !inner.empty()) {
        return outer + ":" + inner;
    }
    return outer.empty() ? inner : outer;
}

}  // namespace

Blueprint::Blueprint(std::vector<std::string> hosts) : hosts_(std::move(hosts)) {}

Blueprint& Blueprint::route(std::string path, Handler handler, RouteOptions options) {
    if (options.hosts.empty()) {
        options.hosts = hosts_;
    }
    routes_.emplace_back(std::move(path), std::move(handler), std::move(options));
    return *this;
}

void Blueprint::add_blueprint(Blueprint& child, Prefixes prefixes) {
    if (child.parent_ != nullptr || &child == this) {
        throw DuplicatedBlueprint();
    }
    if (prefixes.empty()) {
        prefixes.emplace_back("", "");
    }

    for (const auto& [name, path] : prefixes) {
        if (name.empty()) {
            continue;
        }
        for (const auto& [sibling, sibling_prefixes] : children_) {
            for (const auto& [sibling_name, sibling_path] : sibling_prefixes) {
                if (sibling_name == name) {
                    throw ConflictingPrefixes(name);
                }
            }
        }
    }

    child.parent_ = this;
    children_.emplace_back(&child, std::move(prefixes));
}

void Blueprint::register_into(Router& router, const Prefixes& prefixes) const {
    const auto& outer = OrRoot(prefixes);

    for (const auto& [child, child_prefixes] : children_) {
        Prefixes merged;
        for (const auto& [name, path] : outer) {
            for (const auto& [nested_name, nested_path] : child_prefixes) {
                merged.emplace_back(MergeNames(name, nested_name), path + nested_path);
            }
        }
        child->register_into(router, merged);
    }

    for (const auto& route : routes_) {
        router.add_route(route, outer);
    }
    spdlog::debug("[Blueprint] Registered {} routes under {} prefixes", routes_.size(),
                  outer.size());
}

}  // namespace vireo::core
