#pragma once

#include "Router.hpp"
#include "config.hpp"

namespace vireo {

/**
 * @brief Everything a Connection needs from its process, passed explicitly.
 * The Router is borrowed; it is built before the workers fork and outlives them.
 */
struct ServerContext {
    config::ServerConfig limits;
    const core::Router* router = nullptr;
};

}  // namespace vireo
