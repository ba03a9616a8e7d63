#pragma once

#include "Router.hpp"

namespace vireo::app {

// Registers the sample application served by vireo_server.
void RegisterDemoRoutes(core::Router& router);

}  // namespace vireo::app
