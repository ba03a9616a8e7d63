#include "ConnectionRegistry.hpp"

#include <spdlog/spdlog.h>

#include "Connection.hpp"

namespace vireo::worker {

void ConnectionRegistry::add(ConnectionPtr connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    const core::Connection* key = connection.get();
    connections_[key] = std::move(connection);
    spdlog::debug("[Registry] Connection registered, {} open", connections_.size());
}

void ConnectionRegistry::discard(const core::Connection* connection) {
    ConnectionPtr released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(connection);
        if (it == connections_.end()) {
            return;
        }
        released = std::move(it->second);
        connections_.erase(it);
        spdlog::debug("[Registry] Connection discarded, {} open", connections_.size());
    }
    // released is destroyed here, outside the lock
}

std::size_t ConnectionRegistry::size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

}  // namespace vireo::worker
