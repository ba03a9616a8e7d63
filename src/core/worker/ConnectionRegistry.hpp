#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace vireo::core {
class Connection;
}

namespace vireo::worker {

/**
 * @brief Open connections of one worker process.
 *
 * Mutated on the event loop (accept, close) and walked from the Reaper thread,
 * hence the mutex. Holding a connection here keeps it alive until it closes.
 */
class ConnectionRegistry {
   public:
    using ConnectionPtr = std::shared_ptr<core::Connection>;

    ConnectionRegistry() = default;

    // Disable copy
    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    void add(ConnectionPtr connection);
    void discard(const core::Connection* connection);

    // Calls fn for every connection while holding the lock. fn must not call back into the registry.
    template <typename Fn>
    void for_each(Fn&& fn) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, connection] : connections_) {
            fn(connection);
        }
    }

    std::size_t size() const noexcept;
    bool empty() const noexcept { return size() == 0; }

   private:
    // mutable allows locking in const methods (like size)
    mutable std::mutex mutex_;
    std::unordered_map<const core::Connection*, ConnectionPtr> connections_;
};

}  // namespace vireo::worker
