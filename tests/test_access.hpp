#pragma once

#include "cortexnet/core/NetworkManager.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>

namespace cortexnet::test {

class NetworkManagerTestAccess {
public:
    static std::size_t pending_requests(const NetworkManager& manager) {
        std::scoped_lock lock(manager.pending_mutex_);
        return manager.pending_.size();
    }

    static bool seen_message(const NetworkManager& manager, const std::string& message_id) {
        return manager.cache_.contains(message_id);
    }

    static std::size_t cached_messages(const NetworkManager& manager) {
        return manager.cache_.size();
    }

    // Rewinds the last contact time of a connected peer.
    static bool age_connection(NetworkManager& manager, const NodeId& peer, std::chrono::seconds age) {
        std::scoped_lock lock(manager.connections_mutex_);
        const auto it = manager.connections_.find(peer);
        if (it == manager.connections_.end()) {
            return false;
        }
        it->second = Clock::now() - age;
        return true;
    }

    static std::uint32_t active_inferences(const NetworkManager& manager) {
        return manager.active_inferences_.load();
    }
};

}  // namespace cortexnet::test
