#pragma once

#include "cortexnet/Types.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace cortexnet::network {

// Time-bounded record of message ids already processed by this node.
class MessageCache {
public:
    explicit MessageCache(std::chrono::seconds retention = std::chrono::hours(1));

    // True the first time an id is seen within the retention window.
    bool mark_if_new(const std::string& message_id, Clock::time_point now);
    bool mark_if_new(const std::string& message_id) { return mark_if_new(message_id, Clock::now()); }

    bool contains(const std::string& message_id) const;
    // Forgets ids older than the retention window; returns how many were dropped.
    std::size_t sweep(Clock::time_point now);
    std::size_t size() const;

private:
    std::chrono::seconds retention_;
    std::unordered_map<std::string, Clock::time_point> seen_;
    mutable std::mutex mutex_;
};

}  // namespace cortexnet::network
