#include "cortexnet/network/MessageCache.hpp"

namespace cortexnet::network {

MessageCache::MessageCache(std::chrono::seconds retention)
    : retention_(retention) {}

bool MessageCache::mark_if_new(const std::string& message_id, Clock::time_point now) {
    std::scoped_lock lock(mutex_);
    const auto [it, inserted] = seen_.try_emplace(message_id, now);
    if (inserted) {
        return true;
    }
    if (now - it->second > retention_) {
        it->second = now;
        return true;
    }
    return false;
}

bool MessageCache::contains(const std::string& message_id) const {
    std::scoped_lock lock(mutex_);
    return seen_.find(message_id) != seen_.end();
}

std::size_t MessageCache::sweep(Clock::time_point now) {
    std::scoped_lock lock(mutex_);
    std::size_t dropped = 0;
    for (auto it = seen_.begin(); it != seen_.end();) {
        if (now - it->second > retention_) {
            it = seen_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

std::size_t MessageCache::size() const {
    std::scoped_lock lock(mutex_);
    return seen_.size();
}

}  // namespace cortexnet::network
