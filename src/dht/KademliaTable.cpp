#include "cortexnet/dht/KademliaTable.hpp"

#include <algorithm>
#include <bit>
#include <cmath>
#include <utility>

namespace cortexnet::dht {

namespace {

constexpr double kFailureDecay = 0.9;
constexpr double kSuccessBoost = 0.02;
constexpr double kReliabilityFloor = 0.05;

double finite_or_zero(double value) {
    return std::isfinite(value) ? std::max(value, 0.0) : 0.0;
}

// Announced resource figures are peer claims; keep them finite and non-negative.
void sanitize_profile(NodeCapability& capability) {
    capability.compute_power = finite_or_zero(capability.compute_power);
    capability.memory_gb = finite_or_zero(capability.memory_gb);
    capability.bandwidth_mbps = finite_or_zero(capability.bandwidth_mbps);
    capability.current_load = std::min(finite_or_zero(capability.current_load), 1.0);
}

}  // namespace

KademliaTable::KademliaTable(NodeId self_id, std::size_t bucket_size, std::chrono::seconds stale_after)
    : self_id_(std::move(self_id)),
      self_hash_(hash_identifier(self_id_)),
      bucket_size_(std::max<std::size_t>(bucket_size, 1)),
      stale_after_(stale_after) {}

bool KademliaTable::add_node(NodeCapability capability) {
    const auto index = bucket_index(self_hash_ ^ hash_identifier(capability.node_id));
    if (!index.has_value() || capability.node_id == self_id_) {
        return false;
    }

    if (capability.last_seen == Clock::time_point{}) {
        capability.last_seen = Clock::now();
    }
    sanitize_profile(capability);
    // Reliability is only ever observed locally; a newcomer starts at full trust.
    capability.reliability_score = 1.0;

    std::scoped_lock lock(mutex_);
    auto& bucket = buckets_[*index];
    const auto existing = std::find_if(bucket.begin(), bucket.end(), [&](const NodeCapability& entry) {
        return entry.node_id == capability.node_id;
    });
    if (existing != bucket.end()) {
        capability.reliability_score = existing->reliability_score;
        bucket.erase(existing);
    }

    bucket.push_front(std::move(capability));
    while (bucket.size() > bucket_size_) {
        bucket.pop_back();
    }
    return true;
}

bool KademliaTable::remove_node(const NodeId& node_id) {
    const auto index = bucket_index(self_hash_ ^ hash_identifier(node_id));
    if (!index.has_value()) {
        return false;
    }

    std::scoped_lock lock(mutex_);
    auto& bucket = buckets_[*index];
    const auto before = bucket.size();
    bucket.erase(std::remove_if(bucket.begin(), bucket.end(), [&](const NodeCapability& entry) {
                     return entry.node_id == node_id;
                 }),
        bucket.end());
    return bucket.size() != before;
}

std::optional<NodeCapability> KademliaTable::get_node(const NodeId& node_id) const {
    std::scoped_lock lock(mutex_);
    const auto* node = locate(node_id);
    if (node == nullptr) {
        return std::nullopt;
    }
    return *node;
}

std::vector<NodeCapability> KademliaTable::find_closest_nodes(std::string_view target_key, std::size_t count) const {
    if (count == 0) {
        return {};
    }

    const auto target_hash = hash_identifier(target_key);
    std::vector<std::pair<std::uint64_t, NodeCapability>> candidates;
    {
        std::scoped_lock lock(mutex_);
        for (const auto& bucket : buckets_) {
            for (const auto& node : bucket) {
                candidates.emplace_back(hash_identifier(node.node_id) ^ target_hash, node);
            }
        }
    }

    std::sort(candidates.begin(), candidates.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.first < rhs.first;
    });

    std::vector<NodeCapability> result;
    result.reserve(std::min(count, candidates.size()));
    for (auto& candidate : candidates) {
        if (result.size() == count) {
            break;
        }
        result.push_back(std::move(candidate.second));
    }
    return result;
}

std::vector<NodeCapability> KademliaTable::find_nodes_with_model(const std::string& model_id) const {
    return find_nodes_with_model(model_id, Clock::now());
}

std::vector<NodeCapability> KademliaTable::find_nodes_with_model(const std::string& model_id,
                                                                 Clock::time_point now) const {
    std::vector<NodeCapability> result;
    std::scoped_lock lock(mutex_);
    for (const auto& bucket : buckets_) {
        for (const auto& node : bucket) {
            if (node.hosts(model_id) && is_fresh(node, now)) {
                result.push_back(node);
            }
        }
    }
    return result;
}

std::vector<NodeCapability> KademliaTable::all_nodes() const {
    std::vector<NodeCapability> result;
    std::scoped_lock lock(mutex_);
    for (const auto& bucket : buckets_) {
        result.insert(result.end(), bucket.begin(), bucket.end());
    }
    return result;
}

bool KademliaTable::touch(const NodeId& node_id, Clock::time_point now) {
    std::scoped_lock lock(mutex_);
    auto* node = locate(node_id);
    if (node == nullptr) {
        return false;
    }
    node->last_seen = std::max(node->last_seen, now);
    return true;
}

bool KademliaTable::add_model(const NodeId& node_id, const std::string& model_id) {
    std::scoped_lock lock(mutex_);
    auto* node = locate(node_id);
    if (node == nullptr) {
        return false;
    }
    node->models.insert(model_id);
    return true;
}

bool KademliaTable::set_load(const NodeId& node_id, double load) {
    std::scoped_lock lock(mutex_);
    auto* node = locate(node_id);
    if (node == nullptr) {
        return false;
    }
    node->current_load = std::min(finite_or_zero(load), 1.0);
    return true;
}

void KademliaTable::record_outcome(const NodeId& node_id, bool success) {
    std::scoped_lock lock(mutex_);
    auto* node = locate(node_id);
    if (node == nullptr) {
        return;
    }
    if (success) {
        node->reliability_score = std::min(1.0, node->reliability_score + kSuccessBoost);
    } else {
        node->reliability_score = std::max(kReliabilityFloor, node->reliability_score * kFailureDecay);
    }
}

std::vector<NodeId> KademliaTable::evict_stale(Clock::time_point now) {
    std::vector<NodeId> evicted;
    std::scoped_lock lock(mutex_);
    for (auto& bucket : buckets_) {
        for (auto it = bucket.begin(); it != bucket.end();) {
            if (!is_fresh(*it, now)) {
                evicted.push_back(it->node_id);
                it = bucket.erase(it);
            } else {
                ++it;
            }
        }
    }
    return evicted;
}

void KademliaTable::store_data(const std::string& key, Value value) {
    std::scoped_lock lock(mutex_);
    data_[key] = std::move(value);
}

std::optional<Value> KademliaTable::get_data(const std::string& key) const {
    std::scoped_lock lock(mutex_);
    const auto it = data_.find(key);
    if (it == data_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void KademliaTable::append_unique(const std::string& key, Value element) {
    std::scoped_lock lock(mutex_);
    auto& items = data_[key].ensure_array();
    if (std::find(items.begin(), items.end(), element) == items.end()) {
        items.push_back(std::move(element));
    }
}

std::size_t KademliaTable::size() const {
    std::scoped_lock lock(mutex_);
    std::size_t total = 0;
    for (const auto& bucket : buckets_) {
        total += bucket.size();
    }
    return total;
}

std::size_t KademliaTable::bucket_population(std::size_t index) const {
    if (index >= kIdBits) {
        return 0;
    }
    std::scoped_lock lock(mutex_);
    return buckets_[index].size();
}

std::uint64_t KademliaTable::distance(std::string_view lhs, std::string_view rhs) {
    return xor_distance(lhs, rhs);
}

std::optional<std::size_t> KademliaTable::bucket_index(std::uint64_t distance) {
    if (distance == 0) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(kIdBits - 1 - std::countl_zero(distance));
}

NodeCapability* KademliaTable::locate(const NodeId& node_id) {
    const auto index = bucket_index(self_hash_ ^ hash_identifier(node_id));
    if (!index.has_value()) {
        return nullptr;
    }
    for (auto& node : buckets_[*index]) {
        if (node.node_id == node_id) {
            return &node;
        }
    }
    return nullptr;
}

const NodeCapability* KademliaTable::locate(const NodeId& node_id) const {
    return const_cast<KademliaTable*>(this)->locate(node_id);
}

bool KademliaTable::is_fresh(const NodeCapability& node, Clock::time_point now) const {
    return now - node.last_seen <= stale_after_;
}

}  // namespace cortexnet::dht
