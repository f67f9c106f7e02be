#pragma once

#include "cortexnet/Types.hpp"
#include "cortexnet/Value.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cortexnet::dht {

// Peer bookkeeping keyed by the XOR distance of hashed ids, plus a flat fact store.
class KademliaTable {
public:
    static constexpr std::size_t kIdBits = 64;

    KademliaTable(NodeId self_id,
                  std::size_t bucket_size = 20,
                  std::chrono::seconds stale_after = std::chrono::minutes(5));

    // Inserts or refreshes a peer at the front of its bucket. A default last_seen is stamped with now.
    // Reliability is tracked locally: new peers start at 1.0 and known peers keep their score whatever they claim.
    // Non-finite or negative resource figures are zeroed. Returns false for self.
    bool add_node(NodeCapability capability);
    bool remove_node(const NodeId& node_id);
    [[nodiscard]] std::optional<NodeCapability> get_node(const NodeId& node_id) const;

    std::vector<NodeCapability> find_closest_nodes(std::string_view target_key, std::size_t count) const;
    std::vector<NodeCapability> find_nodes_with_model(const std::string& model_id) const;
    std::vector<NodeCapability> find_nodes_with_model(const std::string& model_id, Clock::time_point now) const;
    std::vector<NodeCapability> all_nodes() const;

    bool touch(const NodeId& node_id, Clock::time_point now);
    bool add_model(const NodeId& node_id, const std::string& model_id);
    bool set_load(const NodeId& node_id, double load);
    // Failure multiplies reliability by 0.9 (floor 0.05); success adds 0.02 (cap 1.0).
    void record_outcome(const NodeId& node_id, bool success);

    // Drops peers whose last_seen is older than the staleness window; returns their ids.
    std::vector<NodeId> evict_stale(Clock::time_point now);

    void store_data(const std::string& key, Value value);
    [[nodiscard]] std::optional<Value> get_data(const std::string& key) const;
    // Adds element to the array stored under key unless an equal element is present.
    void append_unique(const std::string& key, Value element);

    std::size_t size() const;
    std::size_t bucket_population(std::size_t index) const;
    const NodeId& self_id() const noexcept { return self_id_; }
    std::chrono::seconds stale_after() const noexcept { return stale_after_; }

    static std::uint64_t distance(std::string_view lhs, std::string_view rhs);
    // Most significant set bit of the distance; nullopt for zero.
    static std::optional<std::size_t> bucket_index(std::uint64_t distance);

private:
    using Bucket = std::deque<NodeCapability>;

    NodeCapability* locate(const NodeId& node_id);
    const NodeCapability* locate(const NodeId& node_id) const;
    bool is_fresh(const NodeCapability& node, Clock::time_point now) const;

    NodeId self_id_;
    std::uint64_t self_hash_{0};
    std::size_t bucket_size_{20};
    std::chrono::seconds stale_after_{std::chrono::minutes(5)};
    std::array<Bucket, kIdBits> buckets_{};
    std::unordered_map<std::string, Value> data_;
    mutable std::mutex mutex_;
};

}  // namespace cortexnet::dht
