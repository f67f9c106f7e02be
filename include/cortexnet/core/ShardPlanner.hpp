#pragma once

#include "cortexnet/Config.hpp"
#include "cortexnet/Types.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cortexnet {

// shard_id -> holder ids, best first.
using ShardPlacement = std::map<std::string, std::vector<NodeId>>;

struct ShardingPlan {
    std::string model_id;
    std::uint32_t total_layers{0};
    std::vector<ModelShard> shards;
    // Node whose compute share produced each shard.
    std::map<std::string, NodeId> allocation;
    ShardPlacement placement;
    Clock::time_point created_at{};
    std::vector<std::string> diagnostics;
};

class ShardPlanner {
public:
    explicit ShardPlanner(const Config& config);

    // Splits [0, total_layers) across the most capable nodes in proportion to compute power.
    // Shard i is allocated to the i-th node in descending compute order.
    std::vector<ModelShard> create_sharding_plan(const std::string& model_id,
                                                 std::uint32_t total_layers,
                                                 std::vector<NodeCapability> nodes) const;

    // Ranks nodes with enough memory headroom by (reliability, compute) and keeps the top replicas per shard.
    ShardPlacement optimize_shard_placement(const std::vector<ModelShard>& shards,
                                            const std::vector<NodeCapability>& nodes) const;

    ShardingPlan plan_model(const std::string& model_id,
                            std::uint32_t total_layers,
                            const std::vector<NodeCapability>& nodes) const;

    // Replaces whatever was registered for the model.
    void register_shards(const std::string& model_id, std::vector<ModelShard> shards, ShardPlacement placement);
    bool has_shards(const std::string& model_id) const;
    // Ordered by layer_start.
    std::vector<ModelShard> shards_for(const std::string& model_id) const;
    std::vector<NodeId> holders(const std::string& model_id, const std::string& shard_id) const;

    static std::string make_checksum(const std::string& model_id,
                                     std::uint32_t layer_start,
                                     std::uint32_t layer_count,
                                     std::uint64_t generated_at_ms);
    // True when the shards tile [0, total_layers) exactly once.
    static bool is_partition(std::vector<ModelShard> shards, std::uint32_t total_layers);
    // Descending (reliability_score, compute_power); node_id breaks ties.
    static bool ranks_before(const NodeCapability& lhs, const NodeCapability& rhs);

private:
    struct RegisteredModel {
        std::vector<ModelShard> shards;
        ShardPlacement placement;
    };

    double mb_per_layer_{10.0};
    double headroom_{1.5};
    std::size_t replicas_{3};

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RegisteredModel> models_;
};

}  // namespace cortexnet
