#include "cortexnet/core/ShardPlanner.hpp"

#include "cortexnet/crypto/Sha256.hpp"
#include "cortexnet/diagnostics/StructuredLogger.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>

namespace cortexnet {

using diagnostics::StructuredLogger;
using diagnostics::log_event;

namespace {

std::string hex_prefix(const crypto::Sha256::Digest& digest, std::size_t chars) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(chars);
    for (const auto byte : digest) {
        if (out.size() >= chars) {
            break;
        }
        out.push_back(kHex[byte >> 4]);
        out.push_back(kHex[byte & 0x0F]);
    }
    out.resize(std::min(out.size(), chars));
    return out;
}

double usable_power(const NodeCapability& node) {
    return std::isfinite(node.compute_power) ? std::max(0.0, node.compute_power) : 0.0;
}

}  // namespace

ShardPlanner::ShardPlanner(const Config& config)
    : mb_per_layer_(config.shard_mb_per_layer > 0.0 ? config.shard_mb_per_layer : 10.0),
      headroom_(config.placement_headroom >= 1.0 ? config.placement_headroom : 1.0),
      replicas_(std::max<std::size_t>(config.placement_replicas, 1)) {}

std::vector<ModelShard> ShardPlanner::create_sharding_plan(const std::string& model_id,
                                                           std::uint32_t total_layers,
                                                           std::vector<NodeCapability> nodes) const {
    if (total_layers == 0 || nodes.empty()) {
        return {};
    }

    std::stable_sort(nodes.begin(), nodes.end(), [](const NodeCapability& lhs, const NodeCapability& rhs) {
        return usable_power(lhs) > usable_power(rhs);
    });
    // Every included node receives at least one layer.
    if (nodes.size() > total_layers) {
        nodes.resize(total_layers);
    }

    const auto node_count = static_cast<std::uint32_t>(nodes.size());
    const double total_power = std::accumulate(nodes.begin(), nodes.end(), 0.0, [](double sum, const NodeCapability& node) {
        return sum + usable_power(node);
    });
    const auto generated_at = unix_millis_now();

    std::vector<ModelShard> shards;
    shards.reserve(nodes.size());
    std::uint32_t next_layer = 0;

    for (std::uint32_t index = 0; index < node_count; ++index) {
        const auto remaining = total_layers - next_layer;
        const auto nodes_after = node_count - index - 1;

        std::uint32_t count = 0;
        if (nodes_after == 0) {
            count = remaining;
        } else {
            if (total_power > 0.0) {
                const auto share = std::floor(static_cast<double>(total_layers) * usable_power(nodes[index]) / total_power);
                count = static_cast<std::uint32_t>(share);
            } else {
                count = total_layers / node_count;
            }
            count = std::clamp<std::uint32_t>(count, 1, remaining - nodes_after);
        }

        ModelShard shard{};
        shard.model_id = model_id;
        shard.shard_id = model_id + "_shard_" + std::to_string(index);
        shard.layer_start = next_layer;
        shard.layer_end = next_layer + count - 1;
        shard.size_mb = static_cast<double>(count) * mb_per_layer_;
        shard.checksum = make_checksum(model_id, shard.layer_start, count, generated_at);
        shards.push_back(std::move(shard));

        next_layer += count;
    }

    return shards;
}

ShardPlacement ShardPlanner::optimize_shard_placement(const std::vector<ModelShard>& shards,
                                                      const std::vector<NodeCapability>& nodes) const {
    ShardPlacement placement;
    for (const auto& shard : shards) {
        const double required_mb = shard.size_mb * headroom_;

        std::vector<const NodeCapability*> eligible;
        for (const auto& node : nodes) {
            if (node.memory_gb * 1024.0 >= required_mb) {
                eligible.push_back(&node);
            }
        }
        std::sort(eligible.begin(), eligible.end(), [](const NodeCapability* lhs, const NodeCapability* rhs) {
            return ranks_before(*lhs, *rhs);
        });
        if (eligible.size() > replicas_) {
            eligible.resize(replicas_);
        }

        auto& holders = placement[shard.shard_id];
        for (const auto* node : eligible) {
            holders.push_back(node->node_id);
        }
    }
    return placement;
}

ShardingPlan ShardPlanner::plan_model(const std::string& model_id,
                                      std::uint32_t total_layers,
                                      const std::vector<NodeCapability>& nodes) const {
    ShardingPlan plan{};
    plan.model_id = model_id;
    plan.total_layers = total_layers;
    plan.created_at = Clock::now();
    plan.shards = create_sharding_plan(model_id, total_layers, nodes);
    if (plan.shards.empty()) {
        plan.diagnostics.emplace_back("No shards produced; model has no layers or no candidate nodes.");
        return plan;
    }

    auto ordered = nodes;
    std::stable_sort(ordered.begin(), ordered.end(), [](const NodeCapability& lhs, const NodeCapability& rhs) {
        return usable_power(lhs) > usable_power(rhs);
    });
    for (std::size_t index = 0; index < plan.shards.size(); ++index) {
        plan.allocation[plan.shards[index].shard_id] = ordered[index].node_id;
    }

    plan.placement = optimize_shard_placement(plan.shards, nodes);
    for (auto& [shard_id, holders] : plan.placement) {
        if (holders.empty()) {
            holders.push_back(plan.allocation[shard_id]);
            plan.diagnostics.emplace_back("No node has memory headroom for " + shard_id + "; using its compute allocation.");
        }
    }

    log_event(StructuredLogger::Level::Info,
              "planner.plan_created",
              {{"model", model_id},
               {"layers", std::to_string(total_layers)},
               {"shards", std::to_string(plan.shards.size())}});
    return plan;
}

void ShardPlanner::register_shards(const std::string& model_id, std::vector<ModelShard> shards, ShardPlacement placement) {
    std::sort(shards.begin(), shards.end(), [](const ModelShard& lhs, const ModelShard& rhs) {
        return lhs.layer_start < rhs.layer_start;
    });

    std::scoped_lock lock(mutex_);
    if (shards.empty()) {
        models_.erase(model_id);
        return;
    }
    auto& entry = models_[model_id];
    entry.shards = std::move(shards);
    entry.placement = std::move(placement);
}

bool ShardPlanner::has_shards(const std::string& model_id) const {
    std::scoped_lock lock(mutex_);
    return models_.find(model_id) != models_.end();
}

std::vector<ModelShard> ShardPlanner::shards_for(const std::string& model_id) const {
    std::scoped_lock lock(mutex_);
    const auto it = models_.find(model_id);
    if (it == models_.end()) {
        return {};
    }
    return it->second.shards;
}

std::vector<NodeId> ShardPlanner::holders(const std::string& model_id, const std::string& shard_id) const {
    std::scoped_lock lock(mutex_);
    const auto it = models_.find(model_id);
    if (it == models_.end()) {
        return {};
    }
    const auto placed = it->second.placement.find(shard_id);
    if (placed == it->second.placement.end()) {
        return {};
    }
    return placed->second;
}

std::string ShardPlanner::make_checksum(const std::string& model_id,
                                        std::uint32_t layer_start,
                                        std::uint32_t layer_count,
                                        std::uint64_t generated_at_ms) {
    std::ostringstream tag;
    tag << model_id << ':' << layer_start << ':' << layer_count << ':' << generated_at_ms;
    return hex_prefix(crypto::Sha256::digest(std::string_view(tag.str())), 16);
}

bool ShardPlanner::is_partition(std::vector<ModelShard> shards, std::uint32_t total_layers) {
    if (shards.empty() || total_layers == 0) {
        return false;
    }
    std::sort(shards.begin(), shards.end(), [](const ModelShard& lhs, const ModelShard& rhs) {
        return lhs.layer_start < rhs.layer_start;
    });
    std::uint32_t expected = 0;
    for (const auto& shard : shards) {
        if (shard.layer_start != expected || shard.layer_end < shard.layer_start) {
            return false;
        }
        expected = shard.layer_end + 1;
    }
    return expected == total_layers;
}

bool ShardPlanner::ranks_before(const NodeCapability& lhs, const NodeCapability& rhs) {
    if (lhs.reliability_score != rhs.reliability_score) {
        return lhs.reliability_score > rhs.reliability_score;
    }
    if (lhs.compute_power != rhs.compute_power) {
        return lhs.compute_power > rhs.compute_power;
    }
    return lhs.node_id < rhs.node_id;
}

}  // namespace cortexnet
