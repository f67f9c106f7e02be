#pragma once

#include "cortexnet/Value.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace cortexnet {

using NodeId = std::string;
using Clock = std::chrono::steady_clock;

enum class NodeType : std::uint8_t {
    FullNode = 0,
    ComputeOnly = 1,
    CoordinatorOnly = 2,
    Gateway = 3,
};

inline constexpr std::size_t kNodeTypeCount = 4;

std::string to_string(NodeType type);
std::optional<NodeType> node_type_from_string(std::string_view text);

struct NodeCapability {
    NodeId node_id;
    NodeType node_type{NodeType::FullNode};
    // Transport address peers use to reach this node; empty means "same as node_id".
    std::string endpoint;
    std::set<std::string> models;
    double compute_power{1.0};
    double memory_gb{8.0};
    double bandwidth_mbps{100.0};
    bool gpu_available{false};
    double reliability_score{1.0};
    double current_load{0.0};
    Clock::time_point last_seen{};

    bool hosts(const std::string& model_id) const { return models.count(model_id) != 0; }
    const std::string& address() const { return endpoint.empty() ? node_id : endpoint; }
};

struct ModelShard {
    std::string model_id;
    std::string shard_id;
    std::uint32_t layer_start{0};
    // Inclusive.
    std::uint32_t layer_end{0};
    double size_mb{0.0};
    std::string checksum;

    std::uint32_t layer_count() const { return layer_end - layer_start + 1; }
};

struct InferenceTask {
    std::string task_id;
    std::string model_id;
    Value input_data;
    int priority{5};
    std::chrono::milliseconds timeout{std::chrono::seconds(30)};
    std::uint32_t redundancy{1};
    Clock::time_point created_at{};
    NodeId client_id;
};

// 32 lowercase hex characters drawn from a per-thread 64-bit generator.
std::string make_unique_id();

// First eight bytes of SHA-256(id), big-endian.
std::uint64_t hash_identifier(std::string_view id);
std::uint64_t xor_distance(std::string_view lhs, std::string_view rhs);

std::uint64_t unix_millis_now();

}  // namespace cortexnet
