#pragma once

#include "cortexnet/Types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace cortexnet {

struct Config {
    NodeId node_id{make_unique_id()};
    NodeType node_type{NodeType::FullNode};
    std::string endpoint;
    std::set<std::string> hosted_models;
    double compute_power{1.0};
    double memory_gb{8.0};
    double bandwidth_mbps{100.0};
    bool gpu_available{false};

    std::size_t k_bucket_size{20};
    std::chrono::seconds stale_after{std::chrono::minutes(5)};
    std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(30)};
    std::chrono::milliseconds maintenance_interval{std::chrono::seconds(60)};
    std::chrono::seconds message_cache_ttl{std::chrono::hours(1)};
    std::int32_t message_ttl{10};
    std::size_t max_peers{50};
    std::uint32_t discover_peer_count{20};
    double reannounce_probability{0.1};

    double byzantine_tolerance{0.33};
    double numeric_tolerance{0.01};
    std::uint32_t default_redundancy{3};
    std::chrono::milliseconds default_timeout{std::chrono::seconds(30)};
    std::uint32_t max_concurrent_inferences{10};
    std::size_t connectivity_target{10};

    double shard_mb_per_layer{10.0};
    double placement_headroom{1.5};
    std::size_t placement_replicas{3};

    std::optional<std::uint64_t> identity_seed{};
    bool background_loops{true};
    std::vector<std::string> bootstrap_addresses;
};

}  // namespace cortexnet
