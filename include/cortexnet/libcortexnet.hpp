#pragma once

#include "cortexnet/Export.hpp"
#include "cortexnet/Config.hpp"
#include "cortexnet/Types.hpp"
#include "cortexnet/Value.hpp"
#include "cortexnet/core/InferenceCoordinator.hpp"
#include "cortexnet/core/InferenceExecutor.hpp"
#include "cortexnet/core/NetworkManager.hpp"
#include "cortexnet/network/Transport.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cortexnet::lib {

// Stable embedding surface for hosting agents.
class CORTEXNET_API Node {
public:
    Node(Config config,
         std::unique_ptr<network::Transport> transport,
         std::shared_ptr<InferenceExecutor> executor = nullptr);
    ~Node();

    Node(Node&&) noexcept;
    Node& operator=(Node&&) noexcept;
    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    bool start_network(const std::vector<std::string>& bootstrap_addresses = {});
    void stop_network();

    void announce_model(const std::string& model_id, Value model_info = Value::make_object());
    InferenceResult request_inference(const std::string& model_id,
                                      Value input,
                                      int priority = 5,
                                      std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    NetworkStatus get_network_status() const;
    ShardingPlan publish_sharding_plan(const std::string& model_id, std::uint32_t total_layers);

    const NodeId& node_id() const noexcept;
    const Config& config() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace cortexnet::lib
