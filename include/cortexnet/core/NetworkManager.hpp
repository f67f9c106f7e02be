#pragma once

#include "cortexnet/Config.hpp"
#include "cortexnet/Types.hpp"
#include "cortexnet/Value.hpp"
#include "cortexnet/core/ConsensusEngine.hpp"
#include "cortexnet/core/InferenceCoordinator.hpp"
#include "cortexnet/core/InferenceExecutor.hpp"
#include "cortexnet/core/ShardPlanner.hpp"
#include "cortexnet/dht/KademliaTable.hpp"
#include "cortexnet/network/MessageCache.hpp"
#include "cortexnet/network/Transport.hpp"
#include "cortexnet/protocol/Message.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace cortexnet {

namespace test {
class NetworkManagerTestAccess;
}

struct NetworkMetrics {
    std::uint64_t messages_sent{0};
    std::uint64_t messages_received{0};
    std::uint64_t messages_forwarded{0};
    std::uint64_t messages_dropped{0};
    std::uint64_t inferences_completed{0};
    std::uint64_t inferences_succeeded{0};
    std::uint64_t consensus_reached{0};
    std::uint64_t consensus_failed{0};
    double average_latency_ms{0.0};
};

struct NetworkStatus {
    NodeId node_id;
    NodeType node_type{NodeType::FullNode};
    bool running{false};
    std::size_t connected_peers{0};
    std::size_t known_nodes{0};
    std::size_t active_inferences{0};
    NetworkMetrics metrics;
    double health_score{0.0};
};

// A node's presence on the network: lifecycle, gossip, liveness and the public inference API.
class NetworkManager : public InferenceDispatcher {
public:
    NetworkManager(Config config,
                   std::unique_ptr<network::Transport> transport,
                   std::shared_ptr<InferenceExecutor> executor = nullptr);
    ~NetworkManager() override;

    NetworkManager(const NetworkManager&) = delete;
    NetworkManager& operator=(const NetworkManager&) = delete;

    // Uses Config::bootstrap_addresses. Returns false only when bootstrap addresses were given and none answered.
    bool start_network();
    bool start_network(const std::vector<std::string>& bootstrap_addresses);
    void stop_network();
    bool running() const noexcept { return running_.load(); }

    void announce_self();
    void announce_model(const std::string& model_id, Value model_info = Value::make_object());

    InferenceResult request_inference(const std::string& model_id,
                                      Value input,
                                      int priority = 5,
                                      std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                                      std::optional<std::uint32_t> redundancy = std::nullopt);

    NetworkStatus get_network_status() const;

    // Plans the model over the peers hosting it, registers the plan locally and gossips it.
    ShardingPlan publish_sharding_plan(const std::string& model_id, std::uint32_t total_layers);

    // One pass of each background loop; the worker thread calls these on their intervals.
    void heartbeat();
    void maintain();
    void maintain(Clock::time_point now);

    bool connect_peer(const std::string& address);
    std::vector<NodeId> connected_peers() const;

    void on_message(const network::TransportMessage& message);

    PendingReply dispatch(const NodeCapability& node, const StageRequest& request) override;
    void abandon(const std::string& request_id) override;

    void set_executor(std::shared_ptr<InferenceExecutor> executor);
    void set_phase_observer(InferenceCoordinator::PhaseObserver observer);

    const NodeId& node_id() const noexcept { return config_.node_id; }
    const Config& config() const noexcept { return config_; }
    NodeCapability self_capability() const;
    dht::KademliaTable& dht() noexcept { return table_; }
    const dht::KademliaTable& dht() const noexcept { return table_; }
    ShardPlanner& planner() noexcept { return planner_; }
    const ConsensusEngine& consensus() const noexcept { return consensus_; }

private:
    friend class test::NetworkManagerTestAccess;

    struct PendingRequest {
        NodeId node_id;
        std::promise<StageReply> promise;
    };

    struct Counters {
        std::atomic<std::uint64_t> sent{0};
        std::atomic<std::uint64_t> received{0};
        std::atomic<std::uint64_t> forwarded{0};
        std::atomic<std::uint64_t> dropped{0};
        std::atomic<std::uint64_t> completed{0};
        std::atomic<std::uint64_t> succeeded{0};
        std::atomic<std::uint64_t> consensus_reached{0};
        std::atomic<std::uint64_t> consensus_failed{0};
        std::atomic<std::uint64_t> total_latency_ms{0};
    };

    void handle(const protocol::NodeAnnouncePayload& payload, const protocol::Message& message, const NodeId& from);
    void handle(const protocol::NodeQueryPayload& payload, const protocol::Message& message, const NodeId& from);
    void handle(const protocol::NodeResponsePayload& payload, const protocol::Message& message, const NodeId& from);
    void handle(const protocol::ModelAnnouncePayload& payload, const protocol::Message& message, const NodeId& from);
    void handle(const protocol::ModelRequestPayload& payload, const protocol::Message& message, const NodeId& from);
    void handle(const protocol::InferenceRequestPayload& payload, const protocol::Message& message, const NodeId& from);
    void handle(const protocol::InferenceResponsePayload& payload, const protocol::Message& message, const NodeId& from);
    void handle(const protocol::HeartbeatPayload& payload, const protocol::Message& message, const NodeId& from);
    void handle(const protocol::NetworkUpdatePayload& payload, const protocol::Message& message, const NodeId& from);

    void broadcast(protocol::Payload payload);
    void relay(protocol::Message message, const NodeId& from);
    bool send_to(const NodeId& peer, const protocol::Message& message);
    bool reply_to(const NodeId& peer, protocol::Payload payload);

    void note_contact(const NodeId& peer, Clock::time_point now);
    bool ensure_connected(const NodeCapability& node);
    void learn_node(NodeCapability capability);
    void record_model_fact(const std::string& model_id, const Value& model_info, const NodeId& node_id);
    void complete_request(const std::string& request_id, StageReply reply, const std::optional<NodeId>& from);
    void fail_pending_requests(const std::string& reason);
    void record_result(const InferenceResult& result);
    double current_load() const;

    void serve_inference(const protocol::InferenceRequestPayload& payload, const NodeId& from);
    // Waits for in-flight inference serving to reply.
    void drain_serving();

    void start_worker();
    void stop_worker();
    void worker_loop();

    Config config_;
    std::unique_ptr<network::Transport> transport_;
    dht::KademliaTable table_;
    ShardPlanner planner_;
    ConsensusEngine consensus_;
    InferenceCoordinator coordinator_;
    network::MessageCache cache_;

    mutable std::mutex self_mutex_;
    std::set<std::string> hosted_models_;
    std::map<std::string, Value> model_info_;
    std::shared_ptr<InferenceExecutor> executor_;

    // Connection table: peer -> last time anything was heard from it.
    mutable std::mutex connections_mutex_;
    std::unordered_map<NodeId, Clock::time_point> connections_;

    mutable std::mutex pending_mutex_;
    std::unordered_map<std::string, PendingRequest> pending_;

    std::mutex serving_mutex_;
    std::vector<std::future<void>> serving_;

    std::mutex rng_mutex_;
    std::mt19937_64 rng_;

    mutable Counters counters_{};
    std::atomic<std::uint32_t> active_inferences_{0};
    std::atomic<bool> running_{false};

    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    bool stop_requested_{false};
    std::thread worker_;
};

}  // namespace cortexnet
