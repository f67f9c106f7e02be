#include "cortexnet/Config.hpp"
#include "cortexnet/core/NetworkManager.hpp"
#include "cortexnet/diagnostics/StructuredLogger.hpp"
#include "cortexnet/network/Transport.hpp"
#include "cortexnet/protocol/Message.hpp"
#include "test_access.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace cortexnet;
using namespace std::chrono_literals;

namespace {

// Accepts every address as a peer id and records what would have been sent.
class RecordingTransport : public network::Transport {
public:
    struct Sent {
        NodeId peer;
        protocol::Message message;
    };

    std::optional<NodeId> connect(const std::string& address) override {
        std::scoped_lock lock(mutex_);
        if (unreachable_.count(address) != 0) {
            return std::nullopt;
        }
        return address;
    }

    void disconnect(const NodeId& peer) override {
        std::scoped_lock lock(mutex_);
        disconnected_.push_back(peer);
    }

    bool send(const NodeId& peer, std::span<const std::uint8_t> payload) override {
        auto decoded = protocol::decode(payload);
        assert(decoded.has_value());
        std::scoped_lock lock(mutex_);
        sent_.push_back(Sent{peer, std::move(*decoded)});
        return true;
    }

    void set_message_handler(MessageHandler) override {}

    void mark_unreachable(const std::string& address) {
        std::scoped_lock lock(mutex_);
        unreachable_.insert(address);
    }

    std::vector<Sent> take() {
        std::scoped_lock lock(mutex_);
        auto out = std::move(sent_);
        sent_.clear();
        return out;
    }

    std::vector<NodeId> disconnected() const {
        std::scoped_lock lock(mutex_);
        return disconnected_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Sent> sent_;
    std::vector<NodeId> disconnected_;
    std::set<std::string> unreachable_;
};

std::set<NodeId> recipients(const std::vector<RecordingTransport::Sent>& sent) {
    std::set<NodeId> peers;
    for (const auto& entry : sent) {
        peers.insert(entry.peer);
    }
    return peers;
}

void deliver(NetworkManager& manager, const NodeId& from, const protocol::Message& message) {
    manager.on_message(network::TransportMessage{from, protocol::encode(message)});
}

protocol::Message heartbeat_from(const NodeId& origin, std::int32_t ttl) {
    return protocol::make_message(origin, protocol::HeartbeatPayload{0.5, 1}, ttl);
}

}  // namespace

int main() {
    diagnostics::StructuredLogger::instance().set_enabled(false);

    Config config{};
    config.node_id = "hub";
    config.background_loops = false;
    config.reannounce_probability = 0.0;

    auto transport = std::make_unique<RecordingTransport>();
    auto* wire = transport.get();
    NetworkManager manager{config, std::move(transport)};
    assert(manager.start_network());
    wire->take();

    for (const auto* peer : {"alpha", "beta", "gamma"}) {
        assert(manager.connect_peer(peer));
    }
    assert(manager.connected_peers() == (std::vector<NodeId>{"alpha", "beta", "gamma"}));

    // Relay to everyone except the neighbour it came from, one hop spent, self appended.
    {
        const auto original = heartbeat_from("alpha", 3);
        deliver(manager, "alpha", original);
        const auto sent = wire->take();
        assert(recipients(sent) == (std::set<NodeId>{"beta", "gamma"}));
        for (const auto& entry : sent) {
            assert(entry.message.message_id == original.message_id);
            assert(entry.message.ttl == 2);
            assert(entry.message.path == (std::vector<NodeId>{"alpha", "hub"}));
            assert(entry.message.sender_id == "alpha");
        }
        assert(test::NetworkManagerTestAccess::seen_message(manager, original.message_id));

        // The same id again is dropped without forwarding.
        deliver(manager, "beta", original);
        assert(wire->take().empty());
    }

    // Nodes already on the path are skipped.
    {
        auto visited = heartbeat_from("origin", 5);
        visited.path.push_back("gamma");
        deliver(manager, "gamma", visited);
        assert(recipients(wire->take()) == (std::set<NodeId>{"alpha", "beta"}));

        auto through_beta = heartbeat_from("origin", 5);
        through_beta.path.push_back("beta");
        deliver(manager, "alpha", through_beta);
        assert(recipients(wire->take()) == (std::set<NodeId>{"gamma"}));
    }

    // An exhausted hop budget is processed locally but not forwarded.
    {
        NodeCapability stranger{};
        stranger.node_id = "stranger";
        stranger.models = {"llm"};
        auto announce = protocol::make_message("stranger", protocol::NodeAnnouncePayload{stranger}, 0);
        deliver(manager, "alpha", announce);
        const auto sent = wire->take();
        for (const auto& entry : sent) {
            assert(entry.message.message_id != announce.message_id);
        }
        assert(manager.dht().get_node("stranger").has_value());
        assert(manager.dht().find_nodes_with_model("llm").size() == 1);
    }

    // Our own messages echoed back are ignored.
    {
        const auto echo = heartbeat_from("hub", 4);
        deliver(manager, "alpha", echo);
        assert(wire->take().empty());
    }

    // Point-to-point requests are answered to the sender only.
    {
        auto request = protocol::make_message("beta", protocol::ModelRequestPayload{"llm"}, 10);
        deliver(manager, "beta", request);
        const auto sent = wire->take();
        assert(sent.size() == 1);
        assert(sent.front().peer == "beta");
        const auto* response = std::get_if<protocol::NodeResponsePayload>(&sent.front().message.payload);
        assert(response != nullptr);
        assert(response->query_type == protocol::kFindModelQuery);
        assert(response->model_id == "llm");
        assert(response->nodes.size() == 1);
        assert(response->nodes.front().node_id == "stranger");
    }

    // Peer discovery answers with known nodes plus ourselves.
    {
        protocol::NodeQueryPayload query{};
        query.count = 10;
        deliver(manager, "gamma", protocol::make_message("gamma", query, 10));
        const auto sent = wire->take();
        assert(sent.size() == 1);
        const auto& response = std::get<protocol::NodeResponsePayload>(sent.front().message.payload);
        const auto self = std::find_if(response.nodes.begin(), response.nodes.end(), [](const NodeCapability& node) {
            return node.node_id == "hub";
        });
        assert(self != response.nodes.end());
    }

    // Unknown query types get no answer.
    {
        protocol::NodeQueryPayload query{};
        query.query_type = "who_is_leader";
        deliver(manager, "gamma", protocol::make_message("gamma", query, 10));
        assert(wire->take().empty());
    }

    // Garbage is counted and dropped.
    {
        const auto before = manager.get_network_status().metrics.messages_dropped;
        manager.on_message(network::TransportMessage{"alpha", {0x01, 0x02, 0x03}});
        assert(manager.get_network_status().metrics.messages_dropped == before + 1);
        assert(wire->take().empty());
    }

    // Heartbeats update the sender's advertised load.
    {
        deliver(manager, "alpha", protocol::make_message("stranger", protocol::HeartbeatPayload{0.75, 4}, 0));
        assert(manager.dht().get_node("stranger")->current_load == 0.75);
        wire->take();
    }

    // Announced reliability cannot be self-assigned, and NaN never reaches the table.
    {
        NodeCapability braggart{};
        braggart.node_id = "braggart";
        braggart.models = {"llm"};
        braggart.compute_power = 2.0;
        braggart.reliability_score = 7.5;
        deliver(manager, "alpha", protocol::make_message("braggart", protocol::NodeAnnouncePayload{braggart}, 0));

        NodeCapability garbled{};
        garbled.node_id = "garbled";
        garbled.models = {"llm"};
        garbled.compute_power = std::numeric_limits<double>::quiet_NaN();
        garbled.reliability_score = std::numeric_limits<double>::quiet_NaN();
        deliver(manager, "alpha", protocol::make_message("garbled", protocol::NodeAnnouncePayload{garbled}, 0));
        wire->take();

        for (const auto& node : manager.dht().find_nodes_with_model("llm")) {
            assert(node.reliability_score >= 0.0 && node.reliability_score <= 1.0);
            assert(std::isfinite(node.compute_power));
        }
        assert(manager.dht().get_node("braggart")->reliability_score == 1.0);
        assert(manager.dht().get_node("garbled")->compute_power == 0.0);
    }

    // Broadcasts go to every connected peer with the configured hop budget.
    {
        manager.heartbeat();
        const auto sent = wire->take();
        assert(recipients(sent).count("alpha") == 1);
        assert(recipients(sent).count("beta") == 1);
        for (const auto& entry : sent) {
            assert(entry.message.ttl == config.message_ttl);
            assert(entry.message.path == std::vector<NodeId>{"hub"});
            assert(entry.message.type == protocol::MessageType::Heartbeat);
        }
    }

    // Maintenance drops quiet connections that never made it into the table.
    {
        assert(test::NetworkManagerTestAccess::age_connection(manager, "gamma", 10min));
        manager.maintain();
        const auto peers = manager.connected_peers();
        assert(std::find(peers.begin(), peers.end(), "gamma") == peers.end());
        const auto dropped = wire->disconnected();
        assert(std::find(dropped.begin(), dropped.end(), "gamma") != dropped.end());
    }

    wire->mark_unreachable("nowhere");
    assert(!manager.connect_peer("nowhere"));

    manager.stop_network();
    assert(!manager.running());
    assert(manager.connected_peers().empty());

    // Out-of-range tunables are clamped when the manager is built.
    {
        Config loose{};
        loose.node_id.clear();
        loose.background_loops = false;
        loose.k_bucket_size = 0;
        loose.default_redundancy = 0;
        loose.message_ttl = -3;
        loose.byzantine_tolerance = 1.5;
        loose.default_timeout = 0ms;
        loose.heartbeat_interval = 0ms;
        NetworkManager sanitized{loose, std::make_unique<RecordingTransport>()};
        assert(!sanitized.node_id().empty());
        assert(sanitized.config().k_bucket_size == 1);
        assert(sanitized.config().default_redundancy == 1);
        assert(sanitized.config().message_ttl == 1);
        assert(sanitized.config().byzantine_tolerance < 1.0);
        assert(sanitized.config().default_timeout > 0ms);
        assert(sanitized.config().heartbeat_interval > 0ms);
    }

    bool rejected = false;
    try {
        NetworkManager missing{config, nullptr};
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    assert(rejected);
    return 0;
}
