#pragma once

#include "cortexnet/Types.hpp"
#include "cortexnet/Value.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace cortexnet::protocol {

inline constexpr std::uint8_t kCurrentMessageVersion = 1;
inline constexpr std::size_t kMaxMessageBytes = 16u * 1024u * 1024u;
inline constexpr std::size_t kMaxValueDepth = 32;

enum class MessageType : std::uint8_t {
    NodeAnnounce = 0x01,
    NodeQuery = 0x02,
    NodeResponse = 0x03,
    ModelAnnounce = 0x04,
    ModelRequest = 0x05,
    InferenceRequest = 0x06,
    InferenceResponse = 0x07,
    Heartbeat = 0x08,
    NetworkUpdate = 0x09,
};

std::string to_string(MessageType type);
// Gossip types are relayed; request/response types are point-to-point.
bool is_relayed(MessageType type) noexcept;

inline constexpr const char* kDiscoverPeersQuery = "discover_peers";
inline constexpr const char* kFindModelQuery = "find_model";

struct NodeAnnouncePayload {
    NodeCapability capability;
};

struct NodeQueryPayload {
    std::string query_type{kDiscoverPeersQuery};
    std::uint32_t count{20};
};

struct NodeResponsePayload {
    std::string query_type;
    std::string model_id;
    std::vector<NodeCapability> nodes;
};

struct ModelAnnouncePayload {
    std::string model_id;
    Value model_info;
    NodeId node_id;
};

struct ModelRequestPayload {
    std::string model_id;
};

struct InferenceRequestPayload {
    std::string task_id;
    std::string request_id;
    std::string model_id;
    std::optional<std::string> shard_id;
    Value input;
};

struct InferenceResponsePayload {
    std::string task_id;
    std::string request_id;
    bool success{false};
    Value result;
    std::string error;
    std::uint32_t processing_time_ms{0};
};

struct HeartbeatPayload {
    double load{0.0};
    std::uint32_t active_inferences{0};
};

struct NetworkUpdatePayload {
    std::string model_id;
    std::uint32_t total_layers{0};
    std::vector<ModelShard> shards;
    // shard_id -> holders, best first.
    std::map<std::string, std::vector<NodeId>> placement;
};

// Alternative order matches MessageType values minus one.
using Payload = std::variant<NodeAnnouncePayload,
                             NodeQueryPayload,
                             NodeResponsePayload,
                             ModelAnnouncePayload,
                             ModelRequestPayload,
                             InferenceRequestPayload,
                             InferenceResponsePayload,
                             HeartbeatPayload,
                             NetworkUpdatePayload>;

MessageType type_of(const Payload& payload) noexcept;

struct Message {
    std::string message_id;
    MessageType type{MessageType::NodeAnnounce};
    NodeId sender_id;
    std::int32_t ttl{10};
    std::uint64_t timestamp{0};
    std::vector<NodeId> path;
    Payload payload{};
};

// Fresh envelope with a unique id, the current wall-clock timestamp and the sender as the first path hop.
Message make_message(const NodeId& sender, Payload payload, std::int32_t ttl);

std::vector<std::uint8_t> encode(const Message& message);
// nullopt on truncated, oversized or malformed input.
std::optional<Message> decode(std::span<const std::uint8_t> buffer);

}  // namespace cortexnet::protocol
