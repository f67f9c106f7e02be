#include "cortexnet/protocol/Message.hpp"

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using namespace cortexnet;
using namespace cortexnet::protocol;

int main() {
    // Envelope defaults.
    const auto heartbeat = make_message("node-a", HeartbeatPayload{0.25, 3}, 7);
    assert(heartbeat.type == MessageType::Heartbeat);
    assert(heartbeat.sender_id == "node-a");
    assert(heartbeat.ttl == 7);
    assert(heartbeat.path == std::vector<NodeId>{"node-a"});
    assert(!heartbeat.message_id.empty());
    assert(heartbeat.timestamp > 0);
    assert(make_message("node-a", HeartbeatPayload{}, 7).message_id != heartbeat.message_id);

    // Inference request with nested input and a shard id.
    InferenceRequestPayload request{};
    request.task_id = "task-1";
    request.request_id = "req-1";
    request.model_id = "llm";
    request.shard_id = "llm_shard_2";
    auto input = Value::make_object();
    input["tokens"] = Value(Value::Array{Value(1), Value(2), Value(3)});
    input["temperature"] = Value(0.7);
    input["stream"] = Value(false);
    input["prompt"] = Value("hello");
    request.input = input;

    auto message = make_message("coordinator", request, 1);
    message.path.push_back("relay");
    const auto encoded = encode(message);
    const auto decoded = decode(encoded);
    assert(decoded.has_value());
    assert(decoded->message_id == message.message_id);
    assert(decoded->type == MessageType::InferenceRequest);
    assert(decoded->ttl == 1);
    assert(decoded->timestamp == message.timestamp);
    assert(decoded->path == message.path);
    const auto* restored = std::get_if<InferenceRequestPayload>(&decoded->payload);
    assert(restored != nullptr);
    assert(restored->shard_id == std::optional<std::string>("llm_shard_2"));
    assert(restored->input == input);

    // Sharding updates carry the full plan.
    NetworkUpdatePayload update{};
    update.model_id = "llm";
    update.total_layers = 8;
    ModelShard shard{};
    shard.model_id = "llm";
    shard.shard_id = "llm_shard_0";
    shard.layer_start = 0;
    shard.layer_end = 7;
    shard.size_mb = 80.0;
    shard.checksum = "0123456789abcdef";
    update.shards.push_back(shard);
    update.placement["llm_shard_0"] = {"n1", "n2"};
    const auto plan_message = decode(encode(make_message("planner", update, 10)));
    assert(plan_message.has_value());
    const auto* plan = std::get_if<NetworkUpdatePayload>(&plan_message->payload);
    assert(plan != nullptr);
    assert(plan->shards.size() == 1);
    assert(plan->shards[0].layer_end == 7);
    assert(plan->shards[0].checksum == shard.checksum);
    assert(plan->placement.at("llm_shard_0").size() == 2);

    // Node announcements keep the advertised capability.
    NodeCapability capability{};
    capability.node_id = "gpu-box";
    capability.node_type = NodeType::ComputeOnly;
    capability.endpoint = "10.0.0.7:7000";
    capability.models = {"llm", "bert"};
    capability.gpu_available = true;
    capability.compute_power = 8.5;
    const auto announce = decode(encode(make_message("gpu-box", NodeAnnouncePayload{capability}, 10)));
    assert(announce.has_value());
    const auto& learned = std::get<NodeAnnouncePayload>(announce->payload).capability;
    assert(learned.node_id == "gpu-box");
    assert(learned.node_type == NodeType::ComputeOnly);
    assert(learned.endpoint == capability.endpoint);
    assert(learned.models == capability.models);
    assert(learned.gpu_available);
    assert(learned.compute_power == 8.5);

    // Truncation anywhere is rejected.
    for (std::size_t cut = 0; cut < encoded.size(); cut += 7) {
        const std::vector<std::uint8_t> prefix(encoded.begin(), encoded.begin() + static_cast<std::ptrdiff_t>(cut));
        assert(!decode(prefix).has_value());
    }

    auto trailing = encoded;
    trailing.push_back(0x00);
    assert(!decode(trailing).has_value());

    auto wrong_version = encoded;
    wrong_version[0] = 0x7F;
    assert(!decode(wrong_version).has_value());

    auto wrong_type = encoded;
    wrong_type[1] = 0x00;
    assert(!decode(wrong_type).has_value());
    wrong_type[1] = 0x0A;
    assert(!decode(wrong_type).has_value());

    // Gossip is relayed; request/response traffic is not.
    assert(is_relayed(MessageType::NodeAnnounce));
    assert(is_relayed(MessageType::ModelAnnounce));
    assert(is_relayed(MessageType::Heartbeat));
    assert(is_relayed(MessageType::NetworkUpdate));
    assert(!is_relayed(MessageType::NodeQuery));
    assert(!is_relayed(MessageType::NodeResponse));
    assert(!is_relayed(MessageType::ModelRequest));
    assert(!is_relayed(MessageType::InferenceRequest));
    assert(!is_relayed(MessageType::InferenceResponse));

    assert(type_of(Payload{ModelRequestPayload{"llm"}}) == MessageType::ModelRequest);
    assert(to_string(MessageType::InferenceResponse) != to_string(MessageType::InferenceRequest));

    return 0;
}
