#include "cortexnet/protocol/Message.hpp"

#include <bit>
#include <type_traits>
#include <utility>

namespace cortexnet::protocol {

namespace {

void write_u8(std::vector<std::uint8_t>& out, std::uint8_t value) {
    out.push_back(value);
}

void write_u32(std::vector<std::uint8_t>& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}

void write_u64(std::vector<std::uint8_t>& out, std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFu));
    }
}

void write_f64(std::vector<std::uint8_t>& out, double value) {
    write_u64(out, std::bit_cast<std::uint64_t>(value));
}

void write_string(std::vector<std::uint8_t>& out, const std::string& value) {
    write_u32(out, static_cast<std::uint32_t>(value.size()));
    out.insert(out.end(), value.begin(), value.end());
}

void write_strings(std::vector<std::uint8_t>& out, const std::vector<std::string>& values) {
    write_u32(out, static_cast<std::uint32_t>(values.size()));
    for (const auto& value : values) {
        write_string(out, value);
    }
}

void write_value(std::vector<std::uint8_t>& out, const Value& value) {
    write_u8(out, static_cast<std::uint8_t>(value.type));
    switch (value.type) {
        case ValueType::Null:
            break;
        case ValueType::Boolean:
            write_u8(out, value.boolean_value ? 1 : 0);
            break;
        case ValueType::Integer:
            write_u64(out, static_cast<std::uint64_t>(value.integer_value));
            break;
        case ValueType::Double:
            write_f64(out, value.double_value);
            break;
        case ValueType::String:
            write_string(out, value.string_value);
            break;
        case ValueType::Array:
            write_u32(out, static_cast<std::uint32_t>(value.array_value.size()));
            for (const auto& item : value.array_value) {
                write_value(out, item);
            }
            break;
        case ValueType::Object:
            write_u32(out, static_cast<std::uint32_t>(value.object_value.size()));
            for (const auto& [key, item] : value.object_value) {
                write_string(out, key);
                write_value(out, item);
            }
            break;
    }
}

void write_capability(std::vector<std::uint8_t>& out, const NodeCapability& capability) {
    write_string(out, capability.node_id);
    write_u8(out, static_cast<std::uint8_t>(capability.node_type));
    write_string(out, capability.endpoint);
    write_u32(out, static_cast<std::uint32_t>(capability.models.size()));
    for (const auto& model : capability.models) {
        write_string(out, model);
    }
    write_f64(out, capability.compute_power);
    write_f64(out, capability.memory_gb);
    write_f64(out, capability.bandwidth_mbps);
    write_u8(out, capability.gpu_available ? 1 : 0);
    write_f64(out, capability.reliability_score);
    write_f64(out, capability.current_load);
}

void write_shard(std::vector<std::uint8_t>& out, const ModelShard& shard) {
    write_string(out, shard.model_id);
    write_string(out, shard.shard_id);
    write_u32(out, shard.layer_start);
    write_u32(out, shard.layer_end);
    write_f64(out, shard.size_mb);
    write_string(out, shard.checksum);
}

// Bounds-checked cursor over an input buffer. Every read fails once the buffer is exhausted.
class Reader {
public:
    explicit Reader(std::span<const std::uint8_t> data)
        : data_(data) {}

    bool ok() const { return ok_; }
    bool at_end() const { return cursor_ == data_.size(); }
    std::size_t remaining() const { return data_.size() - cursor_; }

    std::uint8_t u8() {
        if (!require(1)) {
            return 0;
        }
        return data_[cursor_++];
    }

    std::uint32_t u32() {
        if (!require(4)) {
            return 0;
        }
        std::uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value = (value << 8) | data_[cursor_++];
        }
        return value;
    }

    std::uint64_t u64() {
        if (!require(8)) {
            return 0;
        }
        std::uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value = (value << 8) | data_[cursor_++];
        }
        return value;
    }

    double f64() { return std::bit_cast<double>(u64()); }

    bool boolean() {
        const auto raw = u8();
        if (raw > 1) {
            ok_ = false;
        }
        return raw == 1;
    }

    std::string string() {
        const auto length = u32();
        if (!require(length)) {
            return {};
        }
        std::string value(reinterpret_cast<const char*>(data_.data() + cursor_), length);
        cursor_ += length;
        return value;
    }

    // Element counts are sanity-checked against the bytes left so a forged count cannot force huge reservations.
    std::uint32_t count(std::size_t min_element_bytes) {
        const auto value = u32();
        if (ok_ && static_cast<std::size_t>(value) * min_element_bytes > remaining()) {
            ok_ = false;
            return 0;
        }
        return value;
    }

    std::vector<std::string> strings() {
        std::vector<std::string> values;
        const auto total = count(4);
        values.reserve(total);
        for (std::uint32_t i = 0; i < total && ok_; ++i) {
            values.push_back(string());
        }
        return values;
    }

    Value value(std::size_t depth = 0) {
        if (depth > kMaxValueDepth) {
            ok_ = false;
            return {};
        }
        const auto tag = u8();
        switch (tag) {
            case static_cast<std::uint8_t>(ValueType::Null):
                return {};
            case static_cast<std::uint8_t>(ValueType::Boolean):
                return Value(boolean());
            case static_cast<std::uint8_t>(ValueType::Integer):
                return Value(static_cast<std::int64_t>(u64()));
            case static_cast<std::uint8_t>(ValueType::Double):
                return Value(f64());
            case static_cast<std::uint8_t>(ValueType::String):
                return Value(string());
            case static_cast<std::uint8_t>(ValueType::Array): {
                auto result = Value::make_array();
                const auto total = count(1);
                for (std::uint32_t i = 0; i < total && ok_; ++i) {
                    result.array_value.push_back(value(depth + 1));
                }
                return result;
            }
            case static_cast<std::uint8_t>(ValueType::Object): {
                auto result = Value::make_object();
                const auto total = count(5);
                for (std::uint32_t i = 0; i < total && ok_; ++i) {
                    auto key = string();
                    result.object_value[std::move(key)] = value(depth + 1);
                }
                return result;
            }
            default:
                ok_ = false;
                return {};
        }
    }

    NodeCapability capability() {
        NodeCapability capability{};
        capability.node_id = string();
        const auto type = u8();
        if (type >= kNodeTypeCount) {
            ok_ = false;
        }
        capability.node_type = static_cast<NodeType>(type);
        capability.endpoint = string();
        const auto models = count(4);
        for (std::uint32_t i = 0; i < models && ok_; ++i) {
            capability.models.insert(string());
        }
        capability.compute_power = f64();
        capability.memory_gb = f64();
        capability.bandwidth_mbps = f64();
        capability.gpu_available = boolean();
        capability.reliability_score = f64();
        capability.current_load = f64();
        if (capability.node_id.empty()) {
            ok_ = false;
        }
        return capability;
    }

    ModelShard shard() {
        ModelShard shard{};
        shard.model_id = string();
        shard.shard_id = string();
        shard.layer_start = u32();
        shard.layer_end = u32();
        shard.size_mb = f64();
        shard.checksum = string();
        if (shard.layer_end < shard.layer_start) {
            ok_ = false;
        }
        return shard;
    }

private:
    bool require(std::size_t bytes) {
        if (!ok_ || remaining() < bytes) {
            ok_ = false;
            return false;
        }
        return true;
    }

    std::span<const std::uint8_t> data_;
    std::size_t cursor_{0};
    bool ok_{true};
};

std::optional<Payload> decode_payload(MessageType type, Reader& reader) {
    switch (type) {
        case MessageType::NodeAnnounce:
            return Payload{NodeAnnouncePayload{reader.capability()}};
        case MessageType::NodeQuery: {
            NodeQueryPayload payload{};
            payload.query_type = reader.string();
            payload.count = reader.u32();
            return Payload{std::move(payload)};
        }
        case MessageType::NodeResponse: {
            NodeResponsePayload payload{};
            payload.query_type = reader.string();
            payload.model_id = reader.string();
            const auto total = reader.count(16);
            for (std::uint32_t i = 0; i < total && reader.ok(); ++i) {
                payload.nodes.push_back(reader.capability());
            }
            return Payload{std::move(payload)};
        }
        case MessageType::ModelAnnounce: {
            ModelAnnouncePayload payload{};
            payload.model_id = reader.string();
            payload.model_info = reader.value();
            payload.node_id = reader.string();
            return Payload{std::move(payload)};
        }
        case MessageType::ModelRequest:
            return Payload{ModelRequestPayload{reader.string()}};
        case MessageType::InferenceRequest: {
            InferenceRequestPayload payload{};
            payload.task_id = reader.string();
            payload.request_id = reader.string();
            payload.model_id = reader.string();
            if (reader.boolean()) {
                payload.shard_id = reader.string();
            }
            payload.input = reader.value();
            return Payload{std::move(payload)};
        }
        case MessageType::InferenceResponse: {
            InferenceResponsePayload payload{};
            payload.task_id = reader.string();
            payload.request_id = reader.string();
            payload.success = reader.boolean();
            payload.result = reader.value();
            payload.error = reader.string();
            payload.processing_time_ms = reader.u32();
            return Payload{std::move(payload)};
        }
        case MessageType::Heartbeat: {
            HeartbeatPayload payload{};
            payload.load = reader.f64();
            payload.active_inferences = reader.u32();
            return Payload{payload};
        }
        case MessageType::NetworkUpdate: {
            NetworkUpdatePayload payload{};
            payload.model_id = reader.string();
            payload.total_layers = reader.u32();
            const auto shards = reader.count(24);
            for (std::uint32_t i = 0; i < shards && reader.ok(); ++i) {
                payload.shards.push_back(reader.shard());
            }
            const auto placements = reader.count(8);
            for (std::uint32_t i = 0; i < placements && reader.ok(); ++i) {
                auto shard_id = reader.string();
                payload.placement[std::move(shard_id)] = reader.strings();
            }
            return Payload{std::move(payload)};
        }
    }
    return std::nullopt;
}

}  // namespace

std::string to_string(MessageType type) {
    switch (type) {
        case MessageType::NodeAnnounce:
            return "node_announce";
        case MessageType::NodeQuery:
            return "node_query";
        case MessageType::NodeResponse:
            return "node_response";
        case MessageType::ModelAnnounce:
            return "model_announce";
        case MessageType::ModelRequest:
            return "model_request";
        case MessageType::InferenceRequest:
            return "inference_request";
        case MessageType::InferenceResponse:
            return "inference_response";
        case MessageType::Heartbeat:
            return "heartbeat";
        case MessageType::NetworkUpdate:
            return "network_update";
    }
    return "unknown";
}

bool is_relayed(MessageType type) noexcept {
    switch (type) {
        case MessageType::NodeAnnounce:
        case MessageType::ModelAnnounce:
        case MessageType::Heartbeat:
        case MessageType::NetworkUpdate:
            return true;
        case MessageType::NodeQuery:
        case MessageType::NodeResponse:
        case MessageType::ModelRequest:
        case MessageType::InferenceRequest:
        case MessageType::InferenceResponse:
            return false;
    }
    return false;
}

MessageType type_of(const Payload& payload) noexcept {
    return static_cast<MessageType>(payload.index() + 1);
}

Message make_message(const NodeId& sender, Payload payload, std::int32_t ttl) {
    Message message{};
    message.message_id = make_unique_id();
    message.type = type_of(payload);
    message.sender_id = sender;
    message.ttl = ttl;
    message.timestamp = unix_millis_now();
    message.path.push_back(sender);
    message.payload = std::move(payload);
    return message;
}

std::vector<std::uint8_t> encode(const Message& message) {
    std::vector<std::uint8_t> out;
    out.reserve(128);
    write_u8(out, kCurrentMessageVersion);
    write_u8(out, static_cast<std::uint8_t>(type_of(message.payload)));
    write_string(out, message.message_id);
    write_string(out, message.sender_id);
    write_u32(out, static_cast<std::uint32_t>(message.ttl));
    write_u64(out, message.timestamp);
    write_strings(out, message.path);

    std::visit(
        [&out](const auto& payload) {
            using PayloadType = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<PayloadType, NodeAnnouncePayload>) {
                write_capability(out, payload.capability);
            } else if constexpr (std::is_same_v<PayloadType, NodeQueryPayload>) {
                write_string(out, payload.query_type);
                write_u32(out, payload.count);
            } else if constexpr (std::is_same_v<PayloadType, NodeResponsePayload>) {
                write_string(out, payload.query_type);
                write_string(out, payload.model_id);
                write_u32(out, static_cast<std::uint32_t>(payload.nodes.size()));
                for (const auto& node : payload.nodes) {
                    write_capability(out, node);
                }
            } else if constexpr (std::is_same_v<PayloadType, ModelAnnouncePayload>) {
                write_string(out, payload.model_id);
                write_value(out, payload.model_info);
                write_string(out, payload.node_id);
            } else if constexpr (std::is_same_v<PayloadType, ModelRequestPayload>) {
                write_string(out, payload.model_id);
            } else if constexpr (std::is_same_v<PayloadType, InferenceRequestPayload>) {
                write_string(out, payload.task_id);
                write_string(out, payload.request_id);
                write_string(out, payload.model_id);
                write_u8(out, payload.shard_id.has_value() ? 1 : 0);
                if (payload.shard_id.has_value()) {
                    write_string(out, *payload.shard_id);
                }
                write_value(out, payload.input);
            } else if constexpr (std::is_same_v<PayloadType, InferenceResponsePayload>) {
                write_string(out, payload.task_id);
                write_string(out, payload.request_id);
                write_u8(out, payload.success ? 1 : 0);
                write_value(out, payload.result);
                write_string(out, payload.error);
                write_u32(out, payload.processing_time_ms);
            } else if constexpr (std::is_same_v<PayloadType, HeartbeatPayload>) {
                write_f64(out, payload.load);
                write_u32(out, payload.active_inferences);
            } else if constexpr (std::is_same_v<PayloadType, NetworkUpdatePayload>) {
                write_string(out, payload.model_id);
                write_u32(out, payload.total_layers);
                write_u32(out, static_cast<std::uint32_t>(payload.shards.size()));
                for (const auto& shard : payload.shards) {
                    write_shard(out, shard);
                }
                write_u32(out, static_cast<std::uint32_t>(payload.placement.size()));
                for (const auto& [shard_id, holders] : payload.placement) {
                    write_string(out, shard_id);
                    write_strings(out, holders);
                }
            }
        },
        message.payload);

    return out;
}

std::optional<Message> decode(std::span<const std::uint8_t> buffer) {
    if (buffer.size() < 2 || buffer.size() > kMaxMessageBytes) {
        return std::nullopt;
    }

    Reader reader{buffer};
    if (reader.u8() != kCurrentMessageVersion) {
        return std::nullopt;
    }
    const auto raw_type = reader.u8();
    if (raw_type < static_cast<std::uint8_t>(MessageType::NodeAnnounce) ||
        raw_type > static_cast<std::uint8_t>(MessageType::NetworkUpdate)) {
        return std::nullopt;
    }

    Message message{};
    message.type = static_cast<MessageType>(raw_type);
    message.message_id = reader.string();
    message.sender_id = reader.string();
    message.ttl = static_cast<std::int32_t>(reader.u32());
    message.timestamp = reader.u64();
    message.path = reader.strings();
    if (!reader.ok() || message.message_id.empty() || message.sender_id.empty()) {
        return std::nullopt;
    }

    auto payload = decode_payload(message.type, reader);
    if (!payload.has_value() || !reader.ok() || !reader.at_end()) {
        return std::nullopt;
    }
    message.payload = std::move(*payload);
    return message;
}

}  // namespace cortexnet::protocol
