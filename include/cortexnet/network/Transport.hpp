#pragma once

#include "cortexnet/Types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace cortexnet::network {

struct TransportMessage {
    NodeId from;
    std::vector<std::uint8_t> payload;
};

// Best-effort delivery between nodes. Framing, encryption and retries belong to implementations.
class Transport {
public:
    using MessageHandler = std::function<void(const TransportMessage&)>;

    virtual ~Transport() = default;

    // Returns the id of the node reachable at address.
    virtual std::optional<NodeId> connect(const std::string& address) = 0;
    virtual void disconnect(const NodeId& peer) = 0;
    virtual bool send(const NodeId& peer, std::span<const std::uint8_t> payload) = 0;
    // Replacing the handler waits for an in-progress delivery to finish.
    virtual void set_message_handler(MessageHandler handler) = 0;
};

}  // namespace cortexnet::network
