#pragma once

#include "cortexnet/network/Transport.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

namespace cortexnet::network {

class LoopbackTransport;

// In-process switchboard connecting LoopbackTransport endpoints. Must outlive every endpoint it creates.
class LoopbackHub {
public:
    using SendObserver =
        std::function<void(const NodeId& from, const NodeId& to, std::span<const std::uint8_t> payload)>;

    LoopbackHub() = default;

    LoopbackHub(const LoopbackHub&) = delete;
    LoopbackHub& operator=(const LoopbackHub&) = delete;

    // address defaults to node_id.
    std::unique_ptr<LoopbackTransport> create_endpoint(NodeId node_id, std::string address = {});

    // Severed pairs stay linked but every send between them fails.
    void sever(const NodeId& lhs, const NodeId& rhs);
    void heal(const NodeId& lhs, const NodeId& rhs);
    bool linked(const NodeId& lhs, const NodeId& rhs) const;

    // Called for every accepted transmission, outside the hub lock.
    void set_send_observer(SendObserver observer);

    // Waits until no message is queued or being handled anywhere on the hub.
    bool wait_idle(std::chrono::milliseconds timeout);
    std::uint64_t transmissions() const;

private:
    friend class LoopbackTransport;
    using Link = std::pair<NodeId, NodeId>;

    static Link make_link(const NodeId& lhs, const NodeId& rhs);

    void attach(LoopbackTransport* endpoint);
    void detach(LoopbackTransport* endpoint);
    void release(std::size_t undelivered);
    std::optional<NodeId> link(const NodeId& from, const std::string& address);
    void unlink(const NodeId& lhs, const NodeId& rhs);
    bool route(const NodeId& from, const NodeId& to, std::span<const std::uint8_t> payload);
    void settle();

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::unordered_map<NodeId, LoopbackTransport*> endpoints_;
    std::unordered_map<std::string, NodeId> addresses_;
    std::set<Link> links_;
    std::set<Link> severed_;
    SendObserver observer_;
    std::size_t in_flight_{0};
    std::uint64_t transmissions_{0};
};

// Each endpoint delivers from its own thread, in order, one message at a time.
class LoopbackTransport : public Transport {
public:
    // Only the hub can mint a key, so endpoints come from LoopbackHub::create_endpoint.
    class Key {
        friend class LoopbackHub;
        Key() = default;
    };

    LoopbackTransport(Key key, LoopbackHub& hub, NodeId node_id, std::string address);
    ~LoopbackTransport() override;

    LoopbackTransport(const LoopbackTransport&) = delete;
    LoopbackTransport& operator=(const LoopbackTransport&) = delete;

    std::optional<NodeId> connect(const std::string& address) override;
    void disconnect(const NodeId& peer) override;
    bool send(const NodeId& peer, std::span<const std::uint8_t> payload) override;
    void set_message_handler(MessageHandler handler) override;

    const NodeId& node_id() const noexcept { return node_id_; }
    const std::string& address() const noexcept { return address_; }

private:
    friend class LoopbackHub;

    void enqueue(TransportMessage message);
    void delivery_loop();

    LoopbackHub& hub_;
    NodeId node_id_;
    std::string address_;

    std::mutex handler_mutex_;
    MessageHandler handler_{};

    std::mutex mailbox_mutex_;
    std::condition_variable mailbox_cv_;
    std::deque<TransportMessage> mailbox_;
    bool running_{true};
    std::thread worker_;
};

}  // namespace cortexnet::network
