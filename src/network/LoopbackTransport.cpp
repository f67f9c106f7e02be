#include "cortexnet/network/LoopbackTransport.hpp"

#include "cortexnet/diagnostics/StructuredLogger.hpp"

#include <algorithm>
#include <exception>

namespace cortexnet::network {

using diagnostics::StructuredLogger;

std::unique_ptr<LoopbackTransport> LoopbackHub::create_endpoint(NodeId node_id, std::string address) {
    if (address.empty()) {
        address = node_id;
    }
    auto endpoint =
        std::make_unique<LoopbackTransport>(LoopbackTransport::Key{}, *this, std::move(node_id), std::move(address));
    attach(endpoint.get());
    return endpoint;
}

void LoopbackHub::sever(const NodeId& lhs, const NodeId& rhs) {
    std::scoped_lock lock(mutex_);
    severed_.insert(make_link(lhs, rhs));
}

void LoopbackHub::heal(const NodeId& lhs, const NodeId& rhs) {
    std::scoped_lock lock(mutex_);
    severed_.erase(make_link(lhs, rhs));
}

bool LoopbackHub::linked(const NodeId& lhs, const NodeId& rhs) const {
    std::scoped_lock lock(mutex_);
    return links_.count(make_link(lhs, rhs)) != 0;
}

void LoopbackHub::set_send_observer(SendObserver observer) {
    std::scoped_lock lock(mutex_);
    observer_ = std::move(observer);
}

bool LoopbackHub::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return in_flight_ == 0; });
}

std::uint64_t LoopbackHub::transmissions() const {
    std::scoped_lock lock(mutex_);
    return transmissions_;
}

LoopbackHub::Link LoopbackHub::make_link(const NodeId& lhs, const NodeId& rhs) {
    return lhs < rhs ? Link{lhs, rhs} : Link{rhs, lhs};
}

void LoopbackHub::attach(LoopbackTransport* endpoint) {
    std::scoped_lock lock(mutex_);
    endpoints_[endpoint->node_id()] = endpoint;
    addresses_[endpoint->address()] = endpoint->node_id();
}

void LoopbackHub::detach(LoopbackTransport* endpoint) {
    std::scoped_lock lock(mutex_);
    const auto it = endpoints_.find(endpoint->node_id());
    if (it != endpoints_.end() && it->second == endpoint) {
        endpoints_.erase(it);
        addresses_.erase(endpoint->address());
    }
    for (auto link = links_.begin(); link != links_.end();) {
        if (link->first == endpoint->node_id() || link->second == endpoint->node_id()) {
            link = links_.erase(link);
        } else {
            ++link;
        }
    }
}

void LoopbackHub::release(std::size_t undelivered) {
    std::scoped_lock lock(mutex_);
    in_flight_ -= std::min(in_flight_, undelivered);
    if (in_flight_ == 0) {
        idle_cv_.notify_all();
    }
}

std::optional<NodeId> LoopbackHub::link(const NodeId& from, const std::string& address) {
    std::scoped_lock lock(mutex_);
    const auto it = addresses_.find(address);
    if (it == addresses_.end() || it->second == from) {
        return std::nullopt;
    }
    if (severed_.count(make_link(from, it->second)) != 0) {
        return std::nullopt;
    }
    links_.insert(make_link(from, it->second));
    return it->second;
}

void LoopbackHub::unlink(const NodeId& lhs, const NodeId& rhs) {
    std::scoped_lock lock(mutex_);
    links_.erase(make_link(lhs, rhs));
}

bool LoopbackHub::route(const NodeId& from, const NodeId& to, std::span<const std::uint8_t> payload) {
    SendObserver observer;
    {
        std::scoped_lock lock(mutex_);
        const auto key = make_link(from, to);
        if (links_.count(key) == 0 || severed_.count(key) != 0) {
            return false;
        }
        const auto it = endpoints_.find(to);
        if (it == endpoints_.end()) {
            return false;
        }
        ++in_flight_;
        ++transmissions_;
        it->second->enqueue(TransportMessage{from, std::vector<std::uint8_t>(payload.begin(), payload.end())});
        observer = observer_;
    }
    if (observer) {
        observer(from, to, payload);
    }
    return true;
}

void LoopbackHub::settle() {
    release(1);
}

LoopbackTransport::LoopbackTransport(Key, LoopbackHub& hub, NodeId node_id, std::string address)
    : hub_(hub),
      node_id_(std::move(node_id)),
      address_(std::move(address)) {
    worker_ = std::thread(&LoopbackTransport::delivery_loop, this);
}

LoopbackTransport::~LoopbackTransport() {
    hub_.detach(this);
    {
        std::scoped_lock lock(mailbox_mutex_);
        running_ = false;
    }
    mailbox_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }

    std::size_t undelivered = 0;
    {
        std::scoped_lock lock(mailbox_mutex_);
        undelivered = mailbox_.size();
        mailbox_.clear();
    }
    hub_.release(undelivered);
}

std::optional<NodeId> LoopbackTransport::connect(const std::string& address) {
    return hub_.link(node_id_, address);
}

void LoopbackTransport::disconnect(const NodeId& peer) {
    hub_.unlink(node_id_, peer);
}

bool LoopbackTransport::send(const NodeId& peer, std::span<const std::uint8_t> payload) {
    return hub_.route(node_id_, peer, payload);
}

void LoopbackTransport::set_message_handler(MessageHandler handler) {
    std::scoped_lock lock(handler_mutex_);
    handler_ = std::move(handler);
}

void LoopbackTransport::enqueue(TransportMessage message) {
    {
        std::scoped_lock lock(mailbox_mutex_);
        mailbox_.push_back(std::move(message));
    }
    mailbox_cv_.notify_one();
}

void LoopbackTransport::delivery_loop() {
    while (true) {
        TransportMessage message;
        {
            std::unique_lock lock(mailbox_mutex_);
            mailbox_cv_.wait(lock, [this] { return !running_ || !mailbox_.empty(); });
            if (!running_) {
                return;
            }
            message = std::move(mailbox_.front());
            mailbox_.pop_front();
        }

        {
            std::scoped_lock lock(handler_mutex_);
            if (handler_) {
                try {
                    handler_(message);
                } catch (const std::exception& ex) {
                    StructuredLogger::instance().log(StructuredLogger::Level::Error,
                                                     "transport.loopback.handler_failed",
                                                     {{"node", node_id_}, {"from", message.from}, {"error", ex.what()}});
                }
            }
        }
        hub_.settle();
    }
}

}  // namespace cortexnet::network
