#include "cortexnet/diagnostics/StructuredLogger.hpp"
#include "cortexnet/network/LoopbackTransport.hpp"
#include "cortexnet/network/MessageCache.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

using namespace cortexnet;
using namespace std::chrono_literals;

namespace {

std::vector<std::uint8_t> bytes(const std::string& text) {
    return {text.begin(), text.end()};
}

// Endpoints are only minted by a hub.
static_assert(!std::is_default_constructible_v<network::LoopbackTransport::Key>);

}  // namespace

int main() {
    diagnostics::StructuredLogger::instance().set_enabled(false);

    // Message id cache.
    {
        network::MessageCache cache{60s};
        const auto now = Clock::now();
        assert(cache.mark_if_new("m1", now));
        assert(!cache.mark_if_new("m1", now + 30s));
        assert(cache.contains("m1"));
        assert(cache.mark_if_new("m2", now + 50s));
        assert(cache.sweep(now + 90s) == 1);
        assert(!cache.contains("m1"));
        assert(cache.contains("m2"));
        assert(cache.size() == 1);
        assert(cache.mark_if_new("m2", now + 200s));
    }

    network::LoopbackHub hub;
    auto alice = hub.create_endpoint("alice", "10.0.0.1:7000");
    auto bob = hub.create_endpoint("bob");

    std::mutex mutex;
    std::vector<std::string> received;
    bob->set_message_handler([&](const network::TransportMessage& message) {
        std::scoped_lock lock(mutex);
        received.push_back(message.from + ":" + std::string(message.payload.begin(), message.payload.end()));
    });

    // Sending requires a link.
    assert(!alice->send("bob", bytes("early")));
    assert(!alice->connect("nowhere").has_value());
    assert(!alice->connect("10.0.0.1:7000").has_value());
    assert(alice->connect("bob") == std::optional<NodeId>("bob"));
    assert(hub.linked("alice", "bob"));
    assert(bob->connect("10.0.0.1:7000") == std::optional<NodeId>("alice"));

    for (int index = 0; index < 5; ++index) {
        assert(alice->send("bob", bytes(std::to_string(index))));
    }
    assert(hub.wait_idle(2s));
    {
        std::scoped_lock lock(mutex);
        assert(received == (std::vector<std::string>{"alice:0", "alice:1", "alice:2", "alice:3", "alice:4"}));
        received.clear();
    }
    assert(hub.transmissions() == 5);

    // Severed links refuse traffic until healed.
    hub.sever("bob", "alice");
    assert(!alice->send("bob", bytes("lost")));
    assert(!bob->connect("10.0.0.1:7000").has_value());
    hub.heal("alice", "bob");
    assert(alice->send("bob", bytes("back")));

    // The observer sees accepted traffic only.
    std::atomic<int> observed{0};
    hub.set_send_observer([&observed](const NodeId& from, const NodeId& to, std::span<const std::uint8_t>) {
        if (from == "alice" && to == "bob") {
            ++observed;
        }
    });
    assert(alice->send("bob", bytes("seen")));
    assert(hub.wait_idle(2s));
    assert(observed.load() == 1);

    // A throwing handler is contained and delivery continues.
    bob->set_message_handler([](const network::TransportMessage&) { throw std::runtime_error("boom"); });
    assert(alice->send("bob", bytes("bad")));
    assert(hub.wait_idle(2s));
    bob->set_message_handler([&](const network::TransportMessage& message) {
        std::scoped_lock lock(mutex);
        received.emplace_back(message.payload.begin(), message.payload.end());
    });
    assert(alice->send("bob", bytes("after")));
    assert(hub.wait_idle(2s));
    {
        std::scoped_lock lock(mutex);
        assert(received.back() == "after");
    }

    alice->disconnect("bob");
    assert(!hub.linked("alice", "bob"));
    assert(!alice->send("bob", bytes("gone")));

    // Destroying an endpoint unlinks it and leaves the hub idle.
    assert(alice->connect("bob").has_value());
    bob.reset();
    assert(!alice->send("bob", bytes("dead")));
    assert(!hub.linked("alice", "bob"));
    assert(hub.wait_idle(1s));

    return 0;
}
