#include "cortexnet/Types.hpp"
#include "cortexnet/Value.hpp"
#include "cortexnet/dht/KademliaTable.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <cmath>

using namespace std::chrono_literals;
using namespace cortexnet;

namespace {

NodeCapability hosting(const NodeId& id, const std::string& model, Clock::time_point last_seen) {
    NodeCapability node{};
    node.node_id = id;
    node.models.insert(model);
    node.last_seen = last_seen;
    return node;
}

}  // namespace

int main() {
    const auto now = Clock::now();
    dht::KademliaTable table{"self", 20, 60s};

    table.add_node(hosting("fresh", "bert", now));
    table.add_node(hosting("stale", "bert", now - 120s));
    table.add_node(hosting("other", "gpt", now));

    // Stale peers are invisible to model lookups before maintenance removes them.
    const auto hosts = table.find_nodes_with_model("bert", now);
    assert(hosts.size() == 1);
    assert(hosts.front().node_id == "fresh");
    assert(table.find_nodes_with_model("vit", now).empty());

    // Contact revives a peer.
    assert(table.touch("stale", now));
    assert(table.find_nodes_with_model("bert", now).size() == 2);
    assert(!table.touch("unknown", now));

    // Eviction after the window has passed for one peer only.
    table.touch("fresh", now + 90s);
    const auto evicted = table.evict_stale(now + 90s);
    assert(evicted.size() == 2);
    assert(std::find(evicted.begin(), evicted.end(), "stale") != evicted.end());
    assert(std::find(evicted.begin(), evicted.end(), "other") != evicted.end());
    assert(table.size() == 1);
    assert(table.get_node("fresh").has_value());

    // Model advertisements attach to known peers only.
    assert(table.add_model("fresh", "gpt"));
    assert(!table.add_model("ghost", "gpt"));
    assert(table.find_nodes_with_model("gpt", now + 90s).size() == 1);

    assert(table.set_load("fresh", 1.7));
    assert(table.get_node("fresh")->current_load == 1.0);

    // Reliability: x0.9 per failure down to 0.05, +0.02 per success up to 1.0.
    table.record_outcome("fresh", false);
    assert(std::fabs(table.get_node("fresh")->reliability_score - 0.9) < 1e-9);
    table.record_outcome("fresh", true);
    assert(std::fabs(table.get_node("fresh")->reliability_score - 0.92) < 1e-9);
    for (int index = 0; index < 200; ++index) {
        table.record_outcome("fresh", false);
    }
    assert(std::fabs(table.get_node("fresh")->reliability_score - 0.05) < 1e-9);
    for (int index = 0; index < 100; ++index) {
        table.record_outcome("fresh", true);
    }
    assert(table.get_node("fresh")->reliability_score == 1.0);

    // Fact store.
    assert(!table.get_data("model:bert").has_value());
    auto fact = Value::make_object();
    fact["node_id"] = Value("fresh");
    table.store_data("model:bert", fact);
    assert(table.get_data("model:bert") == fact);

    table.append_unique("model:bert:nodes", Value("fresh"));
    table.append_unique("model:bert:nodes", Value("stale"));
    table.append_unique("model:bert:nodes", Value("fresh"));
    const auto holders = table.get_data("model:bert:nodes");
    assert(holders.has_value());
    assert(holders->size() == 2);

    return 0;
}
