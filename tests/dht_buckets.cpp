#include "cortexnet/Types.hpp"
#include "cortexnet/dht/KademliaTable.hpp"

#include <cassert>
#include <cmath>
#include <cstddef>
#include <limits>
#include <string>
#include <vector>

using cortexnet::NodeCapability;
using cortexnet::NodeId;
using cortexnet::dht::KademliaTable;

namespace {

NodeCapability make_node(const NodeId& id, double compute = 1.0) {
    NodeCapability node{};
    node.node_id = id;
    node.compute_power = compute;
    return node;
}

// Ids whose distance to self lands in the requested bucket.
std::vector<NodeId> ids_in_bucket(const NodeId& self, std::size_t bucket, std::size_t wanted) {
    std::vector<NodeId> ids;
    for (int index = 0; ids.size() < wanted && index < 100000; ++index) {
        const auto id = "peer-" + std::to_string(index);
        const auto computed = KademliaTable::bucket_index(KademliaTable::distance(self, id));
        if (computed.has_value() && *computed == bucket) {
            ids.push_back(id);
        }
    }
    return ids;
}

}  // namespace

int main() {
    assert(!KademliaTable::bucket_index(0).has_value());
    assert(KademliaTable::bucket_index(1) == 0u);
    assert(KademliaTable::bucket_index(2) == 1u);
    assert(KademliaTable::bucket_index(3) == 1u);
    assert(KademliaTable::bucket_index(0x8000000000000000ull) == 63u);
    assert(KademliaTable::bucket_index(0xFFFFFFFFFFFFFFFFull) == 63u);

    const NodeId self = "self-node";
    KademliaTable table{self, 4};

    // The local node is never stored.
    assert(!table.add_node(make_node(self)));
    assert(table.size() == 0);

    // Roughly half of all ids differ from self in the top bit.
    const auto crowded = ids_in_bucket(self, 63, 6);
    assert(crowded.size() == 6);
    for (const auto& id : crowded) {
        assert(table.add_node(make_node(id)));
    }
    assert(table.bucket_population(63) == 4);
    assert(table.size() == 4);

    // The oldest entries fall off the back.
    assert(!table.get_node(crowded[0]).has_value());
    assert(!table.get_node(crowded[1]).has_value());
    for (std::size_t index = 2; index < crowded.size(); ++index) {
        assert(table.get_node(crowded[index]).has_value());
    }

    // Refreshing a known peer moves it to the front so it survives the next overflow.
    assert(table.add_node(make_node(crowded[2], 7.0)));
    const auto extra = ids_in_bucket(self, 63, 8);
    assert(table.add_node(make_node(extra[6])));
    assert(table.get_node(crowded[2]).has_value());
    assert(table.get_node(crowded[2])->compute_power == 7.0);
    assert(!table.get_node(crowded[3]).has_value());
    assert(table.bucket_population(63) == 4);

    // Reliability observed locally survives a re-announce.
    table.record_outcome(crowded[2], false);
    const auto lowered = table.get_node(crowded[2])->reliability_score;
    assert(lowered < 1.0);
    auto reannounced = make_node(crowded[2]);
    reannounced.reliability_score = 1.0;
    table.add_node(reannounced);
    assert(table.get_node(crowded[2])->reliability_score == lowered);

    assert(table.remove_node(crowded[2]));
    assert(!table.remove_node(crowded[2]));
    assert(table.bucket_population(63) == 3);
    assert(table.bucket_population(64) == 0);

    // Nodes in distinct buckets do not compete for space.
    const auto near = ids_in_bucket(self, 60, 3);
    for (const auto& id : near) {
        table.add_node(make_node(id));
    }
    assert(table.bucket_population(60) == near.size());
    assert(table.size() == 3 + near.size());

    // Claimed reliability is ignored and non-finite figures are zeroed.
    {
        constexpr auto nan = std::numeric_limits<double>::quiet_NaN();
        KademliaTable guarded{self, 20};
        auto boastful = make_node("boastful", 3.0);
        boastful.reliability_score = 7.5;
        assert(guarded.add_node(boastful));
        assert(guarded.get_node("boastful")->reliability_score == 1.0);
        assert(guarded.get_node("boastful")->compute_power == 3.0);

        auto garbled = make_node("garbled", nan);
        garbled.reliability_score = nan;
        garbled.memory_gb = std::numeric_limits<double>::infinity();
        garbled.bandwidth_mbps = -5.0;
        garbled.current_load = nan;
        assert(guarded.add_node(garbled));
        const auto stored = *guarded.get_node("garbled");
        assert(stored.reliability_score == 1.0);
        assert(stored.compute_power == 0.0);
        assert(stored.memory_gb == 0.0);
        assert(stored.bandwidth_mbps == 0.0);
        assert(stored.current_load == 0.0);

        assert(guarded.set_load("garbled", nan));
        assert(!std::isnan(guarded.get_node("garbled")->current_load));
    }

    return 0;
}
