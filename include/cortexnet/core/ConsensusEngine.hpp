#pragma once

#include "cortexnet/Types.hpp"
#include "cortexnet/Value.hpp"

#include <cstddef>
#include <vector>

namespace cortexnet {

struct ReplicaResult {
    NodeId node_id;
    Value result;
};

struct ConsensusOutcome {
    bool reached{false};
    Value value;
    std::size_t required_agreement{0};
    std::size_t winning_cluster_size{0};
    std::size_t cluster_count{0};
    std::vector<NodeId> agreeing_nodes;
    std::vector<NodeId> dissenting_nodes;
};

// Groups independent replica results by similarity and accepts the largest group that
// clears the agreement threshold.
class ConsensusEngine {
public:
    explicit ConsensusEngine(double byzantine_tolerance = 0.33, double numeric_tolerance = 0.01);

    ConsensusOutcome reach_consensus(const std::vector<ReplicaResult>& results) const;

    // ceil(n * (1 - tolerance) - 0.05) clamped to [1, n]; 0 for n == 0.
    std::size_t required_agreement(std::size_t replica_count) const;

    // Numbers by relative difference (absolute next to zero), objects and arrays recursively with identical shape,
    // everything else by exact equality.
    bool similar(const Value& lhs, const Value& rhs) const;

    double byzantine_tolerance() const noexcept { return byzantine_tolerance_; }
    double numeric_tolerance() const noexcept { return numeric_tolerance_; }

private:
    Value merge_cluster(const std::vector<const ReplicaResult*>& members) const;

    double byzantine_tolerance_{0.33};
    double numeric_tolerance_{0.01};
};

}  // namespace cortexnet
