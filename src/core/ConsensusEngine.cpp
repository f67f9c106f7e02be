#include "cortexnet/core/ConsensusEngine.hpp"

#include "cortexnet/diagnostics/StructuredLogger.hpp"

#include <algorithm>
#include <cmath>

namespace cortexnet {

using diagnostics::StructuredLogger;
using diagnostics::log_event;

namespace {

// Absorbs the 0.33 ~ 1/3 rounding so that three replicas need two votes.
constexpr double kThresholdSlack = 0.05;

double clamp_tolerance(double value, double fallback) {
    if (!std::isfinite(value) || value < 0.0) {
        return fallback;
    }
    return std::min(value, 0.99);
}

}  // namespace

ConsensusEngine::ConsensusEngine(double byzantine_tolerance, double numeric_tolerance)
    : byzantine_tolerance_(clamp_tolerance(byzantine_tolerance, 0.33)),
      numeric_tolerance_(clamp_tolerance(numeric_tolerance, 0.01)) {}

std::size_t ConsensusEngine::required_agreement(std::size_t replica_count) const {
    if (replica_count == 0) {
        return 0;
    }
    const auto raw = std::ceil(static_cast<double>(replica_count) * (1.0 - byzantine_tolerance_) - kThresholdSlack);
    const auto required = raw < 1.0 ? std::size_t{1} : static_cast<std::size_t>(raw);
    return std::min(required, replica_count);
}

bool ConsensusEngine::similar(const Value& lhs, const Value& rhs) const {
    if (lhs.is_number() && rhs.is_number()) {
        const double a = lhs.as_number();
        const double b = rhs.as_number();
        if (a == b) {
            return true;
        }
        const double scale = std::max(std::fabs(a), std::fabs(b));
        if (!std::isfinite(scale)) {
            return false;
        }
        // Against an exact zero a relative difference is always 1, so compare absolutely.
        if (a == 0.0 || b == 0.0) {
            return std::fabs(a - b) <= numeric_tolerance_;
        }
        return std::fabs(a - b) / scale <= numeric_tolerance_;
    }

    if (lhs.type != rhs.type) {
        return false;
    }

    if (lhs.is_object()) {
        if (lhs.object_value.size() != rhs.object_value.size()) {
            return false;
        }
        for (const auto& [key, item] : lhs.object_value) {
            const auto* other = rhs.find(key);
            if (other == nullptr || !similar(item, *other)) {
                return false;
            }
        }
        return true;
    }

    if (lhs.is_array()) {
        if (lhs.array_value.size() != rhs.array_value.size()) {
            return false;
        }
        for (std::size_t index = 0; index < lhs.array_value.size(); ++index) {
            if (!similar(lhs.array_value[index], rhs.array_value[index])) {
                return false;
            }
        }
        return true;
    }

    return lhs == rhs;
}

ConsensusOutcome ConsensusEngine::reach_consensus(const std::vector<ReplicaResult>& results) const {
    ConsensusOutcome outcome{};
    outcome.required_agreement = required_agreement(results.size());
    if (results.empty()) {
        return outcome;
    }

    // The first member of each cluster is its representative.
    std::vector<std::vector<const ReplicaResult*>> clusters;
    for (const auto& replica : results) {
        auto target = std::find_if(clusters.begin(), clusters.end(), [&](const auto& cluster) {
            return similar(cluster.front()->result, replica.result);
        });
        if (target == clusters.end()) {
            clusters.push_back({&replica});
        } else {
            target->push_back(&replica);
        }
    }
    outcome.cluster_count = clusters.size();

    const auto winner = std::max_element(clusters.begin(), clusters.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.size() < rhs.size();
    });
    outcome.winning_cluster_size = winner->size();

    if (winner->size() < outcome.required_agreement) {
        for (const auto& replica : results) {
            outcome.dissenting_nodes.push_back(replica.node_id);
        }
        log_event(StructuredLogger::Level::Warning,
                  "consensus.rejected",
                  {{"replicas", std::to_string(results.size())},
                   {"clusters", std::to_string(clusters.size())},
                   {"largest", std::to_string(winner->size())},
                   {"required", std::to_string(outcome.required_agreement)}});
        return outcome;
    }

    outcome.reached = true;
    outcome.value = merge_cluster(*winner);
    for (const auto& replica : results) {
        const bool agreed = std::find(winner->begin(), winner->end(), &replica) != winner->end();
        (agreed ? outcome.agreeing_nodes : outcome.dissenting_nodes).push_back(replica.node_id);
    }

    log_event(StructuredLogger::Level::Debug,
              "consensus.reached",
              {{"replicas", std::to_string(results.size())},
               {"agreeing", std::to_string(outcome.agreeing_nodes.size())},
               {"value", to_display_string(outcome.value)}});
    return outcome;
}

Value ConsensusEngine::merge_cluster(const std::vector<const ReplicaResult*>& members) const {
    const bool all_numeric = std::all_of(members.begin(), members.end(), [](const ReplicaResult* member) {
        return member->result.is_number();
    });
    if (all_numeric) {
        double sum = 0.0;
        for (const auto* member : members) {
            sum += member->result.as_number();
        }
        return Value(sum / static_cast<double>(members.size()));
    }

    // Most frequent literal; the earliest wins ties.
    const Value* best = &members.front()->result;
    std::size_t best_count = 0;
    for (const auto* candidate : members) {
        const auto count = static_cast<std::size_t>(std::count_if(members.begin(), members.end(), [&](const ReplicaResult* other) {
            return other->result == candidate->result;
        }));
        if (count > best_count) {
            best = &candidate->result;
            best_count = count;
        }
    }
    return *best;
}

}  // namespace cortexnet
