#include "cortexnet/core/InferenceCoordinator.hpp"

#include "cortexnet/diagnostics/StructuredLogger.hpp"

#include <algorithm>
#include <utility>

namespace cortexnet {

using diagnostics::StructuredLogger;
using diagnostics::log_event;

namespace {

std::chrono::milliseconds elapsed_since(Clock::time_point started) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
}

}  // namespace

std::string to_string(InferenceError error) {
    switch (error) {
        case InferenceError::NoNodesAvailable:
            return "no_nodes_available";
        case InferenceError::ShardUnavailable:
            return "shard_unavailable";
        case InferenceError::StageFailure:
            return "stage_failure";
        case InferenceError::ConsensusNotReached:
            return "consensus_not_reached";
        case InferenceError::Timeout:
            return "timeout";
        case InferenceError::TransportError:
            return "transport_error";
    }
    return "unknown";
}

std::string to_string(TaskPhase phase) {
    switch (phase) {
        case TaskPhase::Planning:
            return "planning";
        case TaskPhase::Dispatched:
            return "dispatched";
        case TaskPhase::Collecting:
            return "collecting";
        case TaskPhase::ConsensusReached:
            return "consensus_reached";
        case TaskPhase::NoConsensus:
            return "no_consensus";
        case TaskPhase::Failed:
            return "failed";
    }
    return "unknown";
}

bool is_terminal(TaskPhase phase) noexcept {
    return phase == TaskPhase::ConsensusReached || phase == TaskPhase::NoConsensus || phase == TaskPhase::Failed;
}

InferenceCoordinator::InferenceCoordinator(dht::KademliaTable& table,
                                           const ShardPlanner& planner,
                                           const ConsensusEngine& consensus,
                                           InferenceDispatcher& dispatcher)
    : table_(table),
      planner_(planner),
      consensus_(consensus),
      dispatcher_(dispatcher) {}

void InferenceCoordinator::set_phase_observer(PhaseObserver observer) {
    phase_observer_ = std::move(observer);
}

InferenceResult InferenceCoordinator::execute(const InferenceTask& task) {
    const auto started = Clock::now();

    InferenceResult result{};
    result.task_id = task.task_id;
    enter(result, TaskPhase::Planning);

    auto candidates = table_.find_nodes_with_model(task.model_id);
    if (candidates.empty()) {
        fail(result, InferenceError::NoNodesAvailable, "no peer advertises model " + task.model_id);
        result.execution_time = elapsed_since(started);
        return result;
    }

    InferenceResult outcome = planner_.has_shards(task.model_id)
                                  ? run_pipeline(task, candidates, started)
                                  : run_replication(task, std::move(candidates), started);
    outcome.execution_time = elapsed_since(started);

    log_event(outcome.success ? StructuredLogger::Level::Info : StructuredLogger::Level::Warning,
              "inference.completed",
              {{"task", task.task_id},
               {"model", task.model_id},
               {"success", outcome.success ? "true" : "false"},
               {"phase", to_string(outcome.phase)},
               {"error", outcome.error ? to_string(*outcome.error) : ""},
               {"nodes_used", std::to_string(outcome.nodes_used)},
               {"elapsed_ms", std::to_string(outcome.execution_time.count())}});
    return outcome;
}

InferenceResult InferenceCoordinator::run_pipeline(const InferenceTask& task,
                                                   const std::vector<NodeCapability>& candidates,
                                                   Clock::time_point started) {
    InferenceResult result{};
    result.task_id = task.task_id;
    result.phase = TaskPhase::Planning;

    // Resolve every stage before any work is sent.
    const auto shards = planner_.shards_for(task.model_id);
    std::vector<Stage> stages;
    stages.reserve(shards.size());
    for (std::size_t index = 0; index < shards.size(); ++index) {
        const auto holder_ids = planner_.holders(task.model_id, shards[index].shard_id);
        const NodeCapability* best = nullptr;
        for (const auto& node : candidates) {
            if (std::find(holder_ids.begin(), holder_ids.end(), node.node_id) == holder_ids.end()) {
                continue;
            }
            if (best == nullptr || ShardPlanner::ranks_before(node, *best)) {
                best = &node;
            }
        }
        if (best == nullptr) {
            result.failed_stage = index;
            fail(result, InferenceError::ShardUnavailable, "no live holder for shard " + shards[index].shard_id);
            return result;
        }
        stages.push_back(Stage{shards[index], *best});
    }

    const auto deadline = started + task.timeout;
    Value carried = task.input_data;

    for (std::size_t index = 0; index < stages.size(); ++index) {
        const auto& stage = stages[index];
        StageRequest request{task.task_id, task.model_id, stage.shard.shard_id, carried};
        auto pending = dispatcher_.dispatch(stage.node, request);
        result.participants.push_back(stage.node.node_id);
        if (index == 0) {
            enter(result, TaskPhase::Dispatched);
            enter(result, TaskPhase::Collecting);
        }

        if (pending.reply.wait_until(deadline) != std::future_status::ready) {
            dispatcher_.abandon(pending.request_id);
            table_.record_outcome(stage.node.node_id, false);
            result.failed_stage = index;
            result.nodes_used = result.participants.size();
            fail(result, InferenceError::Timeout, "deadline exceeded at stage " + std::to_string(index));
            return result;
        }

        auto reply = await_reply(pending.reply);
        if (!reply.success) {
            table_.record_outcome(stage.node.node_id, false);
            result.failed_stage = index;
            result.nodes_used = result.participants.size();
            log_event(StructuredLogger::Level::Warning,
                      "inference.stage.failed",
                      {{"task", task.task_id},
                       {"stage", std::to_string(index)},
                       {"shard", stage.shard.shard_id},
                       {"node", stage.node.node_id},
                       {"error", reply.error}});
            fail(result,
                 InferenceError::StageFailure,
                 "stage " + std::to_string(index) + " (" + stage.shard.shard_id + ") failed: " + reply.error);
            return result;
        }

        table_.record_outcome(stage.node.node_id, true);
        carried = std::move(reply.result);
    }

    result.success = true;
    result.result = std::move(carried);
    result.nodes_used = stages.size();
    enter(result, TaskPhase::ConsensusReached);
    return result;
}

InferenceResult InferenceCoordinator::run_replication(const InferenceTask& task,
                                                      std::vector<NodeCapability> candidates,
                                                      Clock::time_point started) {
    InferenceResult result{};
    result.task_id = task.task_id;
    result.phase = TaskPhase::Planning;

    std::sort(candidates.begin(), candidates.end(), ShardPlanner::ranks_before);
    const auto replicas = std::min<std::size_t>(std::max<std::uint32_t>(task.redundancy, 1), candidates.size());
    candidates.resize(replicas);

    struct Dispatched {
        NodeId node_id;
        PendingReply pending;
    };

    std::vector<Dispatched> dispatched;
    dispatched.reserve(candidates.size());
    for (const auto& node : candidates) {
        StageRequest request{task.task_id, task.model_id, std::nullopt, task.input_data};
        dispatched.push_back(Dispatched{node.node_id, dispatcher_.dispatch(node, request)});
        result.participants.push_back(node.node_id);
    }
    enter(result, TaskPhase::Dispatched);
    enter(result, TaskPhase::Collecting);

    const auto deadline = started + task.timeout;
    std::vector<ReplicaResult> responses;
    bool outstanding = false;
    std::string last_error;

    for (auto& entry : dispatched) {
        if (entry.pending.reply.wait_until(deadline) != std::future_status::ready) {
            dispatcher_.abandon(entry.pending.request_id);
            table_.record_outcome(entry.node_id, false);
            outstanding = true;
            continue;
        }
        auto reply = await_reply(entry.pending.reply);
        if (!reply.success) {
            table_.record_outcome(entry.node_id, false);
            last_error = reply.error;
            continue;
        }
        responses.push_back(ReplicaResult{entry.node_id, std::move(reply.result)});
    }

    result.nodes_used = responses.size();

    if (responses.empty()) {
        if (outstanding) {
            fail(result, InferenceError::Timeout, "no replica answered before the deadline");
        } else {
            fail(result, InferenceError::TransportError, "every replica failed: " + last_error);
        }
        return result;
    }

    if (responses.size() == 1) {
        table_.record_outcome(responses.front().node_id, true);
        result.success = true;
        result.result = std::move(responses.front().result);
        enter(result, TaskPhase::ConsensusReached);
        return result;
    }

    result.consensus_invoked = true;
    const auto outcome = consensus_.reach_consensus(responses);
    if (!outcome.reached) {
        result.error = InferenceError::ConsensusNotReached;
        result.error_message = "largest agreeing group " + std::to_string(outcome.winning_cluster_size) + " of " +
                               std::to_string(responses.size()) + ", needed " +
                               std::to_string(outcome.required_agreement);
        enter(result, TaskPhase::NoConsensus);
        return result;
    }

    for (const auto& node_id : outcome.agreeing_nodes) {
        table_.record_outcome(node_id, true);
    }
    for (const auto& node_id : outcome.dissenting_nodes) {
        table_.record_outcome(node_id, false);
    }

    result.success = true;
    result.consensus_reached = true;
    result.result = outcome.value;
    enter(result, TaskPhase::ConsensusReached);
    return result;
}

void InferenceCoordinator::enter(InferenceResult& result, TaskPhase phase) const {
    result.phase = phase;
    if (phase_observer_) {
        phase_observer_(result.task_id, phase);
    }
}

void InferenceCoordinator::fail(InferenceResult& result, InferenceError error, std::string message) const {
    result.success = false;
    result.error = error;
    result.error_message = std::move(message);
    enter(result, TaskPhase::Failed);
}

StageReply InferenceCoordinator::await_reply(std::future<StageReply>& reply) {
    try {
        return reply.get();
    } catch (const std::future_error& ex) {
        StageReply broken{};
        broken.transport_failure = true;
        broken.error = ex.what();
        return broken;
    }
}

}  // namespace cortexnet
