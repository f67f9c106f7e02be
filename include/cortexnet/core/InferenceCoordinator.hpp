#pragma once

#include "cortexnet/Types.hpp"
#include "cortexnet/Value.hpp"
#include "cortexnet/core/ConsensusEngine.hpp"
#include "cortexnet/core/ShardPlanner.hpp"
#include "cortexnet/dht/KademliaTable.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <vector>

namespace cortexnet {

enum class InferenceError {
    NoNodesAvailable,
    ShardUnavailable,
    StageFailure,
    ConsensusNotReached,
    Timeout,
    TransportError,
};

std::string to_string(InferenceError error);

enum class TaskPhase {
    Planning,
    Dispatched,
    Collecting,
    ConsensusReached,
    NoConsensus,
    Failed,
};

std::string to_string(TaskPhase phase);
bool is_terminal(TaskPhase phase) noexcept;

struct InferenceResult {
    std::string task_id;
    bool success{false};
    std::optional<Value> result;
    std::optional<InferenceError> error;
    std::string error_message;
    std::chrono::milliseconds execution_time{0};
    std::size_t nodes_used{0};
    bool consensus_invoked{false};
    bool consensus_reached{false};
    TaskPhase phase{TaskPhase::Planning};
    // Pipeline stage index that failed, when the failure belongs to one stage.
    std::optional<std::size_t> failed_stage;
    std::vector<NodeId> participants;
};

// One remote execution: the whole model when shard_id is empty, otherwise one pipeline stage.
struct StageRequest {
    std::string task_id;
    std::string model_id;
    std::optional<std::string> shard_id;
    Value input;
};

struct StageReply {
    bool success{false};
    Value result;
    std::string error;
    // The request never reached the node or the node went away.
    bool transport_failure{false};
    std::chrono::milliseconds processing_time{0};
};

struct PendingReply {
    std::string request_id;
    std::future<StageReply> reply;
};

class InferenceDispatcher {
public:
    virtual ~InferenceDispatcher() = default;

    // The returned future is always eventually satisfied unless the request is abandoned.
    virtual PendingReply dispatch(const NodeCapability& node, const StageRequest& request) = 0;
    // Late replies for an abandoned request are discarded.
    virtual void abandon(const std::string& request_id) = 0;
};

// Runs one task end to end: plan from the DHT and registered shards, dispatch, collect, agree.
class InferenceCoordinator {
public:
    using PhaseObserver = std::function<void(const std::string& task_id, TaskPhase phase)>;

    InferenceCoordinator(dht::KademliaTable& table,
                         const ShardPlanner& planner,
                         const ConsensusEngine& consensus,
                         InferenceDispatcher& dispatcher);

    InferenceResult execute(const InferenceTask& task);

    void set_phase_observer(PhaseObserver observer);

private:
    struct Stage {
        ModelShard shard;
        NodeCapability node;
    };

    InferenceResult run_pipeline(const InferenceTask& task,
                                 const std::vector<NodeCapability>& candidates,
                                 Clock::time_point started);
    InferenceResult run_replication(const InferenceTask& task,
                                    std::vector<NodeCapability> candidates,
                                    Clock::time_point started);

    void enter(InferenceResult& result, TaskPhase phase) const;
    void fail(InferenceResult& result, InferenceError error, std::string message) const;
    static StageReply await_reply(std::future<StageReply>& reply);

    dht::KademliaTable& table_;
    const ShardPlanner& planner_;
    const ConsensusEngine& consensus_;
    InferenceDispatcher& dispatcher_;
    PhaseObserver phase_observer_{};
};

}  // namespace cortexnet
