#include "cortexnet/Config.hpp"
#include "cortexnet/core/ConsensusEngine.hpp"
#include "cortexnet/core/InferenceCoordinator.hpp"
#include "cortexnet/core/ShardPlanner.hpp"
#include "cortexnet/diagnostics/StructuredLogger.hpp"
#include "cortexnet/dht/KademliaTable.hpp"

#include <cassert>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <vector>

using namespace cortexnet;
using namespace std::chrono_literals;

namespace {

// Answers inline from a per-node script; nodes without a script never answer.
class ScriptedDispatcher : public InferenceDispatcher {
public:
    using Script = std::function<StageReply(const StageRequest&)>;

    void script(const NodeId& node, Script script) { scripts_[node] = std::move(script); }

    PendingReply dispatch(const NodeCapability& node, const StageRequest& request) override {
        PendingReply pending{};
        pending.request_id = "req-" + std::to_string(++counter_);
        std::promise<StageReply> promise;
        pending.reply = promise.get_future();
        calls_.push_back({node.node_id, request});

        const auto it = scripts_.find(node.node_id);
        if (it != scripts_.end()) {
            promise.set_value(it->second(request));
        } else {
            hanging_.emplace(pending.request_id, std::move(promise));
        }
        return pending;
    }

    void abandon(const std::string& request_id) override {
        abandoned_.push_back(request_id);
        hanging_.erase(request_id);
    }

    struct Call {
        NodeId node;
        StageRequest request;
    };

    const std::vector<Call>& calls() const { return calls_; }
    const std::vector<std::string>& abandoned() const { return abandoned_; }
    void reset() {
        calls_.clear();
        abandoned_.clear();
    }

private:
    std::map<NodeId, Script> scripts_;
    std::map<std::string, std::promise<StageReply>> hanging_;
    std::vector<Call> calls_;
    std::vector<std::string> abandoned_;
    int counter_{0};
};

// Appends "<shard>@<node>" to the carried array.
ScriptedDispatcher::Script append_stage(const NodeId& node) {
    return [node](const StageRequest& request) {
        StageReply reply{};
        reply.success = true;
        reply.result = request.input;
        reply.result.push_back(Value(request.shard_id.value_or("?") + "@" + node));
        return reply;
    };
}

ScriptedDispatcher::Script failing(std::string error) {
    return [error](const StageRequest&) {
        StageReply reply{};
        reply.error = error;
        return reply;
    };
}

NodeCapability host(const NodeId& id, double compute) {
    NodeCapability node{};
    node.node_id = id;
    node.compute_power = compute;
    node.models = {"llm"};
    return node;
}

ModelShard shard(std::uint32_t index, std::uint32_t start, std::uint32_t end) {
    ModelShard out{};
    out.model_id = "llm";
    out.shard_id = "llm_shard_" + std::to_string(index);
    out.layer_start = start;
    out.layer_end = end;
    return out;
}

InferenceTask make_task(std::chrono::milliseconds timeout = 2s) {
    InferenceTask task{};
    task.task_id = make_unique_id();
    task.model_id = "llm";
    task.input_data = Value::make_array();
    task.timeout = timeout;
    task.redundancy = 3;
    return task;
}

}  // namespace

int main() {
    diagnostics::StructuredLogger::instance().set_enabled(false);

    Config config{};
    dht::KademliaTable table{"coordinator"};
    ShardPlanner planner{config};
    ConsensusEngine consensus{};
    ScriptedDispatcher dispatcher;
    InferenceCoordinator coordinator{table, planner, consensus, dispatcher};

    for (const auto* id : {"n1", "n2", "n3"}) {
        table.add_node(host(id, 2.0));
    }
    table.add_node(host("backup", 1.0));

    // Stage 2 is registered first to show that execution follows layer order.
    planner.register_shards("llm",
                            {shard(2, 8, 11), shard(0, 0, 3), shard(1, 4, 7)},
                            {{"llm_shard_0", {"n1"}}, {"llm_shard_1", {"n2", "backup"}}, {"llm_shard_2", {"n3"}}});

    std::vector<TaskPhase> phases;
    coordinator.set_phase_observer([&phases](const std::string&, TaskPhase phase) { phases.push_back(phase); });

    // Each stage consumes the previous stage's output.
    {
        dispatcher.script("n1", append_stage("n1"));
        dispatcher.script("n2", append_stage("n2"));
        dispatcher.script("n3", append_stage("n3"));

        const auto result = coordinator.execute(make_task());
        assert(result.success);
        assert(!result.error.has_value());
        assert(result.nodes_used == 3);
        assert(!result.consensus_invoked);
        assert(result.phase == TaskPhase::ConsensusReached);
        assert(result.participants == (std::vector<NodeId>{"n1", "n2", "n3"}));

        const auto& trace = result.result->as_array();
        assert(trace.size() == 3);
        assert(trace[0] == Value("llm_shard_0@n1"));
        assert(trace[1] == Value("llm_shard_1@n2"));
        assert(trace[2] == Value("llm_shard_2@n3"));

        const auto& calls = dispatcher.calls();
        assert(calls.size() == 3);
        assert(calls[0].request.input.size() == 0);
        assert(calls[1].request.input.size() == 1);
        assert(calls[2].request.input.size() == 2);
        assert(calls[1].request.shard_id == std::optional<std::string>("llm_shard_1"));

        assert(phases == (std::vector<TaskPhase>{TaskPhase::Planning,
                                                 TaskPhase::Dispatched,
                                                 TaskPhase::Collecting,
                                                 TaskPhase::ConsensusReached}));
        assert(table.get_node("n1")->reliability_score == 1.0);
    }

    // A failed first stage stops the pipeline before any later work is sent.
    {
        dispatcher.reset();
        phases.clear();
        dispatcher.script("n1", failing("out of memory"));

        const auto result = coordinator.execute(make_task());
        assert(!result.success);
        assert(result.error == InferenceError::StageFailure);
        assert(result.failed_stage == std::optional<std::size_t>(0));
        assert(result.nodes_used == 1);
        assert(result.phase == TaskPhase::Failed);
        assert(result.error_message.find("out of memory") != std::string::npos);
        assert(dispatcher.calls().size() == 1);
        assert(table.get_node("n1")->reliability_score < 1.0);
        assert(phases.back() == TaskPhase::Failed);
        dispatcher.script("n1", append_stage("n1"));
    }

    // A silent middle stage times out against the task deadline.
    {
        ScriptedDispatcher silent;
        InferenceCoordinator quiet{table, planner, consensus, silent};
        silent.script("n1", append_stage("n1"));
        silent.script("n3", append_stage("n3"));

        const auto started = Clock::now();
        const auto result = quiet.execute(make_task(100ms));
        assert(!result.success);
        assert(result.error == InferenceError::Timeout);
        assert(result.failed_stage == std::optional<std::size_t>(1));
        assert(result.nodes_used == 2);
        assert(result.participants == (std::vector<NodeId>{"n1", "n2"}));
        assert(Clock::now() - started < 2s);
        assert(silent.calls().size() == 2);
        assert(silent.abandoned().size() == 1);
    }

    // The best live holder serves a stage; when none is live the task fails before dispatch.
    {
        table.record_outcome("n2", false);
        ScriptedDispatcher fallback;
        InferenceCoordinator rerouted{table, planner, consensus, fallback};
        fallback.script("n1", append_stage("n1"));
        fallback.script("backup", append_stage("backup"));
        fallback.script("n3", append_stage("n3"));
        fallback.script("n2", append_stage("n2"));

        table.record_outcome("n2", false);
        table.record_outcome("n2", false);
        const auto result = rerouted.execute(make_task());
        assert(result.success);
        assert(result.result->as_array()[1] == Value("llm_shard_1@backup"));

        table.remove_node("n3");
        fallback.reset();
        const auto missing = rerouted.execute(make_task());
        assert(!missing.success);
        assert(missing.error == InferenceError::ShardUnavailable);
        assert(missing.failed_stage == std::optional<std::size_t>(2));
        assert(missing.nodes_used == 0);
        assert(fallback.calls().empty());
    }

    // Nobody hosts the model.
    {
        auto task = make_task();
        task.model_id = "vision";
        const auto result = coordinator.execute(task);
        assert(!result.success);
        assert(result.error == InferenceError::NoNodesAvailable);
        assert(result.phase == TaskPhase::Failed);
    }

    assert(is_terminal(TaskPhase::NoConsensus));
    assert(!is_terminal(TaskPhase::Collecting));
    assert(to_string(InferenceError::ShardUnavailable) == "shard_unavailable");

    return 0;
}
