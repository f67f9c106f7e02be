#include "cortexnet/core/NetworkManager.hpp"

#include "cortexnet/diagnostics/StructuredLogger.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace cortexnet {

using diagnostics::StructuredLogger;
using diagnostics::log_event;

namespace {

constexpr std::chrono::milliseconds kMinimumLoopInterval{10};

Config sanitize(Config config) {
    if (config.node_id.empty()) {
        config.node_id = make_unique_id();
    }
    config.k_bucket_size = std::max<std::size_t>(config.k_bucket_size, 1);
    config.stale_after = std::max(config.stale_after, std::chrono::seconds(1));
    config.heartbeat_interval = std::max(config.heartbeat_interval, kMinimumLoopInterval);
    config.maintenance_interval = std::max(config.maintenance_interval, kMinimumLoopInterval);
    config.message_cache_ttl = std::max(config.message_cache_ttl, std::chrono::seconds(1));
    config.message_ttl = std::max<std::int32_t>(config.message_ttl, 1);
    config.max_peers = std::max<std::size_t>(config.max_peers, 1);
    config.reannounce_probability = std::clamp(config.reannounce_probability, 0.0, 1.0);
    config.byzantine_tolerance = std::clamp(config.byzantine_tolerance, 0.0, 0.99);
    config.numeric_tolerance = std::clamp(config.numeric_tolerance, 0.0, 0.99);
    config.default_redundancy = std::max<std::uint32_t>(config.default_redundancy, 1);
    if (config.default_timeout <= std::chrono::milliseconds::zero()) {
        config.default_timeout = std::chrono::seconds(30);
    }
    config.max_concurrent_inferences = std::max<std::uint32_t>(config.max_concurrent_inferences, 1);
    config.connectivity_target = std::max<std::size_t>(config.connectivity_target, 1);
    return config;
}

std::uint64_t seed_from_config(const Config& config) {
    if (config.identity_seed.has_value()) {
        return *config.identity_seed;
    }
    return hash_identifier(config.node_id) ^ static_cast<std::uint64_t>(Clock::now().time_since_epoch().count());
}

// Decrements active_inferences for the lifetime of one request.
class ActiveScope {
public:
    explicit ActiveScope(std::atomic<std::uint32_t>& counter)
        : counter_(counter) {
        ++counter_;
    }
    ~ActiveScope() { --counter_; }

    ActiveScope(const ActiveScope&) = delete;
    ActiveScope& operator=(const ActiveScope&) = delete;

private:
    std::atomic<std::uint32_t>& counter_;
};

}  // namespace

NetworkManager::NetworkManager(Config config,
                               std::unique_ptr<network::Transport> transport,
                               std::shared_ptr<InferenceExecutor> executor)
    : config_(sanitize(std::move(config))),
      transport_(std::move(transport)),
      table_(config_.node_id, config_.k_bucket_size, config_.stale_after),
      planner_(config_),
      consensus_(config_.byzantine_tolerance, config_.numeric_tolerance),
      coordinator_(table_, planner_, consensus_, *this),
      cache_(config_.message_cache_ttl),
      hosted_models_(config_.hosted_models),
      executor_(std::move(executor)),
      rng_(seed_from_config(config_)) {
    if (!transport_) {
        throw std::invalid_argument("NetworkManager requires a transport");
    }
    for (const auto& model : hosted_models_) {
        model_info_.emplace(model, Value::make_object());
    }
}

NetworkManager::~NetworkManager() {
    stop_network();
}

bool NetworkManager::start_network() {
    return start_network(config_.bootstrap_addresses);
}

bool NetworkManager::start_network(const std::vector<std::string>& bootstrap_addresses) {
    if (running_.exchange(true)) {
        return true;
    }

    transport_->set_message_handler([this](const network::TransportMessage& message) { on_message(message); });
    log_event(StructuredLogger::Level::Info,
              "network.starting",
              {{"node", config_.node_id},
               {"type", to_string(config_.node_type)},
               {"bootstrap", std::to_string(bootstrap_addresses.size())}});

    bool joined = false;
    for (const auto& address : bootstrap_addresses) {
        const auto peer = transport_->connect(address);
        if (!peer.has_value()) {
            log_event(StructuredLogger::Level::Warning, "network.join.unreachable", {{"address", address}});
            continue;
        }

        note_contact(*peer, Clock::now());
        protocol::NodeQueryPayload query{};
        query.query_type = protocol::kDiscoverPeersQuery;
        query.count = config_.discover_peer_count;
        reply_to(*peer, query);
        log_event(StructuredLogger::Level::Info, "network.join.connected", {{"address", address}, {"peer", *peer}});
        joined = true;
        break;
    }

    announce_self();
    if (config_.background_loops) {
        start_worker();
    }
    return joined || bootstrap_addresses.empty();
}

void NetworkManager::stop_network() {
    if (!running_.exchange(false)) {
        return;
    }

    stop_worker();
    transport_->set_message_handler(nullptr);
    drain_serving();
    fail_pending_requests("network stopped");

    std::vector<NodeId> peers;
    {
        std::scoped_lock lock(connections_mutex_);
        for (const auto& [peer, _] : connections_) {
            peers.push_back(peer);
        }
        connections_.clear();
    }
    for (const auto& peer : peers) {
        transport_->disconnect(peer);
    }

    log_event(StructuredLogger::Level::Info, "network.stopped", {{"node", config_.node_id}});
}

void NetworkManager::drain_serving() {
    std::vector<std::future<void>> serving;
    {
        std::scoped_lock lock(serving_mutex_);
        serving.swap(serving_);
    }
    for (auto& task : serving) {
        task.wait();
    }
}

void NetworkManager::announce_self() {
    broadcast(protocol::NodeAnnouncePayload{self_capability()});

    std::map<std::string, Value> models;
    {
        std::scoped_lock lock(self_mutex_);
        models = model_info_;
    }
    for (const auto& [model_id, info] : models) {
        broadcast(protocol::ModelAnnouncePayload{model_id, info, config_.node_id});
    }
}

void NetworkManager::announce_model(const std::string& model_id, Value model_info) {
    {
        std::scoped_lock lock(self_mutex_);
        hosted_models_.insert(model_id);
        model_info_[model_id] = model_info;
    }
    record_model_fact(model_id, model_info, config_.node_id);
    broadcast(protocol::ModelAnnouncePayload{model_id, std::move(model_info), config_.node_id});
    log_event(StructuredLogger::Level::Info, "network.model_announced", {{"model", model_id}});
}

InferenceResult NetworkManager::request_inference(const std::string& model_id,
                                                  Value input,
                                                  int priority,
                                                  std::optional<std::chrono::milliseconds> timeout,
                                                  std::optional<std::uint32_t> redundancy) {
    InferenceTask task{};
    task.task_id = make_unique_id();
    task.model_id = model_id;
    task.input_data = std::move(input);
    task.priority = priority;
    task.timeout = timeout.value_or(config_.default_timeout);
    task.redundancy = std::max<std::uint32_t>(redundancy.value_or(config_.default_redundancy), 1);
    task.created_at = Clock::now();
    task.client_id = config_.node_id;

    if (!running_.load()) {
        InferenceResult result{};
        result.task_id = task.task_id;
        result.error = InferenceError::TransportError;
        result.error_message = "network not started";
        result.phase = TaskPhase::Failed;
        return result;
    }

    ActiveScope active{active_inferences_};
    auto result = coordinator_.execute(task);
    record_result(result);
    return result;
}

NetworkStatus NetworkManager::get_network_status() const {
    NetworkStatus status{};
    status.node_id = config_.node_id;
    status.node_type = config_.node_type;
    status.running = running_.load();
    {
        std::scoped_lock lock(connections_mutex_);
        status.connected_peers = connections_.size();
    }
    const auto known = table_.all_nodes();
    status.known_nodes = known.size();
    status.active_inferences = active_inferences_.load();

    auto& metrics = status.metrics;
    metrics.messages_sent = counters_.sent.load();
    metrics.messages_received = counters_.received.load();
    metrics.messages_forwarded = counters_.forwarded.load();
    metrics.messages_dropped = counters_.dropped.load();
    metrics.inferences_completed = counters_.completed.load();
    metrics.inferences_succeeded = counters_.succeeded.load();
    metrics.consensus_reached = counters_.consensus_reached.load();
    metrics.consensus_failed = counters_.consensus_failed.load();
    if (metrics.inferences_completed > 0) {
        metrics.average_latency_ms =
            static_cast<double>(counters_.total_latency_ms.load()) / static_cast<double>(metrics.inferences_completed);
    }

    std::set<NodeType> types{config_.node_type};
    for (const auto& node : known) {
        types.insert(node.node_type);
    }

    const double connectivity = std::min(
        1.0, static_cast<double>(status.connected_peers) / static_cast<double>(config_.connectivity_target));
    const double diversity = static_cast<double>(types.size()) / static_cast<double>(kNodeTypeCount);
    const double success_rate =
        metrics.inferences_completed > 0
            ? static_cast<double>(metrics.inferences_succeeded) / static_cast<double>(metrics.inferences_completed)
            : 0.5;
    status.health_score = (connectivity + diversity + success_rate) / 3.0;
    return status;
}

ShardingPlan NetworkManager::publish_sharding_plan(const std::string& model_id, std::uint32_t total_layers) {
    auto plan = planner_.plan_model(model_id, total_layers, table_.find_nodes_with_model(model_id));
    if (plan.shards.empty()) {
        log_event(StructuredLogger::Level::Warning,
                  "planner.plan_empty",
                  {{"model", model_id}, {"layers", std::to_string(total_layers)}});
        return plan;
    }

    planner_.register_shards(model_id, plan.shards, plan.placement);
    protocol::NetworkUpdatePayload update{};
    update.model_id = model_id;
    update.total_layers = total_layers;
    update.shards = plan.shards;
    update.placement = plan.placement;
    broadcast(std::move(update));
    return plan;
}

void NetworkManager::heartbeat() {
    protocol::HeartbeatPayload payload{};
    payload.load = current_load();
    payload.active_inferences = active_inferences_.load();
    broadcast(payload);
}

void NetworkManager::maintain() {
    maintain(Clock::now());
}

void NetworkManager::maintain(Clock::time_point now) {
    auto evicted = table_.evict_stale(now);
    std::vector<NodeId> disconnected;
    {
        std::scoped_lock lock(connections_mutex_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            const bool in_table = table_.get_node(it->first).has_value();
            const bool evicted_now = std::find(evicted.begin(), evicted.end(), it->first) != evicted.end();
            if (evicted_now || (!in_table && now - it->second > config_.stale_after)) {
                disconnected.push_back(it->first);
                it = connections_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& peer : disconnected) {
        transport_->disconnect(peer);
    }
    for (const auto& node_id : evicted) {
        log_event(StructuredLogger::Level::Info, "dht.evicted", {{"node", node_id}});
    }

    const auto expired = cache_.sweep(now);
    if (expired > 0) {
        log_event(StructuredLogger::Level::Debug, "gossip.cache_swept", {{"expired", std::to_string(expired)}});
    }

    bool reannounce = false;
    {
        std::scoped_lock lock(rng_mutex_);
        reannounce = std::uniform_real_distribution<double>(0.0, 1.0)(rng_) < config_.reannounce_probability;
    }
    if (reannounce && running_.load()) {
        announce_self();
    }
}

bool NetworkManager::connect_peer(const std::string& address) {
    const auto peer = transport_->connect(address);
    if (!peer.has_value()) {
        log_event(StructuredLogger::Level::Warning, "network.connect_failed", {{"address", address}});
        return false;
    }
    note_contact(*peer, Clock::now());
    return true;
}

std::vector<NodeId> NetworkManager::connected_peers() const {
    std::vector<NodeId> peers;
    std::scoped_lock lock(connections_mutex_);
    peers.reserve(connections_.size());
    for (const auto& [peer, _] : connections_) {
        peers.push_back(peer);
    }
    std::sort(peers.begin(), peers.end());
    return peers;
}

void NetworkManager::on_message(const network::TransportMessage& transport_message) {
    if (!running_.load()) {
        return;
    }

    auto decoded = protocol::decode(transport_message.payload);
    if (!decoded.has_value()) {
        ++counters_.dropped;
        log_event(StructuredLogger::Level::Warning, "gossip.malformed", {{"from", transport_message.from}});
        return;
    }
    ++counters_.received;

    const auto now = Clock::now();
    note_contact(transport_message.from, now);
    table_.touch(decoded->sender_id, now);

    if (decoded->sender_id == config_.node_id || !cache_.mark_if_new(decoded->message_id, now)) {
        ++counters_.dropped;
        log_event(StructuredLogger::Level::Debug,
                  "gossip.duplicate",
                  {{"message", decoded->message_id}, {"type", protocol::to_string(decoded->type)}});
        return;
    }

    std::visit([&](const auto& payload) { handle(payload, *decoded, transport_message.from); }, decoded->payload);

    if (protocol::is_relayed(decoded->type)) {
        relay(std::move(*decoded), transport_message.from);
    }
}

PendingReply NetworkManager::dispatch(const NodeCapability& node, const StageRequest& request) {
    PendingReply pending{};
    pending.request_id = make_unique_id();

    std::promise<StageReply> promise;
    pending.reply = promise.get_future();
    {
        std::scoped_lock lock(pending_mutex_);
        pending_.emplace(pending.request_id, PendingRequest{node.node_id, std::move(promise)});
    }

    protocol::InferenceRequestPayload payload{};
    payload.task_id = request.task_id;
    payload.request_id = pending.request_id;
    payload.model_id = request.model_id;
    payload.shard_id = request.shard_id;
    payload.input = request.input;

    const bool sent = ensure_connected(node) && reply_to(node.node_id, std::move(payload));
    if (!sent) {
        StageReply failure{};
        failure.transport_failure = true;
        failure.error = "unable to reach " + node.node_id;
        complete_request(pending.request_id, std::move(failure), std::nullopt);
    }
    return pending;
}

void NetworkManager::abandon(const std::string& request_id) {
    std::scoped_lock lock(pending_mutex_);
    pending_.erase(request_id);
}

void NetworkManager::set_executor(std::shared_ptr<InferenceExecutor> executor) {
    std::scoped_lock lock(self_mutex_);
    executor_ = std::move(executor);
}

void NetworkManager::set_phase_observer(InferenceCoordinator::PhaseObserver observer) {
    coordinator_.set_phase_observer(std::move(observer));
}

NodeCapability NetworkManager::self_capability() const {
    NodeCapability self{};
    self.node_id = config_.node_id;
    self.node_type = config_.node_type;
    self.endpoint = config_.endpoint;
    {
        std::scoped_lock lock(self_mutex_);
        self.models = hosted_models_;
    }
    self.compute_power = config_.compute_power;
    self.memory_gb = config_.memory_gb;
    self.bandwidth_mbps = config_.bandwidth_mbps;
    self.gpu_available = config_.gpu_available;
    self.current_load = current_load();
    self.last_seen = Clock::now();
    return self;
}

void NetworkManager::handle(const protocol::NodeAnnouncePayload& payload,
                            const protocol::Message&,
                            const NodeId&) {
    learn_node(payload.capability);
}

void NetworkManager::handle(const protocol::NodeQueryPayload& payload,
                            const protocol::Message& message,
                            const NodeId& from) {
    if (payload.query_type != protocol::kDiscoverPeersQuery) {
        log_event(StructuredLogger::Level::Debug, "gossip.unknown_query", {{"query", payload.query_type}});
        return;
    }

    protocol::NodeResponsePayload response{};
    response.query_type = payload.query_type;
    response.nodes = table_.find_closest_nodes(message.sender_id, payload.count);
    response.nodes.push_back(self_capability());
    reply_to(from, std::move(response));
}

void NetworkManager::handle(const protocol::NodeResponsePayload& payload,
                            const protocol::Message&,
                            const NodeId&) {
    for (const auto& capability : payload.nodes) {
        learn_node(capability);
    }
}

void NetworkManager::handle(const protocol::ModelAnnouncePayload& payload,
                            const protocol::Message& message,
                            const NodeId&) {
    const auto& host = payload.node_id.empty() ? message.sender_id : payload.node_id;
    if (host == config_.node_id) {
        return;
    }
    table_.add_model(host, payload.model_id);
    record_model_fact(payload.model_id, payload.model_info, host);
}

void NetworkManager::handle(const protocol::ModelRequestPayload& payload,
                            const protocol::Message&,
                            const NodeId& from) {
    protocol::NodeResponsePayload response{};
    response.query_type = protocol::kFindModelQuery;
    response.model_id = payload.model_id;
    response.nodes = table_.find_nodes_with_model(payload.model_id);
    auto self = self_capability();
    if (self.hosts(payload.model_id)) {
        response.nodes.push_back(std::move(self));
    }
    reply_to(from, std::move(response));
}

void NetworkManager::handle(const protocol::InferenceRequestPayload& payload,
                            const protocol::Message&,
                            const NodeId& from) {
    // Served off the delivery thread so one slow model does not stall gossip or other requests.
    auto task = std::async(std::launch::async, [this, payload, from]() { serve_inference(payload, from); });

    std::scoped_lock lock(serving_mutex_);
    serving_.erase(std::remove_if(serving_.begin(),
                                  serving_.end(),
                                  [](const std::future<void>& pending) {
                                      return pending.wait_for(std::chrono::seconds::zero()) ==
                                             std::future_status::ready;
                                  }),
        serving_.end());
    serving_.push_back(std::move(task));
}

void NetworkManager::serve_inference(const protocol::InferenceRequestPayload& payload, const NodeId& from) {
    ActiveScope active{active_inferences_};
    const auto started = Clock::now();

    protocol::InferenceResponsePayload response{};
    response.task_id = payload.task_id;
    response.request_id = payload.request_id;

    std::shared_ptr<InferenceExecutor> executor;
    bool hosted = false;
    {
        std::scoped_lock lock(self_mutex_);
        executor = executor_;
        hosted = hosted_models_.count(payload.model_id) != 0;
    }

    if (!hosted) {
        response.error = "model not hosted: " + payload.model_id;
    } else if (!executor) {
        response.error = "no inference executor configured";
    } else {
        try {
            response.result = executor->execute(payload.model_id, payload.shard_id, payload.input);
            response.success = true;
        } catch (const std::exception& ex) {
            response.error = ex.what();
        }
    }

    response.processing_time_ms = static_cast<std::uint32_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started).count());
    if (!response.success) {
        log_event(StructuredLogger::Level::Warning,
                  "inference.execute_failed",
                  {{"task", payload.task_id},
                   {"model", payload.model_id},
                   {"shard", payload.shard_id.value_or("")},
                   {"error", response.error}});
    }
    reply_to(from, std::move(response));
}

void NetworkManager::handle(const protocol::InferenceResponsePayload& payload,
                            const protocol::Message&,
                            const NodeId& from) {
    StageReply reply{};
    reply.success = payload.success;
    reply.result = payload.result;
    reply.error = payload.error;
    reply.processing_time = std::chrono::milliseconds(payload.processing_time_ms);
    complete_request(payload.request_id, std::move(reply), from);
}

void NetworkManager::handle(const protocol::HeartbeatPayload& payload,
                            const protocol::Message& message,
                            const NodeId&) {
    table_.set_load(message.sender_id, payload.load);
}

void NetworkManager::handle(const protocol::NetworkUpdatePayload& payload,
                            const protocol::Message& message,
                            const NodeId&) {
    if (!ShardPlanner::is_partition(payload.shards, payload.total_layers)) {
        log_event(StructuredLogger::Level::Warning,
                  "planner.update_rejected",
                  {{"model", payload.model_id}, {"sender", message.sender_id}});
        return;
    }
    planner_.register_shards(payload.model_id, payload.shards, payload.placement);
    log_event(StructuredLogger::Level::Info,
              "planner.update_applied",
              {{"model", payload.model_id}, {"shards", std::to_string(payload.shards.size())}});
}

void NetworkManager::broadcast(protocol::Payload payload) {
    auto message = protocol::make_message(config_.node_id, std::move(payload), config_.message_ttl);
    cache_.mark_if_new(message.message_id);
    if (message.ttl <= 0) {
        return;
    }

    const auto encoded = protocol::encode(message);
    for (const auto& peer : connected_peers()) {
        if (transport_->send(peer, encoded)) {
            ++counters_.sent;
        }
    }
}

void NetworkManager::relay(protocol::Message message, const NodeId& from) {
    if (message.ttl <= 0) {
        ++counters_.dropped;
        log_event(StructuredLogger::Level::Debug,
                  "gossip.ttl_expired",
                  {{"message", message.message_id}, {"type", protocol::to_string(message.type)}});
        return;
    }

    --message.ttl;
    message.path.push_back(config_.node_id);
    const std::unordered_set<NodeId> visited(message.path.begin(), message.path.end());
    const auto encoded = protocol::encode(message);

    for (const auto& peer : connected_peers()) {
        if (peer == from || visited.count(peer) != 0) {
            continue;
        }
        if (transport_->send(peer, encoded)) {
            ++counters_.sent;
            ++counters_.forwarded;
        }
    }
}

bool NetworkManager::send_to(const NodeId& peer, const protocol::Message& message) {
    if (!transport_->send(peer, protocol::encode(message))) {
        log_event(StructuredLogger::Level::Debug,
                  "gossip.send_failed",
                  {{"peer", peer}, {"type", protocol::to_string(message.type)}});
        return false;
    }
    ++counters_.sent;
    return true;
}

bool NetworkManager::reply_to(const NodeId& peer, protocol::Payload payload) {
    auto message = protocol::make_message(config_.node_id, std::move(payload), config_.message_ttl);
    cache_.mark_if_new(message.message_id);
    return send_to(peer, message);
}

void NetworkManager::note_contact(const NodeId& peer, Clock::time_point now) {
    if (peer.empty() || peer == config_.node_id) {
        return;
    }
    table_.touch(peer, now);

    std::scoped_lock lock(connections_mutex_);
    const auto it = connections_.find(peer);
    if (it != connections_.end()) {
        it->second = now;
    } else if (connections_.size() < config_.max_peers) {
        connections_.emplace(peer, now);
    }
}

bool NetworkManager::ensure_connected(const NodeCapability& node) {
    {
        std::scoped_lock lock(connections_mutex_);
        if (connections_.count(node.node_id) != 0) {
            return true;
        }
    }
    const auto peer = transport_->connect(node.address());
    if (!peer.has_value() || *peer != node.node_id) {
        return false;
    }
    std::scoped_lock lock(connections_mutex_);
    connections_.emplace(node.node_id, Clock::now());
    return true;
}

void NetworkManager::learn_node(NodeCapability capability) {
    if (capability.node_id.empty() || capability.node_id == config_.node_id) {
        return;
    }
    capability.last_seen = Clock::now();
    const bool known = table_.get_node(capability.node_id).has_value();
    table_.add_node(capability);
    if (known) {
        return;
    }

    log_event(StructuredLogger::Level::Debug,
              "dht.node_learned",
              {{"node", capability.node_id}, {"type", to_string(capability.node_type)}});

    bool has_room = false;
    {
        std::scoped_lock lock(connections_mutex_);
        has_room = connections_.count(capability.node_id) == 0 && connections_.size() < config_.max_peers;
    }
    if (has_room) {
        ensure_connected(capability);
    }
}

void NetworkManager::record_model_fact(const std::string& model_id, const Value& model_info, const NodeId& node_id) {
    auto fact = Value::make_object();
    fact["model_id"] = Value(model_id);
    fact["model_info"] = model_info;
    fact["node_id"] = Value(node_id);
    fact["timestamp"] = Value(static_cast<std::int64_t>(unix_millis_now()));
    table_.store_data("model:" + model_id, std::move(fact));
    table_.append_unique("model:" + model_id + ":nodes", Value(node_id));
}

void NetworkManager::complete_request(const std::string& request_id,
                                      StageReply reply,
                                      const std::optional<NodeId>& from) {
    std::promise<StageReply> promise;
    {
        std::scoped_lock lock(pending_mutex_);
        const auto it = pending_.find(request_id);
        if (it == pending_.end()) {
            log_event(StructuredLogger::Level::Debug, "inference.late_reply", {{"request", request_id}});
            return;
        }
        if (from.has_value() && *from != it->second.node_id) {
            log_event(StructuredLogger::Level::Warning,
                      "inference.reply_mismatch",
                      {{"request", request_id}, {"expected", it->second.node_id}, {"from", *from}});
            return;
        }
        promise = std::move(it->second.promise);
        pending_.erase(it);
    }
    promise.set_value(std::move(reply));
}

void NetworkManager::fail_pending_requests(const std::string& reason) {
    std::unordered_map<std::string, PendingRequest> drained;
    {
        std::scoped_lock lock(pending_mutex_);
        drained.swap(pending_);
    }
    for (auto& [_, request] : drained) {
        StageReply failure{};
        failure.transport_failure = true;
        failure.error = reason;
        request.promise.set_value(std::move(failure));
    }
}

void NetworkManager::record_result(const InferenceResult& result) {
    ++counters_.completed;
    if (result.success) {
        ++counters_.succeeded;
    }
    if (result.consensus_invoked) {
        if (result.consensus_reached) {
            ++counters_.consensus_reached;
        } else {
            ++counters_.consensus_failed;
        }
    }
    counters_.total_latency_ms += static_cast<std::uint64_t>(result.execution_time.count());
}

double NetworkManager::current_load() const {
    const auto active = static_cast<double>(active_inferences_.load());
    return std::clamp(active / static_cast<double>(config_.max_concurrent_inferences), 0.0, 1.0);
}

void NetworkManager::start_worker() {
    {
        std::scoped_lock lock(loop_mutex_);
        stop_requested_ = false;
    }
    worker_ = std::thread(&NetworkManager::worker_loop, this);
}

void NetworkManager::stop_worker() {
    {
        std::scoped_lock lock(loop_mutex_);
        stop_requested_ = true;
    }
    loop_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void NetworkManager::worker_loop() {
    auto next_heartbeat = Clock::now() + config_.heartbeat_interval;
    auto next_maintenance = Clock::now() + config_.maintenance_interval;

    std::unique_lock lock(loop_mutex_);
    while (!stop_requested_) {
        const auto wake = std::min(next_heartbeat, next_maintenance);
        if (loop_cv_.wait_until(lock, wake, [this] { return stop_requested_; })) {
            break;
        }

        lock.unlock();
        const auto now = Clock::now();
        if (now >= next_heartbeat) {
            heartbeat();
            next_heartbeat = now + config_.heartbeat_interval;
        }
        if (now >= next_maintenance) {
            maintain(now);
            next_maintenance = now + config_.maintenance_interval;
        }
        lock.lock();
    }
}

}  // namespace cortexnet
