#include "cortexnet/libcortexnet.hpp"

#include <utility>

namespace cortexnet::lib {

class CORTEXNET_LOCAL Node::Impl {
public:
    Impl(Config config, std::unique_ptr<network::Transport> transport, std::shared_ptr<InferenceExecutor> executor)
        : manager_(std::move(config), std::move(transport), std::move(executor)) {}

    NetworkManager manager_;
};

Node::Node(Config config, std::unique_ptr<network::Transport> transport, std::shared_ptr<InferenceExecutor> executor)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(transport), std::move(executor))) {}

Node::~Node() = default;
Node::Node(Node&&) noexcept = default;
Node& Node::operator=(Node&&) noexcept = default;

bool Node::start_network(const std::vector<std::string>& bootstrap_addresses) {
    if (bootstrap_addresses.empty()) {
        return impl_->manager_.start_network();
    }
    return impl_->manager_.start_network(bootstrap_addresses);
}

void Node::stop_network() {
    impl_->manager_.stop_network();
}

void Node::announce_model(const std::string& model_id, Value model_info) {
    impl_->manager_.announce_model(model_id, std::move(model_info));
}

InferenceResult Node::request_inference(const std::string& model_id,
                                        Value input,
                                        int priority,
                                        std::optional<std::chrono::milliseconds> timeout) {
    return impl_->manager_.request_inference(model_id, std::move(input), priority, timeout);
}

NetworkStatus Node::get_network_status() const {
    return impl_->manager_.get_network_status();
}

ShardingPlan Node::publish_sharding_plan(const std::string& model_id, std::uint32_t total_layers) {
    return impl_->manager_.publish_sharding_plan(model_id, total_layers);
}

const NodeId& Node::node_id() const noexcept {
    return impl_->manager_.node_id();
}

const Config& Node::config() const noexcept {
    return impl_->manager_.config();
}

}  // namespace cortexnet::lib
