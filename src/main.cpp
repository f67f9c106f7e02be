#include "cortexnet/Config.hpp"
#include "cortexnet/Types.hpp"
#include "cortexnet/Value.hpp"
#include "cortexnet/core/InferenceExecutor.hpp"
#include "cortexnet/core/NetworkManager.hpp"
#include "cortexnet/diagnostics/StructuredLogger.hpp"
#include "cortexnet/network/LoopbackTransport.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace std::chrono_literals;

namespace {

struct SimulationOptions {
    std::size_t compute_nodes{4};
    std::size_t faulty_nodes{1};
    std::uint32_t model_layers{24};
    cortexnet::NodeType entry_type{cortexnet::NodeType::Gateway};
    bool verbose{false};
};

void print_usage() {
    std::cout << "Usage: cortexnet-sim [options]\n\n"
              << "  --nodes <n>     compute nodes to start (default 4)\n"
              << "  --faulty <n>    compute nodes answering with a wrong label (default 1)\n"
              << "  --layers <n>    layers of the sharded model (default 24)\n"
              << "  --entry <type>  role of the requesting node: full, compute, coordinator, gateway\n"
              << "  --verbose       emit debug-level structured logs\n"
              << "  --help          show this message\n";
}

std::optional<std::size_t> parse_count(std::string_view text) {
    std::size_t value = 0;
    const auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (error != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<SimulationOptions> parse_options(int argc, char** argv) {
    SimulationOptions options{};
    for (int index = 1; index < argc; ++index) {
        const std::string_view arg = argv[index];
        if (arg == "--help") {
            print_usage();
            std::exit(EXIT_SUCCESS);
        }
        if (arg == "--verbose") {
            options.verbose = true;
            continue;
        }
        if (index + 1 >= argc) {
            std::cerr << "Missing value for " << arg << std::endl;
            return std::nullopt;
        }
        if (arg == "--entry") {
            const auto type = cortexnet::node_type_from_string(argv[++index]);
            if (!type.has_value()) {
                std::cerr << "Unknown node type " << argv[index] << std::endl;
                return std::nullopt;
            }
            options.entry_type = *type;
            continue;
        }
        const auto value = parse_count(argv[++index]);
        if (!value.has_value()) {
            std::cerr << "Expected a number after " << arg << std::endl;
            return std::nullopt;
        }
        if (arg == "--nodes") {
            options.compute_nodes = *value;
        } else if (arg == "--faulty") {
            options.faulty_nodes = *value;
        } else if (arg == "--layers") {
            options.model_layers = static_cast<std::uint32_t>(*value);
        } else {
            std::cerr << "Unknown option " << arg << std::endl;
            return std::nullopt;
        }
    }
    if (options.compute_nodes == 0) {
        std::cerr << "At least one compute node is required." << std::endl;
        return std::nullopt;
    }
    return options;
}

// Stand-in model backend: classification for "sentiment", a layer trace for "llm-7b".
std::shared_ptr<cortexnet::InferenceExecutor> make_executor(const std::string& node_id, bool faulty) {
    return std::make_shared<cortexnet::FunctionExecutor>(
        [node_id, faulty](const std::string& model_id,
                          const std::optional<std::string>& shard_id,
                          const cortexnet::Value& input) -> cortexnet::Value {
            if (model_id == "sentiment") {
                return cortexnet::Value(faulty ? "negative" : "positive");
            }
            auto trace = input.is_array() ? input : cortexnet::Value::make_array();
            trace.push_back(cortexnet::Value(shard_id.value_or(model_id) + "@" + node_id));
            return trace;
        });
}

void print_result(std::string_view label, const cortexnet::InferenceResult& result) {
    std::cout << label << ": " << (result.success ? "ok" : "failed") << " phase=" << cortexnet::to_string(result.phase)
              << " nodes=" << result.nodes_used << " consensus=" << (result.consensus_invoked ? "invoked" : "skipped")
              << " elapsed=" << result.execution_time.count() << "ms";
    if (result.result.has_value()) {
        std::cout << " result=" << cortexnet::to_display_string(*result.result);
    }
    if (result.error.has_value()) {
        std::cout << " error=" << cortexnet::to_string(*result.error) << " (" << result.error_message << ")";
    }
    std::cout << std::endl;
}

int run(const SimulationOptions& options) {
    using cortexnet::diagnostics::StructuredLogger;
    StructuredLogger::instance().set_minimum_level(options.verbose ? StructuredLogger::Level::Debug
                                                                   : StructuredLogger::Level::Warning);

    cortexnet::network::LoopbackHub hub;

    auto make_config = [](std::string node_id, cortexnet::NodeType type) {
        cortexnet::Config config{};
        config.node_id = std::move(node_id);
        config.node_type = type;
        config.heartbeat_interval = 200ms;
        config.maintenance_interval = 500ms;
        config.default_timeout = 2s;
        return config;
    };

    auto gateway_config = make_config("gateway", options.entry_type);
    cortexnet::NetworkManager gateway(gateway_config, hub.create_endpoint(gateway_config.node_id));
    gateway.start_network({});

    std::vector<std::unique_ptr<cortexnet::NetworkManager>> workers;
    for (std::size_t index = 0; index < options.compute_nodes; ++index) {
        auto config = make_config("compute-" + std::to_string(index + 1), cortexnet::NodeType::ComputeOnly);
        config.compute_power = 1.0 + static_cast<double>(index);
        config.memory_gb = 16.0;
        config.hosted_models = {"sentiment", "llm-7b"};
        const bool faulty = index < options.faulty_nodes;
        auto transport = hub.create_endpoint(config.node_id);
        workers.push_back(std::make_unique<cortexnet::NetworkManager>(config,
                                                                      std::move(transport),
                                                                      make_executor(config.node_id, faulty)));
        if (!workers.back()->start_network({gateway.node_id()})) {
            std::cerr << config.node_id << " could not reach the gateway" << std::endl;
        }
    }
    if (!hub.wait_idle(2s)) {
        std::cerr << "network did not settle after joining" << std::endl;
    }

    const auto joined = gateway.get_network_status();
    std::cout << "gateway knows " << joined.known_nodes << " nodes, " << joined.connected_peers << " connected"
              << std::endl;

    print_result("sentiment x3", gateway.request_inference("sentiment", cortexnet::Value("great product"), 5, 2s, 3));

    const auto plan = gateway.publish_sharding_plan("llm-7b", options.model_layers);
    for (const auto& shard : plan.shards) {
        std::cout << "  " << shard.shard_id << " layers " << shard.layer_start << "-" << shard.layer_end << " "
                  << shard.size_mb << "MB checksum " << shard.checksum << std::endl;
    }
    if (!hub.wait_idle(2s)) {
        std::cerr << "sharding plan still propagating" << std::endl;
    }

    print_result("llm-7b pipeline", gateway.request_inference("llm-7b", cortexnet::Value::make_array()));
    print_result("unknown model", gateway.request_inference("vision-xl", cortexnet::Value("image")));

    const auto status = gateway.get_network_status();
    std::cout << std::fixed << std::setprecision(2) << "health=" << status.health_score
              << " sent=" << status.metrics.messages_sent << " received=" << status.metrics.messages_received
              << " forwarded=" << status.metrics.messages_forwarded
              << " avg_latency_ms=" << status.metrics.average_latency_ms << std::endl;

    for (auto& worker : workers) {
        worker->stop_network();
    }
    gateway.stop_network();
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char** argv) {
    const auto options = parse_options(argc, argv);
    if (!options.has_value()) {
        print_usage();
        return EXIT_FAILURE;
    }
    try {
        return run(*options);
    } catch (const std::exception& ex) {
        std::cerr << "Simulation failed: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
