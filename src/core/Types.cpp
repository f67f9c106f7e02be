#include "cortexnet/Types.hpp"

#include "cortexnet/crypto/Sha256.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace cortexnet {

namespace {

std::mt19937_64& id_generator() {
    thread_local std::mt19937_64 generator{[] {
        std::random_device device;
        const auto high = static_cast<std::uint64_t>(device()) << 32;
        return high | static_cast<std::uint64_t>(device());
    }()};
    return generator;
}

}  // namespace

std::string to_string(NodeType type) {
    switch (type) {
        case NodeType::FullNode:
            return "full";
        case NodeType::ComputeOnly:
            return "compute";
        case NodeType::CoordinatorOnly:
            return "coordinator";
        case NodeType::Gateway:
            return "gateway";
    }
    return "full";
}

std::optional<NodeType> node_type_from_string(std::string_view text) {
    if (text == "full" || text == "full_node") {
        return NodeType::FullNode;
    }
    if (text == "compute" || text == "compute_node") {
        return NodeType::ComputeOnly;
    }
    if (text == "coordinator") {
        return NodeType::CoordinatorOnly;
    }
    if (text == "gateway") {
        return NodeType::Gateway;
    }
    return std::nullopt;
}

std::string make_unique_id() {
    auto& generator = id_generator();
    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setfill('0') << std::setw(16) << generator() << std::setw(16)
        << generator();
    return oss.str();
}

std::uint64_t hash_identifier(std::string_view id) {
    const auto digest = crypto::Sha256::digest(id);
    std::uint64_t value = 0;
    for (std::size_t index = 0; index < 8; ++index) {
        value = (value << 8) | static_cast<std::uint64_t>(digest[index]);
    }
    return value;
}

std::uint64_t xor_distance(std::string_view lhs, std::string_view rhs) {
    return hash_identifier(lhs) ^ hash_identifier(rhs);
}

std::uint64_t unix_millis_now() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

}  // namespace cortexnet
