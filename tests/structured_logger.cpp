#include "cortexnet/diagnostics/StructuredLogger.hpp"

#include <cassert>
#include <sstream>
#include <string>

using cortexnet::diagnostics::StructuredLogger;
using cortexnet::diagnostics::log_event;

int main() {
    auto& logger = StructuredLogger::instance();
    std::ostringstream sink;
    logger.set_sink(&sink);
    logger.set_enabled(true);
    assert(logger.minimum_level() == StructuredLogger::Level::Info);

    log_event(StructuredLogger::Level::Info, "network.starting", {{"node", "n1"}, {"note", "say \"hi\"\n"}});
    const auto line = sink.str();
    assert(line.front() == '{');
    assert(line.back() == '\n');
    assert(line.find("\"level\":\"info\"") != std::string::npos);
    assert(line.find("\"event\":\"network.starting\"") != std::string::npos);
    assert(line.find("\"node\":\"n1\"") != std::string::npos);
    assert(line.find("say \\\"hi\\\"\\n") != std::string::npos);
    assert(line.find("\"ts\":\"") != std::string::npos);

    // Below the threshold nothing is written.
    sink.str({});
    log_event(StructuredLogger::Level::Debug, "gossip.duplicate");
    assert(sink.str().empty());

    logger.set_minimum_level(StructuredLogger::Level::Debug);
    log_event(StructuredLogger::Level::Debug, "gossip.duplicate");
    assert(sink.str().find("\"fields\"") == std::string::npos);
    assert(sink.str().find("\"level\":\"debug\"") != std::string::npos);

    sink.str({});
    logger.set_enabled(false);
    log_event(StructuredLogger::Level::Error, "consensus.rejected");
    assert(sink.str().empty());
    assert(!logger.enabled());

    sink.str({});
    logger.set_enabled(true);
    log_event(StructuredLogger::Level::Warning, "ctl", {{"raw", std::string(1, '\x01')}});
    assert(sink.str().find("\\u0001") != std::string::npos);

    assert(StructuredLogger::level_to_string(StructuredLogger::Level::Warning) == "warning");

    logger.set_minimum_level(StructuredLogger::Level::Info);
    logger.set_sink(nullptr);
    return 0;
}
