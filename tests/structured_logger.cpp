#include "vouchnet/log/StructuredLogger.hpp"

#include <cassert>
#include <sstream>
#include <string>

using vouchnet::log::StructuredLogger;

int main() {
    auto& logger = StructuredLogger::instance();
    std::ostringstream sink;
    logger.set_sink(&sink);
    logger.set_enabled(true);
    logger.set_minimum_level(StructuredLogger::Level::Info);

    logger.info("trust.delta_applied", {{"epoch", "7"}, {"note", "quote\" and\nnewline"}});
    const auto line = sink.str();
    assert(line.rfind("{\"ts\":\"", 0) == 0);
    assert(line.find("\"level\":\"info\"") != std::string::npos);
    assert(line.find("\"event\":\"trust.delta_applied\"") != std::string::npos);
    assert(line.find("\"epoch\":\"7\"") != std::string::npos);
    assert(line.find("quote\\\" and\\nnewline") != std::string::npos);
    assert(line.back() == '\n');

    sink.str({});
    logger.warning("registry.peer_stale");
    assert(sink.str().find("\"level\":\"warning\"") != std::string::npos);
    assert(sink.str().find("\"fields\"") == std::string::npos);

    sink.str({});
    logger.set_minimum_level(StructuredLogger::Level::Error);
    logger.info("suppressed");
    logger.warning("suppressed");
    assert(sink.str().empty());
    logger.error("recovery.incomplete", {{"missing", "2"}});
    assert(sink.str().find("\"level\":\"error\"") != std::string::npos);

    sink.str({});
    logger.set_minimum_level(StructuredLogger::Level::Info);
    logger.set_enabled(false);
    assert(!logger.enabled());
    logger.error("ignored");
    assert(sink.str().empty());

    logger.set_enabled(true);
    logger.set_sink(nullptr);
    return 0;
}
