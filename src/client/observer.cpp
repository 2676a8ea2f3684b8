/**
 * @file observer.cpp
 * @brief LoggingObserver implementation.
 */

#include "client/observer.hpp"

#include <format>

namespace statsd_emitter {

void LoggingObserver::on_send(std::string_view line, const MetricRequest& request) {
    if (!logger_.enabled(LogLevel::Debug)) return;
    logger_.debug(std::format("send {} kind={} rate={}", line, to_string(request.kind), request.rate));
}

}  // namespace statsd_emitter
