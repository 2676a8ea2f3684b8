/**
 * @file observer.hpp
 * @brief Optional hook that sees every line about to be buffered.
 *
 * Diagnostic only: observers cannot alter or veto a line. Called after
 * sampling and before the buffer lock is taken, so an observer may run
 * concurrently with itself.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <string_view>

namespace statsd_emitter {

class SendObserver {
public:
    virtual ~SendObserver() = default;

    virtual void on_send(std::string_view line, const MetricRequest& request) = 0;
};

/**
 * @brief Default observer; does nothing.
 */
class NullObserver : public SendObserver {
public:
    void on_send(std::string_view /*line*/, const MetricRequest& /*request*/) override {}
};

/**
 * @brief Writes each line to a Logger at debug level.
 *
 * The Logger must outlive the observer.
 */
class LoggingObserver : public SendObserver {
public:
    explicit LoggingObserver(Logger& logger) : logger_(logger) {}

    void on_send(std::string_view line, const MetricRequest& request) override;

private:
    Logger& logger_;
};

}  // namespace statsd_emitter
