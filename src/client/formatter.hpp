/**
 * @file formatter.hpp
 * @brief Renders a metric request as one statsd protocol line.
 *
 * Line layout:
 *   <prefix><stat>:<value>|<type>[|@<rate>]
 *
 * No trailing newline; the packet buffer inserts separators.
 * All functions here are pure.
 */

#pragma once

#include "core/types.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>

namespace statsd_emitter {

/**
 * @brief Value field of the line, including the '+'/'-' of gauge deltas.
 */
[[nodiscard]] std::string render_value(const MetricRequest& request);

/**
 * @brief Compact general rendering of a sample rate ("0.5", "1e-05").
 */
[[nodiscard]] std::string format_rate(double rate);

/**
 * @brief Build the full line.
 *
 * @param prefix    Prepended verbatim to @p stat.
 * @param with_rate Append "|@<rate>"; set by the sampler when the event
 *                  survived a rate below 1.
 */
[[nodiscard]] std::string format_line(std::string_view prefix,
                                      std::string_view stat,
                                      const MetricRequest& request,
                                      bool with_rate);

/**
 * @brief Whole milliseconds in @p d.
 *
 * Goes through floating-point seconds first so that coarse units
 * (minutes, seconds) and fine ones (nanoseconds) round the same way.
 */
template <typename Rep, typename Period>
[[nodiscard]] int64_t to_milliseconds(std::chrono::duration<Rep, Period> d) {
    const double seconds = std::chrono::duration<double>(d).count();
    return static_cast<int64_t>(std::llround(seconds * 1000.0));
}

}  // namespace statsd_emitter
