/**
 * @file types.hpp
 * @brief Vocabulary types shared by the formatter, sampler and client.
 *
 * A metric call is reduced to a MetricRequest (kind, value, rate) before it
 * reaches the single send path. The request is transient: it is rendered to
 * a line and never stored.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace statsd_emitter {

using SteadyTime = std::chrono::steady_clock::time_point;
using Milliseconds = std::chrono::milliseconds;

// ─────────────────────────────────────────────
// Metric Kind
// ─────────────────────────────────────────────

enum class MetricKind : uint8_t {
    Counter,
    Timing,
    Gauge,
    GaugeIncrement,
    GaugeDecrement,
    Set,
    Annotation
};

/**
 * @brief Wire type tag written after the '|' separator.
 *
 * Histograms and durations share the timing tag.
 */
[[nodiscard]] constexpr std::string_view type_tag(MetricKind kind) noexcept {
    switch (kind) {
        case MetricKind::Counter:        return "c";
        case MetricKind::Timing:         return "ms";
        case MetricKind::Gauge:
        case MetricKind::GaugeIncrement:
        case MetricKind::GaugeDecrement: return "g";
        case MetricKind::Set:            return "s";
        case MetricKind::Annotation:     return "a";
    }
    return "";
}

[[nodiscard]] constexpr std::string_view to_string(MetricKind kind) noexcept {
    switch (kind) {
        case MetricKind::Counter:        return "counter";
        case MetricKind::Timing:         return "timing";
        case MetricKind::Gauge:          return "gauge";
        case MetricKind::GaugeIncrement: return "gauge_increment";
        case MetricKind::GaugeDecrement: return "gauge_decrement";
        case MetricKind::Set:            return "set";
        case MetricKind::Annotation:     return "annotation";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Metric Request
// ─────────────────────────────────────────────

/// Integer for numeric metrics, text for annotations.
using MetricValue = std::variant<int64_t, std::string>;

/**
 * @brief One metric call, minus the stat name.
 *
 * The rate is not validated: values >= 1 always emit, anything below is
 * treated as an emission probability.
 */
struct MetricRequest {
    MetricKind kind{MetricKind::Counter};
    MetricValue value{int64_t{0}};
    double rate{1.0};
};

// ─────────────────────────────────────────────
// Overflow Policy
// ─────────────────────────────────────────────

/**
 * @brief What the packet buffer does when the flush forced by an overflowing
 *        append fails.
 */
enum class OverflowPolicy : uint8_t {
    Swallow,    ///< Drop the unsent packet and keep buffering
    Propagate   ///< Return the flush error; the new line is not buffered
};

[[nodiscard]] constexpr std::string_view to_string(OverflowPolicy policy) noexcept {
    switch (policy) {
        case OverflowPolicy::Swallow:   return "swallow";
        case OverflowPolicy::Propagate: return "propagate";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<OverflowPolicy> parse_overflow_policy(
    std::string_view name) noexcept {
    if (name == "swallow") return OverflowPolicy::Swallow;
    if (name == "propagate") return OverflowPolicy::Propagate;
    return std::nullopt;
}

}  // namespace statsd_emitter
