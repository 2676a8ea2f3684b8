/**
 * @file sampler.hpp
 * @brief Per-call emit/drop decision for sampled metrics.
 *
 * A rate r >= 1 always emits without annotation. Below 1 a uniform draw
 * u in [0, 1) keeps the event iff u < r, and the kept line carries "|@r"
 * so the collector can scale the count back up. A drop is a successful
 * no-op, not an error. Rates are not validated, so r <= 0 drops every call.
 */

#pragma once

#include <cstdint>
#include <functional>

namespace statsd_emitter {

enum class SampleDecision : uint8_t {
    Drop,
    Emit,           ///< Full rate, no annotation
    EmitSampled     ///< Survived a rate < 1, annotate with "|@rate"
};

/// Returns a uniform value in [0, 1).
using UniformSource = std::function<double()>;

/**
 * @brief Process-wide uniform source.
 *
 * Each thread draws from its own engine, seeded once from
 * std::random_device, so callers never contend on a lock here.
 */
double process_uniform();

class Sampler {
public:
    Sampler();
    explicit Sampler(UniformSource source);

    [[nodiscard]] SampleDecision decide(double rate) const;

private:
    UniformSource source_;
};

}  // namespace statsd_emitter
