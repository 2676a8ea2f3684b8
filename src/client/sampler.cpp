/**
 * @file sampler.cpp
 * @brief Sampler implementation.
 */

#include "client/sampler.hpp"

#include <random>

namespace statsd_emitter {

double process_uniform() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    thread_local std::uniform_real_distribution<double> dist{0.0, 1.0};
    return dist(engine);
}

Sampler::Sampler() : source_(process_uniform) {}

Sampler::Sampler(UniformSource source) : source_(std::move(source)) {
    if (!source_) source_ = process_uniform;
}

SampleDecision Sampler::decide(double rate) const {
    if (rate >= 1.0) return SampleDecision::Emit;
    if (source_() < rate) return SampleDecision::EmitSampled;
    return SampleDecision::Drop;
}

}  // namespace statsd_emitter
