/**
 * @file test_sampler.cpp
 * @brief Unit tests for the sampling decision.
 */

#include "client/sampler.hpp"

#include "support/recording_sink.hpp"

#include <gtest/gtest.h>

using namespace statsd_emitter;
using statsd_emitter::test_support::fixed_uniform;

TEST(SamplerTest, FullRateAlwaysEmitsWithoutAnnotation) {
    Sampler sampler(fixed_uniform(0.999));
    EXPECT_EQ(sampler.decide(1.0), SampleDecision::Emit);
    EXPECT_EQ(sampler.decide(2.5), SampleDecision::Emit);
}

TEST(SamplerTest, BelowRateEmitsSampled) {
    Sampler sampler(fixed_uniform(0.3));
    EXPECT_EQ(sampler.decide(0.5), SampleDecision::EmitSampled);
}

TEST(SamplerTest, AtOrAboveRateDrops) {
    EXPECT_EQ(Sampler(fixed_uniform(0.7)).decide(0.5), SampleDecision::Drop);
    EXPECT_EQ(Sampler(fixed_uniform(0.5)).decide(0.5), SampleDecision::Drop);
}

TEST(SamplerTest, NonPositiveRateDrops) {
    Sampler sampler(fixed_uniform(0.0));
    EXPECT_EQ(sampler.decide(0.0), SampleDecision::Drop);
    EXPECT_EQ(sampler.decide(-1.0), SampleDecision::Drop);
}

TEST(SamplerTest, EmptySourceFallsBackToProcessUniform) {
    Sampler sampler(UniformSource{});
    EXPECT_EQ(sampler.decide(1.0), SampleDecision::Emit);
    EXPECT_NE(sampler.decide(0.5), SampleDecision::Emit);
}

TEST(SamplerTest, ProcessUniformRange) {
    for (int i = 0; i < 10000; ++i) {
        double u = process_uniform();
        ASSERT_GE(u, 0.0);
        ASSERT_LT(u, 1.0);
    }
}

TEST(SamplerTest, EmpiricalFractionConvergesToRate) {
    Sampler sampler;
    constexpr int N = 200000;
    for (double rate : {0.1, 0.25, 0.5, 0.9}) {
        int emitted = 0;
        for (int i = 0; i < N; ++i) {
            auto d = sampler.decide(rate);
            ASSERT_NE(d, SampleDecision::Emit);
            if (d == SampleDecision::EmitSampled) ++emitted;
        }
        EXPECT_NEAR(static_cast<double>(emitted) / N, rate, 0.01) << "rate " << rate;
    }
}
