/**
 * @file test_generator.cpp
 * @brief Unit tests for WorkloadGenerator and the fault injectors.
 */

#include "workload/generator.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <set>

using namespace async_responder;
using namespace std::chrono_literals;

static const TaskConfig SEEDED{
    .min_checkpoints = 5,
    .max_checkpoints = 11,
    .checkpoint_ms = 1000,
    .fault_probability = 0.5,
    .seed = 42
};

// ─── Durations ───────────────────────────────

TEST(GeneratorTest, DurationWithinCheckpointRange) {
    WorkloadGenerator gen(SEEDED, std::make_shared<FixedFaultInjector>(false));
    for (int i = 0; i < 500; ++i) {
        auto run = gen.next("req-" + std::to_string(i));
        EXPECT_GE(run.duration, 5000ms);
        EXPECT_LE(run.duration, 11000ms);
        EXPECT_EQ(run.duration.count() % 1000, 0);
        EXPECT_EQ(run.checkpoint, 1000ms);
    }
}

TEST(GeneratorTest, CoversWholeRange) {
    WorkloadGenerator gen(SEEDED, nullptr);
    std::set<int64_t> seen;
    for (int i = 0; i < 2000; ++i) seen.insert(gen.next("r").duration.count());
    EXPECT_EQ(seen.size(), 7u);
    EXPECT_EQ(*seen.begin(), 5000);
    EXPECT_EQ(*seen.rbegin(), 11000);
}

TEST(GeneratorTest, FixedRange) {
    TaskConfig config = SEEDED;
    config.min_checkpoints = 3;
    config.max_checkpoints = 3;
    config.checkpoint_ms = 20;
    WorkloadGenerator gen(config, nullptr);
    EXPECT_EQ(gen.next("r").duration, 60ms);
    EXPECT_EQ(gen.checkpoint(), 20ms);
}

TEST(GeneratorTest, SameSeedSameSequence) {
    WorkloadGenerator a(SEEDED, nullptr);
    WorkloadGenerator b(SEEDED, nullptr);
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(a.next("r").duration, b.next("r").duration);
    }
}

TEST(GeneratorTest, CarriesRequestId) {
    WorkloadGenerator gen(SEEDED, nullptr);
    EXPECT_EQ(gen.next("req-77").request_id, "req-77");
}

// ─── Fault injection ─────────────────────────

TEST(GeneratorTest, FixedInjectorControlsFaults) {
    WorkloadGenerator always(SEEDED, std::make_shared<FixedFaultInjector>(true));
    WorkloadGenerator never(SEEDED, std::make_shared<FixedFaultInjector>(false));
    for (int i = 0; i < 20; ++i) {
        EXPECT_TRUE(always.next("r").inject_fault);
        EXPECT_FALSE(never.next("r").inject_fault);
    }
}

TEST(GeneratorTest, NoInjectorMeansNoFaults) {
    WorkloadGenerator gen(SEEDED, nullptr);
    EXPECT_FALSE(gen.next("r").inject_fault);
}

TEST(FaultInjectorTest, ProbabilityExtremes) {
    RandomFaultInjector never(0.0, 7);
    RandomFaultInjector always(1.0, 7);
    for (int i = 0; i < 100; ++i) {
        EXPECT_FALSE(never.should_fail("r"));
        EXPECT_TRUE(always.should_fail("r"));
    }
}

TEST(FaultInjectorTest, RoughlyHalfAtOneHalf) {
    RandomFaultInjector injector(0.5, 99);
    int failures = 0;
    for (int i = 0; i < 4000; ++i) {
        if (injector.should_fail("r")) ++failures;
    }
    EXPECT_GT(failures, 1700);
    EXPECT_LT(failures, 2300);
}
