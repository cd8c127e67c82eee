// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include <catch2/catch_test_macros.hpp>

#include <set>
#include <stdexcept>
#include <vector>

#include "training/timesteps.h"

TEST_CASE("TimestepScheduler: debug cadence 20 overrides exactly steps 20 and 40", "[timesteps]") {
    TimestepScheduler scheduler(20, 0, 1234);
    std::set<long> overridden;
    for (long step = 1; step <= 40; ++step) {
        std::vector<float> t = scheduler.sample(step, 4);
        REQUIRE(t.size() == 4);
        bool all_fixed = true;
        for (float v : t) all_fixed = all_fixed && v == TimestepScheduler::FixedValue;
        if (all_fixed) overridden.insert(step);
    }
    CHECK(overridden == std::set<long>{20, 40});
}

TEST_CASE("TimestepScheduler: either cadence triggers the fixed value", "[timesteps]") {
    TimestepScheduler scheduler(20, 30, 7);
    CHECK(scheduler.is_override_step(20));
    CHECK(scheduler.is_override_step(30));
    CHECK(scheduler.is_override_step(60));
    CHECK_FALSE(scheduler.is_override_step(25));
    CHECK_FALSE(scheduler.is_override_step(1));

    for (float v : scheduler.sample(30, 3)) {
        CHECK(v == 0.7f);
    }
}

TEST_CASE("TimestepScheduler: disabled cadences never trigger", "[timesteps]") {
    TimestepScheduler scheduler(0, -5, 7);
    for (long step = 1; step <= 100; ++step) {
        REQUIRE_FALSE(scheduler.is_override_step(step));
    }
}

TEST_CASE("TimestepScheduler: draws are in [0, 1) and reproducible from the seed", "[timesteps]") {
    TimestepScheduler a(20, 200, 99);
    TimestepScheduler b(20, 200, 99);
    for (long step = 1; step <= 50; ++step) {
        auto ta = a.sample(step, 8);
        auto tb = b.sample(step, 8);
        REQUIRE(ta == tb);
        for (float v : ta) {
            REQUIRE(v >= 0.f);
            REQUIRE(v < 1.f);
        }
    }
}

TEST_CASE("TimestepScheduler: random sequence does not depend on the cadences", "[timesteps]") {
    TimestepScheduler with_override(5, 0, 3);
    TimestepScheduler without_override(0, 0, 3);
    for (long step = 1; step <= 12; ++step) {
        auto a = with_override.sample(step, 2);
        auto b = without_override.sample(step, 2);
        if (step % 5 != 0) {
            REQUIRE(a == b);
        }
    }
}

TEST_CASE("TimestepScheduler: generator state survives a save and restore", "[timesteps]") {
    TimestepScheduler original(0, 0, 42);
    for (long step = 1; step <= 10; ++step) original.sample(step, 3);
    std::string state = original.rng_state();

    TimestepScheduler restored(0, 0, 1);
    restored.set_rng_state(state);
    for (long step = 11; step <= 20; ++step) {
        REQUIRE(original.sample(step, 3) == restored.sample(step, 3));
    }

    CHECK_THROWS_AS(restored.set_rng_state("not a generator"), std::runtime_error);
}
