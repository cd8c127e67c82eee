// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include "utilities/worker_pool.h"

TEST_CASE("WorkerPool: strategies parse case-insensitively", "[worker-pool]") {
    CHECK(worker_strategy_from_str("threads") == EWorkerStrategy::THREADS);
    CHECK(worker_strategy_from_str("INLINE") == EWorkerStrategy::INLINE);
    CHECK_THROWS_AS(worker_strategy_from_str("processes"), std::invalid_argument);
    CHECK(std::string(worker_strategy_to_str(EWorkerStrategy::THREADS)) == "threads");
    CHECK_THROWS_AS(WorkerPool(EWorkerStrategy::THREADS, 0), std::invalid_argument);
}

TEST_CASE("WorkerPool: every task runs exactly once", "[worker-pool]") {
    auto strategy = GENERATE(EWorkerStrategy::INLINE, EWorkerStrategy::THREADS);
    WorkerPool pool(strategy, 4);
    std::vector<std::atomic<int>> counts(37);
    pool.run(37, [&](int task) { ++counts[task]; });
    for (auto& c : counts) {
        CHECK(c.load() == 1);
    }
}

TEST_CASE("WorkerPool: concurrency stays within the worker limit", "[worker-pool]") {
    WorkerPool pool(EWorkerStrategy::THREADS, 3);
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    pool.run(12, [&](int) {
        int now = ++active;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        --active;
    });
    CHECK(peak.load() <= 3);
    CHECK(peak.load() >= 1);
}

TEST_CASE("WorkerPool: a failing task does not stop the others", "[worker-pool]") {
    auto strategy = GENERATE(EWorkerStrategy::INLINE, EWorkerStrategy::THREADS);
    WorkerPool pool(strategy, 4);
    std::atomic<int> done{0};
    CHECK_THROWS_AS(pool.run(10, [&](int task) {
        if (task == 3) throw std::runtime_error("task 3 failed");
        ++done;
    }), std::runtime_error);
    CHECK(done == 9);
}
