// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "worker_pool.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <stdexcept>
#include <thread>
#include <vector>

#include <fmt/core.h>

#include "utils.h"

EWorkerStrategy worker_strategy_from_str(std::string_view name) {
    if (iequals(name, "inline")) return EWorkerStrategy::INLINE;
    if (iequals(name, "threads")) return EWorkerStrategy::THREADS;
    throw std::invalid_argument(fmt::format("Unknown worker strategy `{}`", name));
}

const char* worker_strategy_to_str(EWorkerStrategy strategy) {
    switch (strategy) {
        case EWorkerStrategy::INLINE: return "inline";
        case EWorkerStrategy::THREADS: return "threads";
    }
    throw std::logic_error("Invalid worker strategy");
}

WorkerPool::WorkerPool(EWorkerStrategy strategy, int max_workers) : mStrategy(strategy), mMaxWorkers(max_workers) {
    if (max_workers <= 0) {
        throw std::invalid_argument(fmt::format("Invalid number of workers: {}", max_workers));
    }
}

void WorkerPool::run(int num_tasks, const std::function<void(int task)>& task) const {
    if (num_tasks <= 0) return;

    std::vector<std::exception_ptr> errors(num_tasks);
    auto run_one = [&](int index) {
        try {
            task(index);
        } catch (...) {
            errors[index] = std::current_exception();
        }
    };

    if (mStrategy == EWorkerStrategy::INLINE || mMaxWorkers == 1 || num_tasks == 1) {
        for (int i = 0; i < num_tasks; ++i) {
            run_one(i);
        }
    } else {
        std::atomic<int> next{0};
        int n_threads = std::min(mMaxWorkers, num_tasks);
        std::vector<std::jthread> threads;
        threads.reserve(n_threads);
        for (int t = 0; t < n_threads; ++t) {
            threads.emplace_back([&]() {
                for (int i = next.fetch_add(1); i < num_tasks; i = next.fetch_add(1)) {
                    run_one(i);
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
    }

    for (auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
}
