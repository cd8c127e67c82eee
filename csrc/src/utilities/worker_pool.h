// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRANSFUSE_SRC_UTILITIES_WORKER_POOL_H
#define TRANSFUSE_SRC_UTILITIES_WORKER_POOL_H

#include <functional>
#include <string_view>

enum class EWorkerStrategy {
    INLINE,     //!< run every task on the calling thread
    THREADS     //!< run tasks on up to `max_workers` threads
};

EWorkerStrategy worker_strategy_from_str(std::string_view name);
const char* worker_strategy_to_str(EWorkerStrategy strategy);

/**
 * @brief Bounded pool for independent tasks, indexed 0..n-1.
 *
 * A failing task does not stop the remaining ones; once all tasks have ended the
 * first captured exception (by task index) is rethrown from run().
 */
class WorkerPool {
public:
    WorkerPool(EWorkerStrategy strategy, int max_workers);

    void run(int num_tasks, const std::function<void(int task)>& task) const;

    [[nodiscard]] EWorkerStrategy strategy() const { return mStrategy; }
    [[nodiscard]] int max_workers() const { return mMaxWorkers; }

private:
    EWorkerStrategy mStrategy;
    int mMaxWorkers;
};

#endif //TRANSFUSE_SRC_UTILITIES_WORKER_POOL_H
