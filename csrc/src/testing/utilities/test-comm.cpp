// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <mutex>
#include <set>
#include <stdexcept>
#include <vector>

#include "utilities/comm.h"

TEST_CASE("Communicator: single worker", "[comm]") {
    auto comm = Communicator::make_single();
    CHECK(comm->rank() == 0);
    CHECK(comm->world_size() == 1);
    CHECK(comm->is_root());
    comm->barrier();
}

TEST_CASE("Communicator: invalid ranks are rejected", "[comm]") {
    CHECK_THROWS_AS(Communicator::launch_communicators(0, [](Communicator&) {}), std::invalid_argument);
}

TEST_CASE("Communicator: every worker gets a distinct rank", "[comm]") {
    std::mutex mutex;
    std::set<int> ranks;
    std::set<int> world_sizes;
    std::atomic<int> roots{0};
    Communicator::run_communicators(4, [&](Communicator& comm) {
        if (comm.is_root()) ++roots;
        std::lock_guard<std::mutex> lock(mutex);
        ranks.insert(comm.rank());
        world_sizes.insert(comm.world_size());
    });
    CHECK(ranks == std::set<int>{0, 1, 2, 3});
    CHECK(world_sizes == std::set<int>{4});
    CHECK(roots == 1);
}

TEST_CASE("Communicator: barrier orders phases", "[comm]") {
    constexpr int workers = 3;
    std::atomic<int> arrived{0};
    std::atomic<int> violations{0};
    Communicator::run_communicators(workers, [&](Communicator& comm) {
        for (int phase = 1; phase <= 5; ++phase) {
            ++arrived;
            comm.barrier();
            if (arrived.load() < phase * workers) ++violations;
            comm.barrier();
        }
    });
    CHECK(arrived == 5 * workers);
    CHECK(violations == 0);
}

TEST_CASE("Communicator: worker exception is rethrown on join", "[comm]") {
    auto pack = Communicator::launch_communicators(2, [](Communicator& comm) {
        if (comm.rank() == 1) {
            throw std::runtime_error("worker failed");
        }
        // aborted here once worker 1 has failed
        comm.barrier();
    });
    CHECK_THROWS_AS(pack->join(), std::runtime_error);
}

TEST_CASE("Communicator: a failed worker stops the others at their next barrier", "[comm]") {
    std::atomic<int> passed{0};
    std::atomic<bool> aborted{false};
    auto pack = Communicator::launch_communicators(2, [&](Communicator& comm) {
        if (comm.rank() == 0) {
            throw std::runtime_error("checkpoint write failed");
        }
        try {
            for (int step = 0; step < 1000; ++step) {
                comm.barrier();
                ++passed;
            }
        } catch (const WorkerAbortedError&) {
            aborted = true;
            throw;
        }
    });
    // the original failure wins over the abort it caused
    CHECK_THROWS_WITH(pack->join(), "checkpoint write failed");
    CHECK(aborted);
    CHECK(passed == 0);
}

TEST_CASE("Communicator: the failing rank is reported even if it is not the first", "[comm]") {
    CHECK_THROWS_WITH(Communicator::run_communicators(3, [](Communicator& comm) {
        if (comm.rank() == 2) {
            throw std::runtime_error("render failed");
        }
        for (int step = 0; step < 100; ++step) {
            comm.barrier();
        }
    }), "render failed");
}
