// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Tests for checkpoint save/resume.
// Validates that the complete training state survives a round trip and that
// only fully written checkpoints are visible to a resume.

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <cmath>
#include <limits>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "runtime/optimizers/adamw.h"
#include "training/checkpoint.h"
#include "training/loss_tracker.h"
#include "training/timesteps.h"
#include "utilities/comm.h"
#include "../utilities/test_utils.h"

using testing_utils::TempDir;
namespace fs = std::filesystem;

namespace {

// Parameters, gradients and an optimizer that has taken a few steps.
struct TrainedState {
    TensorStore Params;
    TensorStore Grads;
    optimizers::AdamWOptimizer Optimizer;

    TrainedState() : Params(make_store(1)), Grads(make_store(2)), Optimizer(Params, Grads, optimizers::AdamWConfig{}) {
        for (int i = 0; i < 3; ++i) {
            Optimizer.step();
        }
    }

    static TensorStore make_store(std::uint64_t seed) {
        TensorStore store;
        Tensor w = store.add("image.weight", ETensorDType::FP32, {4, 4});
        testing_utils::fill_tensor(w, testing_utils::uniform_host(16, -1.f, 1.f, seed));
        Tensor b = store.add("image.bias", ETensorDType::FP32, {4});
        testing_utils::fill_tensor(b, testing_utils::uniform_host(4, -1.f, 1.f, seed + 10));
        return store;
    }
};

TrainingState make_state(TrainedState& trained, long step, int epoch) {
    LossTracker tracker(5);
    for (int i = 0; i < 7; ++i) {
        tracker.record("text", 1.f + 0.1f * i);
        tracker.record("diffusion", 0.5f - 0.01f * i);
    }
    TimestepScheduler timesteps(20, 200, 42);
    timesteps.sample(1, 4);

    TrainingState state;
    state.Epoch = epoch;
    state.Step = step;
    state.BatchInEpoch = 3;
    state.LastLoss = 1.2345f;
    state.ModelParameters = TensorStore::copy_of(trained.Params);
    state.Optimizer = trained.Optimizer.save_state();
    state.SchedulerStep = step;
    state.LossWindows = tracker.state();
    state.TimestepRng = timesteps.rng_state();
    return state;
}

bool windows_equal(const std::map<std::string, LossWindowState>& a, const std::map<std::string, LossWindowState>& b) {
    if (a.size() != b.size()) return false;
    for (const auto& [name, w] : a) {
        auto found = b.find(name);
        if (found == b.end()) return false;
        if (w.Capacity != found->second.Capacity || w.Index != found->second.Index || w.Values != found->second.Values) {
            return false;
        }
    }
    return true;
}

} // namespace

TEST_CASE("CheckpointManager: save and resume reproduce the state", "[checkpoint]") {
    TempDir dir("checkpoint");
    auto comm = Communicator::make_single();
    CheckpointManager manager(dir.str(), *comm);

    TrainedState trained;
    TrainingState saved = make_state(trained, 350, 2);
    std::string path = manager.save(saved, saved.LastLoss);
    CHECK(path == get_checkpoint_path(dir.str(), 350));
    CHECK(fs::is_directory(path));
    CHECK_FALSE(fs::exists(path + ".tmp"));

    TrainingState restored = manager.resume();
    CHECK(restored.Epoch == 2);
    CHECK(restored.Step == 350);
    CHECK(restored.BatchInEpoch == 3);
    CHECK(restored.LastLoss == 1.2345f);
    CHECK(restored.SchedulerStep == 350);
    CHECK(restored.TimestepRng == saved.TimestepRng);
    CHECK(windows_equal(restored.LossWindows, saved.LossWindows));
    CHECK(containers_equal(restored.ModelParameters, saved.ModelParameters));
    CHECK(containers_equal(restored.Optimizer.Tensors, saved.Optimizer.Tensors));
    CHECK(restored.Optimizer.Scalars == saved.Optimizer.Scalars);
}

TEST_CASE("CheckpointManager: restored optimizer continues identically", "[checkpoint]") {
    TempDir dir("checkpoint");
    auto comm = Communicator::make_single();
    CheckpointManager manager(dir.str(), *comm);

    TrainedState original;
    TrainingState saved = make_state(original, 10, 0);
    manager.save(saved, 0.f);

    TrainedState fresh;
    TrainingState restored = manager.load(10);
    copy_tensors(restored.ModelParameters, fresh.Params);
    fresh.Optimizer.load_state(restored.Optimizer);
    CHECK(fresh.Optimizer.num_steps() == original.Optimizer.num_steps());

    original.Optimizer.step();
    fresh.Optimizer.step();
    CHECK(containers_equal(original.Params, fresh.Params));
}

TEST_CASE("CheckpointManager: non-finite losses survive a round trip", "[checkpoint]") {
    TempDir dir("checkpoint");
    auto comm = Communicator::make_single();
    CheckpointManager manager(dir.str(), *comm);

    TrainedState trained;
    TrainingState saved = make_state(trained, 200, 1);
    LossTracker tracker(4);
    tracker.record("text", 2.5f);
    tracker.record("text", std::numeric_limits<float>::infinity());
    tracker.record("diffusion", NAN);
    saved.LossWindows = tracker.state();
    saved.LastLoss = NAN;
    manager.save(saved, saved.LastLoss);

    TrainingState restored = manager.resume();
    CHECK(std::isnan(restored.LastLoss));
    REQUIRE(restored.LossWindows.at("text").Values.size() == 2);
    CHECK(restored.LossWindows.at("text").Values[0] == 2.5f);
    CHECK(std::isinf(restored.LossWindows.at("text").Values[1]));
    REQUIRE(restored.LossWindows.at("diffusion").Values.size() == 1);
    CHECK(std::isnan(restored.LossWindows.at("diffusion").Values[0]));

    LossTracker adopted(4);
    adopted.reset(restored.LossWindows);
    CHECK(adopted.window("text").size() == 2);
}

TEST_CASE("CheckpointManager: resume without a checkpoint fails", "[checkpoint]") {
    TempDir dir("checkpoint");
    auto comm = Communicator::make_single();

    CheckpointManager empty(dir.str(), *comm);
    CHECK_FALSE(empty.has_checkpoint());
    CHECK_THROWS_AS(empty.resume(), CheckpointNotFoundError);
    CHECK_THROWS_AS(empty.load(5), CheckpointNotFoundError);

    CheckpointManager missing(dir / "does_not_exist", *comm);
    CHECK_THROWS_AS(missing.resume(), CheckpointNotFoundError);
}

TEST_CASE("CheckpointManager: the newest complete checkpoint wins", "[checkpoint]") {
    TempDir dir("checkpoint");
    auto comm = Communicator::make_single();
    CheckpointManager manager(dir.str(), *comm);
    TrainedState trained;

    for (long step : {200L, 400L, 600L}) {
        TrainingState state = make_state(trained, step, static_cast<int>(step / 200));
        manager.save(state, 1.f);
    }
    // leftovers of an interrupted save and unrelated directories are ignored
    fs::create_directories(dir / "step_00000800.tmp");
    fs::create_directories(dir / "step_abc");
    fs::create_directories(dir / "logs");

    CHECK(get_all_checkpoints(dir.str()) == std::vector<long>{200, 400, 600});
    CHECK(find_latest_checkpoint(dir.str()) == 600);
    CHECK(manager.resume().Step == 600);
}

TEST_CASE("CheckpointManager: saving the same step twice replaces it", "[checkpoint]") {
    TempDir dir("checkpoint");
    auto comm = Communicator::make_single();
    CheckpointManager manager(dir.str(), *comm);
    TrainedState trained;

    TrainingState first = make_state(trained, 100, 1);
    manager.save(first, 1.f);
    TrainingState second = make_state(trained, 100, 4);
    manager.save(second, 2.f);

    TrainingState restored = manager.resume();
    CHECK(restored.Epoch == 4);
    CHECK(restored.LastLoss == 2.f);
}

TEST_CASE("clean_old_checkpoints keeps the newest and the major ones", "[checkpoint]") {
    TempDir dir("checkpoint");
    for (long step : {100L, 200L, 300L, 400L, 500L}) {
        fs::create_directories(get_checkpoint_path(dir.str(), step));
    }

    SECTION("negative keeps all") {
        CHECK(clean_old_checkpoints(dir.str(), -1, -1).empty());
        CHECK(get_all_checkpoints(dir.str()).size() == 5);
    }

    SECTION("keep two") {
        auto removed = clean_old_checkpoints(dir.str(), 2, -1);
        CHECK(removed.size() == 3);
        CHECK(get_all_checkpoints(dir.str()) == std::vector<long>{400, 500});
    }

    SECTION("keep one plus majors") {
        clean_old_checkpoints(dir.str(), 1, 200);
        CHECK(get_all_checkpoints(dir.str()) == std::vector<long>{200, 400, 500});
    }
}

TEST_CASE("CheckpointManager: only rank 0 writes, all ranks wait", "[checkpoint]") {
    TempDir dir("checkpoint");
    std::atomic<int> saw_checkpoint{0};
    Communicator::run_communicators(3, [&](Communicator& comm) {
        CheckpointManager manager(dir.str(), comm);
        TrainedState trained;
        TrainingState state = make_state(trained, 50, 0);
        manager.save(state, 0.5f);
        if (fs::is_directory(get_checkpoint_path(dir.str(), 50))) {
            ++saw_checkpoint;
        }
    });
    CHECK(saw_checkpoint == 3);
    CHECK(get_all_checkpoints(dir.str()) == std::vector<long>{50});

    // a single worker cannot continue a run of three
    auto single = Communicator::make_single();
    CheckpointManager manager(dir.str(), *single);
    CHECK_THROWS_AS(manager.resume(), std::runtime_error);
}
