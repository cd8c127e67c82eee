// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "trainer.h"

#include <chrono>
#include <stdexcept>
#include <utility>

#include <fmt/core.h>

#include "diagnostics.h"
#include "latent_cache.h"
#include "logging.h"
#include "loss_tracker.h"
#include "patchify.h"
#include "schedule.h"
#include "timesteps.h"
#include "utilities/comm.h"
#include "utilities/utils.h"

TrainingLoop::TrainingLoop(TrainingComponents components, TrainingOptions options) :
    mC(components), mOptions(options) {
    if (!mC.Model || !mC.Optimizer || !mC.Scheduler || !mC.Timesteps || !mC.Losses || !mC.Dataset ||
        !mC.Checkpoints || !mC.Logger || !mC.Comm) {
        throw std::invalid_argument("TrainingLoop: missing component");
    }
    if (mOptions.CacheBatchSize <= 0 || mOptions.PatchSize <= 0) {
        throw std::invalid_argument(fmt::format("TrainingLoop: invalid cache batch size {} or patch size {}",
                                                mOptions.CacheBatchSize, mOptions.PatchSize));
    }

    const int groups = mC.Dataset->size() / mOptions.CacheBatchSize;
    mStepsPerEpoch = groups / mC.Comm->world_size();
    if (mStepsPerEpoch <= 0) {
        throw std::invalid_argument(fmt::format(
            "{} cached shards are not enough for a cache batch size of {} on {} workers",
            mC.Dataset->size(), mOptions.CacheBatchSize, mC.Comm->world_size()));
    }

    const long batch = static_cast<long>(mOptions.CacheBatchSize) * mC.Dataset->batch_size();
    const auto& latent = mC.Dataset->latent_shape();
    PatchGrid grid = PatchGrid::create(batch, latent.at(0), latent.at(1), latent.at(2), mOptions.PatchSize);

    mInputIds = mAllocator.allocate(ETensorDType::INT32, "input_ids", {batch, (long)mC.Dataset->max_length()});
    mLatents = mAllocator.allocate(ETensorDType::FP32, "latents", grid.latent_shape());
    mPatches = mAllocator.allocate(ETensorDType::FP32, "patches", grid.patch_shape());
}

/**
 * @brief Restores model, optimizer, schedules, loss windows and position from a checkpoint.
 *
 * A checkpoint written after the last batch of an epoch continues with the first batch of the
 * next epoch.
 *
 * @param state State read by CheckpointManager::resume() or load().
 * @throws std::runtime_error If the parameters or optimizer state do not match the model.
 */
void TrainingLoop::adopt(TrainingState& state) {
    copy_tensors(state.ModelParameters, mC.Model->parameters());
    mC.Optimizer->load_state(state.Optimizer);
    mC.Scheduler->set_last_step(state.SchedulerStep);
    mC.Losses->reset(state.LossWindows);
    if (!state.TimestepRng.empty()) {
        mC.Timesteps->set_rng_state(state.TimestepRng);
    }

    mStep = state.Step;
    mEpoch = state.Epoch;
    mBatchInEpoch = state.BatchInEpoch;
    mLastLoss = state.LastLoss;
    if (mBatchInEpoch >= mStepsPerEpoch) {
        ++mEpoch;
        mBatchInEpoch = 0;
    }
}

TrainingState TrainingLoop::snapshot() {
    TrainingState state;
    state.Epoch = mEpoch;
    state.Step = mStep;
    state.BatchInEpoch = mBatchInEpoch;
    state.LastLoss = mLastLoss;
    state.ModelParameters = TensorStore::copy_of(mC.Model->parameters());
    state.Optimizer = mC.Optimizer->save_state();
    state.SchedulerStep = mC.Scheduler->last_step();
    state.LossWindows = mC.Losses->state();
    state.TimestepRng = mC.Timesteps->rng_state();
    return state;
}

bool TrainingLoop::finished() const {
    return mOptions.MaxSteps > 0 && mStep >= mOptions.MaxSteps;
}

long TrainingLoop::run() {
    const long first = mStep;
    for (; mEpoch < mOptions.Epochs; ++mEpoch) {
        while (mBatchInEpoch < mStepsPerEpoch) {
            if (finished()) {
                return mStep - first;
            }
            train_step();
        }
        mBatchInEpoch = 0;
    }
    return mStep - first;
}

void TrainingLoop::load_batch(int batch) {
    const int cbs = mOptions.CacheBatchSize;
    const long bs = mC.Dataset->batch_size();
    const int group = batch * mC.Comm->world_size() + mC.Comm->rank();
    for (int k = 0; k < cbs; ++k) {
        Tensor ids = slice(mInputIds, 0, k * bs, (k + 1) * bs);
        Tensor latents = slice(mLatents, 0, k * bs, (k + 1) * bs);
        mC.Dataset->load(group * cbs + k, ids, latents);
    }
}

void TrainingLoop::train_step() {
    auto start = std::chrono::steady_clock::now();
    const long step = ++mStep;

    load_batch(mBatchInEpoch);
    patchify(mLatents, mOptions.PatchSize, mPatches);

    ModelInput input;
    input.InputIds = mInputIds;
    input.Patches = mPatches;
    input.Timesteps = mC.Timesteps->sample(step, narrow<int>(mPatches.Sizes[0]));

    ModelOutput output = mC.Model->forward_and_loss(input);
    mC.Model->backward();
    mC.Optimizer->step();
    mC.Scheduler->step();
    mC.Optimizer->zero_grad();

    mLastLoss = output.Loss;
    mC.Losses->record("text", output.Losses.Text);
    mC.Losses->record("diffusion", output.Losses.Diffusion);
    ++mBatchInEpoch;

    auto end = std::chrono::steady_clock::now();
    StepReport report;
    report.Step = step;
    report.Epoch = mEpoch + static_cast<float>(mBatchInEpoch) / mStepsPerEpoch;
    report.DurationMs = narrow<int>(std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count());
    report.Loss = output.Loss;
    report.TextAverage = static_cast<float>(mC.Losses->average("text"));
    report.DiffusionAverage = static_cast<float>(mC.Losses->average("diffusion"));
    report.LearningRate = mC.Scheduler->lr();
    mC.Logger->log_step(report);

    run_cadences(output);
}

void TrainingLoop::run_cadences(ModelOutput& output) {
    const bool root = mC.Comm->is_root();
    const long step = mStep;

    if (mOptions.DebugSteps > 0 && mStep % mOptions.DebugSteps == 0) {
        mC.Comm->barrier();
        if (root && mC.Renderer) {
            const long p = mOptions.PatchSize;
            const long batch = mLatents.Sizes[0];
            const long channels = mLatents.Sizes[1];
            const long height = mLatents.Sizes[2];
            const long width = mLatents.Sizes[3];
            UnpatchifyFn to_latents = [=](const Tensor& patches, TensorAllocator& allocator) {
                Tensor grid = allocator.allocate(patches.DType, "unpatchified", {batch, channels, height, width});
                unpatchify(patches, p, batch, channels, height, width, grid);
                return grid;
            };
            output.Diagnostics.Latents = mPatches;
            mC.Renderer->render_debug(output.Diagnostics, to_latents, mEpoch, step);
        }
    }

    if (mOptions.InferenceSteps > 0 && mStep % mOptions.InferenceSteps == 0) {
        mC.Comm->barrier();
        if (root && mC.Renderer) {
            mC.Renderer->render_inference(mEpoch, step);
        }
    }

    if (mOptions.SaveSteps > 0 && mStep % mOptions.SaveSteps == 0) {
        mC.Comm->barrier();
        auto log = mC.Logger->log_section_start(step, fmt::format("saving checkpoint to `{}`", mC.Checkpoints->directory()));
        TrainingState state = snapshot();
        mC.Checkpoints->save(state, mLastLoss);
        if (root && mOptions.CheckpointsToKeep >= 0) {
            auto cleaned = clean_old_checkpoints(mC.Checkpoints->directory(), mOptions.CheckpointsToKeep, mOptions.MajorCheckpointEvery);
            if (!cleaned.empty()) {
                mC.Logger->log_message(step, fmt::format("Cleaned {} checkpoints", cleaned.size()));
            }
        }
    }
}
