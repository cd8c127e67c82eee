// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRANSFUSE_SRC_TRAINING_TRAINER_H
#define TRANSFUSE_SRC_TRAINING_TRAINER_H

#include "checkpoint.h"
#include "runtime_options.h"
#include "utilities/allocator.h"

class IDiagnosticRenderer;
class LRScheduler;
class TimestepScheduler;
class LossTracker;
class CachedDataset;
class TrainingRunLogger;
class Communicator;

//! Collaborators of a TrainingLoop. All of them must outlive the loop.
struct TrainingComponents {
    IModel* Model = nullptr;
    IOptimizer* Optimizer = nullptr;
    LRScheduler* Scheduler = nullptr;
    TimestepScheduler* Timesteps = nullptr;
    LossTracker* Losses = nullptr;
    const CachedDataset* Dataset = nullptr;
    CheckpointManager* Checkpoints = nullptr;
    IDiagnosticRenderer* Renderer = nullptr;    ///< may be null; only used on rank 0
    TrainingRunLogger* Logger = nullptr;
    Communicator* Comm = nullptr;
};

/**
 * @brief Drives epochs and steps over the cached dataset.
 *
 * Each step combines `CacheBatchSize` shards into one batch, patchifies the latents, draws
 * timesteps, runs forward/backward, updates the optimizer and the learning-rate schedule and
 * records the losses. Debug renders, inference renders and checkpoints happen on their cadences,
 * each preceded by a barrier across all workers.
 *
 * Worker `r` of `w` trains on shard groups `g` with `g % w == r`; every worker runs the same
 * number of steps per epoch.
 */
class TrainingLoop {
public:
    TrainingLoop(TrainingComponents components, TrainingOptions options);

    //! Continues from a restored checkpoint instead of step 0.
    void adopt(TrainingState& state);

    //! Runs until all epochs are done or MaxSteps is reached. Returns the number of steps taken.
    long run();

    //! Deep copy of the current training state.
    [[nodiscard]] TrainingState snapshot();

    [[nodiscard]] int steps_per_epoch() const { return mStepsPerEpoch; }
    [[nodiscard]] long step() const { return mStep; }
    [[nodiscard]] int epoch() const { return mEpoch; }
    [[nodiscard]] int batch_in_epoch() const { return mBatchInEpoch; }
    [[nodiscard]] float last_loss() const { return mLastLoss; }

private:
    void train_step();
    void load_batch(int batch);
    void run_cadences(ModelOutput& output);
    [[nodiscard]] bool finished() const;

    TrainingComponents mC;
    TrainingOptions mOptions;
    int mStepsPerEpoch = 0;

    long mStep = 0;
    int mEpoch = 0;
    int mBatchInEpoch = 0;
    float mLastLoss = 0.f;

    TensorAllocator mAllocator;
    Tensor mInputIds;       // INT32 [cbs * bs, L]
    Tensor mLatents;        // FP32 [cbs * bs, C, h, w]
    Tensor mPatches;        // FP32 [cbs * bs, N, C * p * p]
};

#endif //TRANSFUSE_SRC_TRAINING_TRAINER_H
