// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRANSFUSE_SRC_TRAINING_CHECKPOINT_H
#define TRANSFUSE_SRC_TRAINING_CHECKPOINT_H

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "loss_tracker.h"
#include "model.h"
#include "utilities/tensor_store.h"

class Communicator;

//! Raised when resuming is requested but there is no checkpoint to resume from.
class CheckpointNotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//! \brief Everything needed to continue training as if it had never been interrupted.
struct TrainingState {
    int Epoch = 0;                  ///< epoch in progress
    long Step = 0;                  ///< global step counter, i.e., the number of completed steps
    int BatchInEpoch = 0;           ///< batches of `Epoch` already consumed by this worker
    float LastLoss = 0.f;           ///< loss of the last completed step
    TensorStore ModelParameters;
    OptimizerState Optimizer;
    long SchedulerStep = 0;         ///< LRScheduler::last_step()
    std::map<std::string, LossWindowState> LossWindows;
    std::string TimestepRng;        ///< TimestepScheduler::rng_state()
};

//! Constructs full path for checkpoint at given step
std::string get_checkpoint_path(std::string checkpoint_directory, long step);

//! Lists available checkpoint step numbers, ascending. Unfinished checkpoints are ignored.
std::vector<long> get_all_checkpoints(const std::string& checkpoint_directory);

//! Returns latest checkpoint step number, -1 if none exist
long find_latest_checkpoint(const std::string& checkpoint_directory);

//! Removes old checkpoints while preserving the latest `n_to_keep`, and any checkpoint whose
//! step number is a multiple of `major_every`. Note: `major_every` needs to be specified
//! in units of steps, not in units of minor checkpoints.
std::vector<std::string> clean_old_checkpoints(const std::string& checkpoint_directory, int n_to_keep, int major_every);

/**
 * @brief Writes and restores TrainingState snapshots as `step_XXXXXXXX` directories.
 *
 * A checkpoint is assembled in `step_XXXXXXXX.tmp` and renamed into place once complete,
 * so a resume only ever sees fully written checkpoints.
 */
class CheckpointManager {
public:
    CheckpointManager(std::string directory, Communicator& comm);

    /**
     * @brief Persists `state` together with the last loss value.
     *
     * Call after all workers passed a barrier. Only rank 0 writes; the function returns on
     * every rank once the checkpoint is complete.
     * @return Path of the checkpoint directory.
     */
    std::string save(TrainingState& state, float loss);

    //! Reads the most recent checkpoint. Throws CheckpointNotFoundError if there is none.
    [[nodiscard]] TrainingState resume() const;

    //! Reads the checkpoint of `step`. Throws CheckpointNotFoundError if it does not exist.
    [[nodiscard]] TrainingState load(long step) const;

    [[nodiscard]] bool has_checkpoint() const;
    [[nodiscard]] const std::string& directory() const { return mDirectory; }

private:
    std::string mDirectory;
    Communicator* mComm;
};

#endif //TRANSFUSE_SRC_TRAINING_CHECKPOINT_H
