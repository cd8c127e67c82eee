// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRANSFUSE_SRC_TRAINING_RUNTIME_OPTIONS_H
#define TRANSFUSE_SRC_TRAINING_RUNTIME_OPTIONS_H

// Options consumed by the TrainingLoop. The CLI fills them from its flags.
struct TrainingOptions {
    int Epochs = 10;
    long MaxSteps = -1;             ///< stop once the global step reaches this value; <= 0 runs all epochs

    int CacheBatchSize = 2;         ///< shards combined per step
    int PatchSize = 2;

    // Cadences in global steps; <= 0 disables
    int DebugSteps = 20;
    int InferenceSteps = 200;
    int SaveSteps = 200;

    int CheckpointsToKeep = -1;     ///< -1 keeps all checkpoints
    int MajorCheckpointEvery = -1;  ///< every nth checkpoint survives the cleanup; -1 disables
};

#endif //TRANSFUSE_SRC_TRAINING_RUNTIME_OPTIONS_H
