// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRANSFUSE_SRC_TRAINING_TIMESTEPS_H
#define TRANSFUSE_SRC_TRAINING_TIMESTEPS_H

#include <cstdint>
#include <random>
#include <string>
#include <vector>

/**
 * @brief Per-sample noise levels for each training step.
 *
 * Samples are drawn independently and uniformly from [0, 1). On steps that are a multiple
 * of the debug or the inference cadence, every sample instead receives FixedValue, so that
 * diagnostic renderings are comparable across steps. The decision depends only on the step
 * counter. A cadence <= 0 never triggers.
 */
class TimestepScheduler {
public:
    static constexpr float FixedValue = 0.7f;

    TimestepScheduler(int debug_cadence, int inference_cadence, std::uint64_t seed);

    //! Noise levels for `batch_size` samples of global step `step`.
    std::vector<float> sample(long step, int batch_size);

    [[nodiscard]] bool is_override_step(long step) const;

    //! Serialized generator state, to continue the same sequence after a resume.
    [[nodiscard]] std::string rng_state() const;
    void set_rng_state(const std::string& state);

private:
    int mDebugCadence;
    int mInferenceCadence;
    std::mt19937_64 mGenerator;
};

#endif //TRANSFUSE_SRC_TRAINING_TIMESTEPS_H
