// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "timesteps.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include <fmt/core.h>

TimestepScheduler::TimestepScheduler(int debug_cadence, int inference_cadence, std::uint64_t seed) :
    mDebugCadence(debug_cadence), mInferenceCadence(inference_cadence), mGenerator(seed) {
}

bool TimestepScheduler::is_override_step(long step) const {
    return (mDebugCadence > 0 && step % mDebugCadence == 0) ||
           (mInferenceCadence > 0 && step % mInferenceCadence == 0);
}

/**
 * @brief Draw the noise levels of one step.
 *
 * The generator advances by `batch_size` draws on every step, including override steps,
 * so the random sequence does not depend on the cadences.
 *
 * @param step Global (1-based) step counter.
 * @param batch_size Number of samples in the step.
 * @return One value in [0, 1) per sample.
 */
std::vector<float> TimestepScheduler::sample(long step, int batch_size) {
    if (batch_size < 0) {
        throw std::invalid_argument(fmt::format("Invalid batch size {}", batch_size));
    }
    std::vector<float> times(batch_size);
    for (float& t : times) {
        // top 24 bits give an exactly representable float in [0, 1)
        t = static_cast<float>(mGenerator() >> 40) * 0x1.0p-24f;
    }
    if (is_override_step(step)) {
        std::fill(times.begin(), times.end(), FixedValue);
    }
    return times;
}

std::string TimestepScheduler::rng_state() const {
    std::ostringstream stream;
    stream << mGenerator;
    return stream.str();
}

void TimestepScheduler::set_rng_state(const std::string& state) {
    std::istringstream stream(state);
    std::mt19937_64 restored;
    stream >> restored;
    if (stream.fail()) {
        throw std::runtime_error("Invalid timestep generator state");
    }
    mGenerator = restored;
}
