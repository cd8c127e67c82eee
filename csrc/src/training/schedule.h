// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRANSFUSE_SRC_TRAINING_SCHEDULE_H
#define TRANSFUSE_SRC_TRAINING_SCHEDULE_H

#include <cmath>
#include <memory>
#include <numbers>

#include "model.h"

/**
 * @brief Interface for scalar schedules evaluated per training step.
 *
 * A schedule maps an integer step index (starting at 0) to a float
 * value (e.g., learning rate).
 */
class ISchedule {
public:
    virtual ~ISchedule() = default;

    /**
     * @brief Evaluate the schedule at a given step.
     * @param step Number of scheduler steps taken so far.
     * @return Scheduled value for the given step.
     */
    virtual float eval(long step) const = 0;
};

/**
 * @brief Cosine annealing from a peak rate down to a base rate.
 *
 * Behavior:
 * - For steps in [0, warmup): linear warmup from 0 to peak rate.
 * - For steps >= warmup: cosine interpolation from peak rate down to base rate,
 *   reached after `steps` decay steps. Beyond that the cosine continues, rising again
 *   towards the peak rate.
 */
class CosineSchedule : public ISchedule {
public:
    explicit CosineSchedule(float peak_rate) : mPeakRate(peak_rate), mBaseRate(peak_rate) {}

    /**
     * @param peak_rate Value reached after warmup and used as the cosine start.
     * @param steps Number of decay steps (half period of the cosine).
     * @param warmup Number of warmup steps (linear ramp from 0 to @p peak_rate).
     * @param base_rate Value at the end of the cosine decay.
     */
    CosineSchedule(float peak_rate, long steps, long warmup, float base_rate)
        : mWarmupSteps(warmup), mDecaySteps(steps > 0 ? steps : 1), mPeakRate(peak_rate), mBaseRate(base_rate) {}

    float eval(long step) const override {
        if(step < mWarmupSteps) {
            return mPeakRate * step / mWarmupSteps;
        }
        double pos = (double)(step - mWarmupSteps) / mDecaySteps;
        double frac = 0.5 * std::cos(pos * std::numbers::pi) + 0.5;
        return static_cast<float>(frac * (mPeakRate - mBaseRate) + mBaseRate);
    }

private:
    long mWarmupSteps = 0;
    long mDecaySteps = 1;
    float mPeakRate;
    float mBaseRate;
};

//! \brief Drives the learning rate of an optimizer from a schedule.
//! \details The rate of scheduler step n is `schedule.eval(n)`; step() is called once after every
//! optimizer update.
class LRScheduler {
public:
    LRScheduler(IOptimizer& optimizer, std::unique_ptr<ISchedule> schedule)
        : mOptimizer(&optimizer), mSchedule(std::move(schedule)) {
        mOptimizer->set_learning_rate(mSchedule->eval(0));
    }

    void step() {
        ++mLastStep;
        mOptimizer->set_learning_rate(mSchedule->eval(mLastStep));
    }

    [[nodiscard]] long last_step() const { return mLastStep; }

    //! Jumps to a restored position.
    void set_last_step(long step) {
        mLastStep = step;
        mOptimizer->set_learning_rate(mSchedule->eval(mLastStep));
    }

    [[nodiscard]] float lr() const { return mOptimizer->learning_rate(); }

private:
    IOptimizer* mOptimizer;
    std::unique_ptr<ISchedule> mSchedule;
    long mLastStep = 0;
};

#endif //TRANSFUSE_SRC_TRAINING_SCHEDULE_H
