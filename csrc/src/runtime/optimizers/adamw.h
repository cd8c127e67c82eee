// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Full-precision AdamW optimizer (FP32 state, host memory).

#ifndef TRANSFUSE_SRC_RUNTIME_OPTIMIZERS_ADAMW_H
#define TRANSFUSE_SRC_RUNTIME_OPTIMIZERS_ADAMW_H

#include <cstddef>
#include <string>
#include <vector>

#include "training/model.h"
#include "utilities/tensor_store.h"

namespace optimizers {

/**
 * @brief AdamW hyperparameters; the defaults follow torch.optim.AdamW.
 */
struct AdamWConfig {
    float learning_rate = 1e-3f;
    float beta1 = 0.9f;
    float beta2 = 0.999f;
    float epsilon = 1e-8f;
    float weight_decay = 0.01f;
};

//! One AdamW update of `n` parameters with decoupled weight decay.
//! `beta1_correction` and `beta2_correction` are the bias corrections `1 - beta^t`.
void adamw_update(float* param, const float* grad, float* m, float* v, std::size_t n,
                  float lr, float beta1, float beta2, float beta1_correction, float beta2_correction,
                  float epsilon, float weight_decay);

//! \brief AdamW over every FP32 tensor of a parameter container.
//! \details Gradients are looked up by parameter name in `gradients`.
class AdamWOptimizer : public IOptimizer {
public:
    AdamWOptimizer(ITensorContainer& parameters, ITensorContainer& gradients, AdamWConfig config);

    void step() override;
    void zero_grad() override;

    [[nodiscard]] float learning_rate() const override { return mConfig.learning_rate; }
    void set_learning_rate(float lr) override { mConfig.learning_rate = lr; }

    OptimizerState save_state() override;
    void load_state(OptimizerState& state) override;

    [[nodiscard]] long num_steps() const { return mStep; }
    [[nodiscard]] const AdamWConfig& config() const { return mConfig; }

private:
    struct sSlot {
        std::string Name;
        Tensor Param;
        Tensor Grad;
        Tensor M;
        Tensor V;
    };

    AdamWConfig mConfig;
    long mStep = 0;
    TensorStore mMoments;
    std::vector<sSlot> mSlots;
};

}  // namespace optimizers

#endif  // TRANSFUSE_SRC_RUNTIME_OPTIMIZERS_ADAMW_H
