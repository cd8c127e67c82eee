// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "adamw.h"

#include <cmath>
#include <stdexcept>
#include <unordered_map>

#include <fmt/core.h>

namespace optimizers {

void adamw_update(float* param, const float* grad, float* m, float* v, std::size_t n,
                  float lr, float beta1, float beta2, float beta1_correction, float beta2_correction,
                  float epsilon, float weight_decay) {
    for (std::size_t i = 0; i < n; ++i) {
        float g = grad[i];
        m[i] = beta1 * m[i] + (1.f - beta1) * g;
        v[i] = beta2 * v[i] + (1.f - beta2) * g * g;
        float m_hat = m[i] / beta1_correction;
        float v_hat = v[i] / beta2_correction;
        param[i] -= lr * (m_hat / (std::sqrt(v_hat) + epsilon) + weight_decay * param[i]);
    }
}

/**
 * @brief Set up AdamW state for all tensors of @p parameters.
 *
 * @throws std::runtime_error If a parameter is not FP32 or has no matching gradient.
 */
AdamWOptimizer::AdamWOptimizer(ITensorContainer& parameters, ITensorContainer& gradients, AdamWConfig config) :
    mConfig(config) {
    std::unordered_map<std::string, Tensor> grads;
    gradients.iterate_tensors([&grads](std::string name, const Tensor& t) { grads.emplace(std::move(name), t); });

    std::vector<std::pair<std::string, Tensor>> params;
    parameters.iterate_tensors([&params](std::string name, const Tensor& t) { params.emplace_back(std::move(name), t); });

    for (auto& [name, param] : params) {
        auto found = grads.find(name);
        if (found == grads.end()) {
            throw std::runtime_error(fmt::format("No gradient for parameter `{}`", name));
        }
        if (param.DType != ETensorDType::FP32 || found->second.DType != ETensorDType::FP32 ||
            param.nelem() != found->second.nelem()) {
            throw std::runtime_error(fmt::format("AdamW needs FP32 parameter and gradient of equal size for `{}`", name));
        }
        Tensor m = mMoments.add(name + ".m", ETensorDType::FP32, param.shape());
        Tensor v = mMoments.add(name + ".v", ETensorDType::FP32, param.shape());
        mSlots.push_back(sSlot{name, param, found->second, m, v});
    }
}

void AdamWOptimizer::step() {
    ++mStep;
    const float beta1_correction = 1.f - static_cast<float>(std::pow(mConfig.beta1, mStep));
    const float beta2_correction = 1.f - static_cast<float>(std::pow(mConfig.beta2, mStep));
    for (auto& slot : mSlots) {
        adamw_update(slot.Param.get<float>(), slot.Grad.get<float>(), slot.M.get<float>(), slot.V.get<float>(),
                     slot.Param.nelem(), mConfig.learning_rate, mConfig.beta1, mConfig.beta2,
                     beta1_correction, beta2_correction, mConfig.epsilon, mConfig.weight_decay);
    }
}

void AdamWOptimizer::zero_grad() {
    for (auto& slot : mSlots) {
        fill_zero(slot.Grad);
    }
}

OptimizerState AdamWOptimizer::save_state() {
    OptimizerState state;
    state.Tensors = TensorStore::copy_of(mMoments);
    state.Scalars = {
        {"step", static_cast<double>(mStep)},
        {"lr", mConfig.learning_rate},
        {"beta1", mConfig.beta1},
        {"beta2", mConfig.beta2},
        {"epsilon", mConfig.epsilon},
        {"weight_decay", mConfig.weight_decay},
    };
    return state;
}

/**
 * @brief Adopt a saved state: moments, step counter and hyperparameters.
 *
 * @throws std::runtime_error If the moments do not match this optimizer's parameters.
 * @throws std::out_of_range If a scalar is missing.
 */
void AdamWOptimizer::load_state(OptimizerState& state) {
    copy_tensors(state.Tensors, mMoments);
    mStep = static_cast<long>(state.Scalars.at("step"));
    mConfig.learning_rate = static_cast<float>(state.Scalars.at("lr"));
    mConfig.beta1 = static_cast<float>(state.Scalars.at("beta1"));
    mConfig.beta2 = static_cast<float>(state.Scalars.at("beta2"));
    mConfig.epsilon = static_cast<float>(state.Scalars.at("epsilon"));
    mConfig.weight_decay = static_cast<float>(state.Scalars.at("weight_decay"));
}

}  // namespace optimizers
