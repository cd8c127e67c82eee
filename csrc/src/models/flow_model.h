// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRANSFUSE_SRC_MODELS_FLOW_MODEL_H
#define TRANSFUSE_SRC_MODELS_FLOW_MODEL_H

#include <memory>
#include <random>

#include "models/registry.h"
#include "training/model.h"
#include "utilities/tensor_store.h"

namespace models {

/**
 * @brief Minimal rectified-flow model with a unigram text head.
 *
 * Text: a single logit vector shared by all positions; the text loss is the mean cross
 * entropy over all tokens up to and including the first pad/EOS token.
 *
 * Image: for clean patches x, noise e and timestep t,
 *   x_t  = t * x + (1 - t) * e,      flow = x - e,
 *   pred = W x_t + b + t * time,     diffusion loss = mean((pred - flow)^2),
 *   denoised = x_t + (1 - t) * pred.
 *
 * Total loss = text + weight * diffusion. Gradients are computed analytically.
 */
class FlowTinyModel : public IModel {
public:
    explicit FlowTinyModel(const ModelConfig& config);

    ModelOutput forward_and_loss(const ModelInput& input) override;
    void backward() override;

    ITensorContainer& parameters() override { return mParams; }
    ITensorContainer& gradients() override { return mGrads; }
    [[nodiscard]] long num_parameters() const override;

    [[nodiscard]] int patch_dim() const { return mPatchDim; }

    static ArchitectureOps ops();

private:
    void ensure_activations(long batch, long num_patches, long seq_len);
    void compute_prediction();

    ModelConfig mConfig;
    int mPatchDim;
    std::mt19937_64 mNoiseGen;

    TensorStore mParams;
    TensorStore mGrads;
    std::unique_ptr<TensorStore> mActs;

    // views into the stores above
    Tensor mLogits, mWeight, mBias, mTime;
    Tensor mLogitsGrad, mWeightGrad, mBiasGrad, mTimeGrad;
    Tensor mNoised, mNoise, mFlow, mPred, mDenoised, mTokens;
    std::vector<float> mTimes;
    long mTokenCount = 0;
    bool mHasForward = false;
};

} // namespace models

#endif //TRANSFUSE_SRC_MODELS_FLOW_MODEL_H
