// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRANSFUSE_SRC_TRAINING_MODEL_H
#define TRANSFUSE_SRC_TRAINING_MODEL_H

#include <map>
#include <string>
#include <vector>

#include "utilities/tensor.h"
#include "utilities/tensor_store.h"

//! \brief One training batch as seen by the model.
//! \details All tensors are views owned by the caller and only valid during the call.
struct ModelInput {
    Tensor InputIds;                //!< INT32 [B, L], padded with the tokenizer's pad id
    Tensor Patches;                 //!< FP32 [B, N, C*p*p], patchified clean latents
    std::vector<float> Timesteps;   //!< one noise level in [0, 1) per sample
};

//! Named loss components of one forward pass.
struct LossComponents {
    float Text = 0.f;
    float Diffusion = 0.f;
};

//! \brief Auxiliary tensors produced by the forward pass, used only for diagnostics.
//! \details Every tensor is a patch sequence [B, N, C*p*p] owned by the model, and stays
//! valid until the next call to forward_and_loss.
struct DiagnosticBundle {
    Tensor Latents;         //!< clean input patches; set by the training loop
    Tensor DenoisedTokens;
    Tensor Noise;
    Tensor Flow;
    Tensor PredFlow;
    Tensor NoisedImage;
};

struct ModelOutput {
    float Loss = 0.f;               //!< Text + weight * Diffusion
    LossComponents Losses;
    DiagnosticBundle Diagnostics;
};

//! \brief Abstract multimodal model.
//! \details Provides the loss computation and access to parameters and gradients.
class IModel {
public:
    virtual ~IModel() = default;

    //! \brief Runs the forward pass and computes the losses.
    //! \details Gradients of the loss are made available by the subsequent backward() call.
    virtual ModelOutput forward_and_loss(const ModelInput& input) = 0;

    //! Accumulates the gradients of the preceding forward_and_loss into gradients().
    virtual void backward() = 0;

    virtual ITensorContainer& parameters() = 0;
    virtual ITensorContainer& gradients() = 0;

    [[nodiscard]] virtual long num_parameters() const = 0;
};

//! Serializable optimizer state: tensors (e.g. moments) plus scalar counters and hyperparameters.
struct OptimizerState {
    TensorStore Tensors;
    std::map<std::string, double> Scalars;
};

class IOptimizer {
public:
    virtual ~IOptimizer() = default;

    //! Applies one update to the parameters using the current gradients.
    virtual void step() = 0;
    virtual void zero_grad() = 0;

    [[nodiscard]] virtual float learning_rate() const = 0;
    virtual void set_learning_rate(float lr) = 0;

    //! Deep copy of the internal state.
    virtual OptimizerState save_state() = 0;

    //! Replaces the internal state. Throws std::runtime_error if `state` does not fit.
    virtual void load_state(OptimizerState& state) = 0;
};

#endif //TRANSFUSE_SRC_TRAINING_MODEL_H
