// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRANSFUSE_SRC_TRAINING_DIAGNOSTICS_H
#define TRANSFUSE_SRC_TRAINING_DIAGNOSTICS_H

#include <functional>
#include <string>

#include "model.h"

class TensorAllocator;

//! Turns a patch sequence of the current step back into a latent grid allocated from the given allocator.
using UnpatchifyFn = std::function<Tensor(const Tensor& patches, TensorAllocator& allocator)>;

//! Writes debug and inference visualizations. Only called on rank 0.
class IDiagnosticRenderer {
public:
    virtual ~IDiagnosticRenderer() = default;

    virtual void render_debug(const DiagnosticBundle& bundle, const UnpatchifyFn& unpatchify, int epoch, long step) = 0;
    virtual void render_inference(int epoch, long step) = 0;

    //! Stores a decoded FP32 [1, 3, H, W] image under `name`.
    virtual void save_sample(const Tensor& image, const std::string& name) = 0;
};

#endif //TRANSFUSE_SRC_TRAINING_DIAGNOSTICS_H
