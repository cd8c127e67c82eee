// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRANSFUSE_SRC_TRAINING_PATCHIFY_H
#define TRANSFUSE_SRC_TRAINING_PATCHIFY_H

#include "utilities/tensor.h"

//! Shape parameters of a patchified latent grid.
struct PatchGrid {
    long Batch;
    long Channels;
    long Height;
    long Width;
    long PatchSize;

    //! Validates all sizes; throws ShapeError if not positive or not divisible by the patch size.
    static PatchGrid create(long batch, long channels, long height, long width, long patch_size);

    //! Grid of a [B, C, H, W] latent tensor.
    static PatchGrid of_latents(const Tensor& latents, long patch_size);

    [[nodiscard]] long patches_per_row() const { return Width / PatchSize; }
    [[nodiscard]] long num_patches() const { return (Height / PatchSize) * (Width / PatchSize); }
    [[nodiscard]] long patch_dim() const { return Channels * PatchSize * PatchSize; }

    [[nodiscard]] std::vector<long> latent_shape() const { return {Batch, Channels, Height, Width}; }
    [[nodiscard]] std::vector<long> patch_shape() const { return {Batch, num_patches(), patch_dim()}; }
};

/**
 * @brief Splits [B, C, H, W] latents into [B, (H/p)*(W/p), C*p*p] patch rows.
 *
 * Patches are numbered row-major over the (H/p, W/p) grid. Inside a row, features are
 * ordered channel-major: `out[b, hp*(W/p) + wp, c*p*p + i*p + j] = in[b, c, hp*p + i, wp*p + j]`.
 * Works for any dtype; `out` must have the patch shape and the same dtype.
 */
void patchify(const Tensor& latents, long patch_size, Tensor& out);

//! Exact inverse of patchify. Throws ShapeError if `patches` does not match the given grid.
void unpatchify(const Tensor& patches, long patch_size, long batch, long channels, long height, long width, Tensor& out);

#endif //TRANSFUSE_SRC_TRAINING_PATCHIFY_H
