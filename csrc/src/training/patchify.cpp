// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "patchify.h"

#include <cstring>

#include <fmt/core.h>

PatchGrid PatchGrid::create(long batch, long channels, long height, long width, long patch_size) {
    if (batch <= 0 || channels <= 0 || height <= 0 || width <= 0 || patch_size <= 0) {
        throw ShapeError(fmt::format("Invalid patch grid: B={} C={} H={} W={} p={}", batch, channels, height, width, patch_size));
    }
    if (height % patch_size != 0 || width % patch_size != 0) {
        throw ShapeError(fmt::format("Latent size {}x{} is not divisible by patch size {}", height, width, patch_size));
    }
    return PatchGrid{batch, channels, height, width, patch_size};
}

PatchGrid PatchGrid::of_latents(const Tensor& latents, long patch_size) {
    if (latents.Rank != 4) {
        throw ShapeError(fmt::format("Expected latents of rank 4 [B, C, H, W], got {}", shape_to_string(latents)));
    }
    return create(latents.Sizes[0], latents.Sizes[1], latents.Sizes[2], latents.Sizes[3], patch_size);
}

namespace {

void check_target(const Tensor& t, ETensorDType dtype, const std::vector<long>& shape, const char* what) {
    if (t.DType != dtype) {
        throw ShapeError(fmt::format("{} has dtype {}, expected {}", what, dtype_to_str(t.DType), dtype_to_str(dtype)));
    }
    if (t.shape() != shape) {
        throw ShapeError(fmt::format("{} has shape {}, expected {}", what, shape_to_string(t),
                                     shape_to_string(Tensor::from_pointer(nullptr, dtype, shape))));
    }
}

//! Moves elements between the grid layout and the patch layout; `to_patches` selects the direction.
void transpose_patches(const PatchGrid& g, const std::byte* src, std::byte* dst, std::size_t elem, bool to_patches) {
    const long p = g.PatchSize;
    const long wp_count = g.patches_per_row();
    const long n_patches = g.num_patches();
    const long dim = g.patch_dim();
    const std::size_t run = p * elem;   // p consecutive pixels of one patch row are contiguous on both sides

    for (long b = 0; b < g.Batch; ++b) {
        for (long c = 0; c < g.Channels; ++c) {
            for (long y = 0; y < g.Height; ++y) {
                const long hp = y / p;
                const long i = y % p;
                for (long wp = 0; wp < wp_count; ++wp) {
                    const long grid_index = ((b * g.Channels + c) * g.Height + y) * g.Width + wp * p;
                    const long patch_index = (b * n_patches + hp * wp_count + wp) * dim + c * p * p + i * p;
                    if (to_patches) {
                        std::memcpy(dst + patch_index * elem, src + grid_index * elem, run);
                    } else {
                        std::memcpy(dst + grid_index * elem, src + patch_index * elem, run);
                    }
                }
            }
        }
    }
}

} // namespace

/**
 * @brief Reshape a spatial latent grid into a sequence of flattened patches.
 *
 * @param latents Input tensor [B, C, H, W].
 * @param patch_size Side length p of the square patches.
 * @param out Output tensor [B, (H/p)*(W/p), C*p*p] of the same dtype.
 * @throws ShapeError If H or W is not divisible by p, or `out` has the wrong shape or dtype.
 */
void patchify(const Tensor& latents, long patch_size, Tensor& out) {
    PatchGrid grid = PatchGrid::of_latents(latents, patch_size);
    check_target(out, latents.DType, grid.patch_shape(), "Patch output");
    transpose_patches(grid, latents.Data, out.Data, get_dtype_size(latents.DType), true);
}

/**
 * @brief Reassemble a latent grid from its patch sequence.
 *
 * @param patches Input tensor [B, (H/p)*(W/p), C*p*p].
 * @param patch_size Side length p of the square patches.
 * @param batch, channels, height, width Shape of the latent grid to restore.
 * @param out Output tensor [B, C, H, W] of the same dtype as `patches`.
 * @throws ShapeError If the grid is invalid, or `patches`/`out` do not match it.
 */
void unpatchify(const Tensor& patches, long patch_size, long batch, long channels, long height, long width, Tensor& out) {
    PatchGrid grid = PatchGrid::create(batch, channels, height, width, patch_size);
    if (patches.Rank != 3) {
        throw ShapeError(fmt::format("Expected patches of rank 3 [B, N, D], got {}", shape_to_string(patches)));
    }
    if (patches.Sizes[2] != grid.patch_dim()) {
        throw ShapeError(fmt::format("Patch width {} does not match C*p*p = {}", patches.Sizes[2], grid.patch_dim()));
    }
    check_target(patches, patches.DType, grid.patch_shape(), "Patch input");
    check_target(out, patches.DType, grid.latent_shape(), "Latent output");
    transpose_patches(grid, patches.Data, out.Data, get_dtype_size(patches.DType), false);
}
