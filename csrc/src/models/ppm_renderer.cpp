// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "models/ppm_renderer.h"

#include <filesystem>
#include <utility>

#include <fmt/core.h>

#include "models/ppm_image.h"
#include "utilities/allocator.h"

namespace models {

PpmDiagnosticRenderer::PpmDiagnosticRenderer(std::string output_dir, const IEncoder& encoder) :
    mOutputDir(std::move(output_dir)), mEncoder(&encoder) {
}

void PpmDiagnosticRenderer::decode_and_save(const Tensor& latents, const std::string& name) {
    if (latents.Rank != 4 || latents.DType != ETensorDType::FP32) {
        throw ShapeError(fmt::format("Expected FP32 [B, C, h, w] latents, got {}", shape_to_string(latents)));
    }
    TensorAllocator allocator;
    const long f = mEncoder->downsample_factor();
    Tensor first = slice(latents, 0, 0, 1);
    Tensor image = allocator.allocate(ETensorDType::FP32, "decoded", {1, 3, latents.Sizes[2] * f, latents.Sizes[3] * f});
    mEncoder->decode(first, image);
    save_sample(image, name);
}

/**
 * @brief Writes the clean, noised, denoised and predicted-flow latents of the first sample.
 *
 * @param bundle Patch sequences of the current step.
 * @param unpatchify Converts a patch sequence back to its latent grid.
 * @param epoch Current epoch, used in the file name.
 * @param step Current global step, used in the file name.
 */
void PpmDiagnosticRenderer::render_debug(const DiagnosticBundle& bundle, const UnpatchifyFn& unpatchify, int epoch, long step) {
    TensorAllocator allocator;
    const std::pair<const char*, const Tensor*> kinds[] = {
        {"latents", &bundle.Latents},
        {"noised", &bundle.NoisedImage},
        {"denoised", &bundle.DenoisedTokens},
        {"pred_flow", &bundle.PredFlow},
    };
    for (const auto& [kind, patches] : kinds) {
        if (patches->Data == nullptr) continue;
        Tensor grid = unpatchify(*patches, allocator);
        decode_and_save(grid, fmt::format("debug_epoch_{}_step_{}_{}", epoch, step, kind));
    }
}

void PpmDiagnosticRenderer::render_inference(int epoch, long step) {
    if (!mPreview.contains("preview")) {
        return;
    }
    decode_and_save(mPreview.get("preview"), fmt::format("inference_epoch_{}_step_{}", epoch, step));
}

void PpmDiagnosticRenderer::save_sample(const Tensor& image, const std::string& name) {
    if (image.Rank != 4 || image.Sizes[0] != 1 || image.Sizes[1] != 3) {
        throw ShapeError(fmt::format("Expected a [1, 3, H, W] image, got {}", shape_to_string(image)));
    }
    Tensor chw = reshape(image, {3, image.Sizes[2], image.Sizes[3]});
    std::string file_name = (std::filesystem::path(mOutputDir) / (name + ".ppm")).string();
    write_ppm(file_name, image_from_tensor(chw));
    mWritten.push_back(file_name);
}

void PpmDiagnosticRenderer::set_preview(const Tensor& latents) {
    if (latents.Rank != 4 || latents.Sizes[0] != 1 || latents.DType != ETensorDType::FP32) {
        throw ShapeError(fmt::format("Expected a FP32 [1, C, h, w] preview latent, got {}", shape_to_string(latents)));
    }
    TensorStore preview;
    preview.add_copy("preview", latents);
    mPreview = std::move(preview);
}

} // namespace models
