// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRANSFUSE_SRC_MODELS_PPM_RENDERER_H
#define TRANSFUSE_SRC_MODELS_PPM_RENDERER_H

#include <string>
#include <vector>

#include "training/diagnostics.h"
#include "training/encoding.h"
#include "utilities/tensor_store.h"

namespace models {

/**
 * @brief Decodes diagnostic latents of the first sample and writes them as PPM files.
 *
 * Debug renders produce `debug_epoch_{e}_step_{s}_{kind}.ppm` for the clean, noised,
 * denoised and predicted-flow latents. Inference renders decode the preview sample set with
 * set_preview() into `inference_epoch_{e}_step_{s}.ppm`.
 */
class PpmDiagnosticRenderer : public IDiagnosticRenderer {
public:
    PpmDiagnosticRenderer(std::string output_dir, const IEncoder& encoder);

    void render_debug(const DiagnosticBundle& bundle, const UnpatchifyFn& unpatchify, int epoch, long step) override;
    void render_inference(int epoch, long step) override;
    void save_sample(const Tensor& image, const std::string& name) override;

    //! Copies a FP32 [1, C, h, w] latent that render_inference decodes.
    void set_preview(const Tensor& latents);

    //! Files written so far.
    [[nodiscard]] const std::vector<std::string>& written() const { return mWritten; }

private:
    void decode_and_save(const Tensor& latents, const std::string& name);

    std::string mOutputDir;
    const IEncoder* mEncoder;
    TensorStore mPreview;
    std::vector<std::string> mWritten;
};

} // namespace models

#endif //TRANSFUSE_SRC_MODELS_PPM_RENDERER_H
