// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRANSFUSE_SRC_MODELS_POOLING_ENCODER_H
#define TRANSFUSE_SRC_MODELS_POOLING_ENCODER_H

#include "training/encoding.h"

namespace models {

/**
 * @brief Stand-in image autoencoder based on 8x8 average pooling.
 *
 * Latent channels 0..2 are the pooled R, G, B values and channel 3 the pooled luminance,
 * all mapped from [0, 1] to [-1, 1]. Decoding upsamples the color channels by repetition.
 */
class PoolingEncoder : public IEncoder {
public:
    [[nodiscard]] int latent_channels() const override { return 4; }
    [[nodiscard]] int downsample_factor() const override { return 8; }

    void encode(const Tensor& images, Tensor& latents) const override;
    void decode(const Tensor& latents, Tensor& images) const override;
};

} // namespace models

#endif //TRANSFUSE_SRC_MODELS_POOLING_ENCODER_H
