// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "models/pooling_encoder.h"

#include <algorithm>

#include <fmt/core.h>

namespace models {

namespace {
constexpr long kFactor = 8;
constexpr float kLuma[3] = {0.299f, 0.587f, 0.114f};
}

void PoolingEncoder::encode(const Tensor& images, Tensor& latents) const {
    if (images.Rank != 4 || images.Sizes[1] != 3 || images.Sizes[2] % kFactor != 0 || images.Sizes[3] % kFactor != 0) {
        throw ShapeError(fmt::format("Expected images [B, 3, H, W] with H, W divisible by {}, got {}", kFactor, shape_to_string(images)));
    }
    const long B = images.Sizes[0];
    const long H = images.Sizes[2];
    const long W = images.Sizes[3];
    const long h = H / kFactor;
    const long w = W / kFactor;
    if (latents.shape() != std::vector<long>{B, 4, h, w}) {
        throw ShapeError(fmt::format("Expected latents [{}, 4, {}, {}], got {}", B, h, w, shape_to_string(latents)));
    }

    const float* in = images.get<float>();
    float* out = latents.get<float>();
    const float norm = 1.f / static_cast<float>(kFactor * kFactor);
    for (long b = 0; b < B; ++b) {
        for (long y = 0; y < h; ++y) {
            for (long x = 0; x < w; ++x) {
                float luma = 0.f;
                for (long c = 0; c < 3; ++c) {
                    float acc = 0.f;
                    for (long dy = 0; dy < kFactor; ++dy) {
                        const float* row = in + ((b * 3 + c) * H + y * kFactor + dy) * W + x * kFactor;
                        for (long dx = 0; dx < kFactor; ++dx) {
                            acc += row[dx];
                        }
                    }
                    acc *= norm;
                    luma += kLuma[c] * acc;
                    out[((b * 4 + c) * h + y) * w + x] = 2.f * acc - 1.f;
                }
                out[((b * 4 + 3) * h + y) * w + x] = 2.f * luma - 1.f;
            }
        }
    }
}

void PoolingEncoder::decode(const Tensor& latents, Tensor& images) const {
    if (latents.Rank != 4 || latents.Sizes[1] != 4) {
        throw ShapeError(fmt::format("Expected latents [B, 4, h, w], got {}", shape_to_string(latents)));
    }
    const long B = latents.Sizes[0];
    const long h = latents.Sizes[2];
    const long w = latents.Sizes[3];
    const long H = h * kFactor;
    const long W = w * kFactor;
    if (images.shape() != std::vector<long>{B, 3, H, W}) {
        throw ShapeError(fmt::format("Expected images [{}, 3, {}, {}], got {}", B, H, W, shape_to_string(images)));
    }

    const float* in = latents.get<float>();
    float* out = images.get<float>();
    for (long b = 0; b < B; ++b) {
        for (long c = 0; c < 3; ++c) {
            for (long y = 0; y < H; ++y) {
                for (long x = 0; x < W; ++x) {
                    float v = in[((b * 4 + c) * h + y / kFactor) * w + x / kFactor];
                    out[((b * 3 + c) * H + y) * W + x] = std::clamp(0.5f * (v + 1.f), 0.f, 1.f);
                }
            }
        }
    }
}

} // namespace models
