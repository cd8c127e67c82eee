// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "models/flow_model.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <fmt/core.h>

namespace models {

FlowTinyModel::FlowTinyModel(const ModelConfig& config) :
    mConfig(config), mPatchDim(config.LatentChannels * config.PatchSize * config.PatchSize), mNoiseGen(config.Seed + 1) {
    if (config.VocabSize <= 0 || config.PadTokenId < 0 || config.PadTokenId >= config.VocabSize ||
        config.LatentChannels <= 0 || config.PatchSize <= 0) {
        throw std::invalid_argument(fmt::format("Invalid flow-tiny configuration: vocab {}, pad {}, channels {}, patch {}",
                                                config.VocabSize, config.PadTokenId, config.LatentChannels, config.PatchSize));
    }
    const long V = config.VocabSize;
    const long D = mPatchDim;

    mLogits = mParams.add("text.logits", ETensorDType::FP32, {V});
    mWeight = mParams.add("image.weight", ETensorDType::FP32, {D, D});
    mBias = mParams.add("image.bias", ETensorDType::FP32, {D});
    mTime = mParams.add("image.time", ETensorDType::FP32, {D});

    mLogitsGrad = mGrads.add("text.logits", ETensorDType::FP32, {V});
    mWeightGrad = mGrads.add("image.weight", ETensorDType::FP32, {D, D});
    mBiasGrad = mGrads.add("image.bias", ETensorDType::FP32, {D});
    mTimeGrad = mGrads.add("image.time", ETensorDType::FP32, {D});

    std::mt19937_64 init_gen(config.Seed);
    std::normal_distribution<float> init_dist(0.f, 0.02f);
    float* w = mWeight.get<float>();
    for (std::size_t i = 0; i < mWeight.nelem(); ++i) {
        w[i] = init_dist(init_gen);
    }
}

long FlowTinyModel::num_parameters() const {
    return static_cast<long>(mLogits.nelem() + mWeight.nelem() + mBias.nelem() + mTime.nelem());
}

void FlowTinyModel::ensure_activations(long batch, long num_patches, long seq_len) {
    if (mActs && mNoised.Sizes[0] == batch && mNoised.Sizes[1] == num_patches && mTokens.Sizes[1] == seq_len) {
        return;
    }
    mActs = std::make_unique<TensorStore>();
    const std::vector<long> shape = {batch, num_patches, static_cast<long>(mPatchDim)};
    mNoised = mActs->add("noised", ETensorDType::FP32, shape);
    mNoise = mActs->add("noise", ETensorDType::FP32, shape);
    mFlow = mActs->add("flow", ETensorDType::FP32, shape);
    mPred = mActs->add("pred", ETensorDType::FP32, shape);
    mDenoised = mActs->add("denoised", ETensorDType::FP32, shape);
    mTokens = mActs->add("tokens", ETensorDType::INT32, {batch, seq_len});
}

//! pred = W x_t + b + t * time, row by row.
void FlowTinyModel::compute_prediction() {
    const long D = mPatchDim;
    const long N = mNoised.Sizes[1];
    const float* w = mWeight.get<float>();
    const float* bias = mBias.get<float>();
    const float* time = mTime.get<float>();
    const float* x = mNoised.get<float>();
    float* pred = mPred.get<float>();

    for (long b = 0; b < mNoised.Sizes[0]; ++b) {
        const float t = mTimes[b];
        for (long n = 0; n < N; ++n) {
            const float* row = x + (b * N + n) * D;
            float* out = pred + (b * N + n) * D;
            for (long i = 0; i < D; ++i) {
                float acc = bias[i] + t * time[i];
                for (long j = 0; j < D; ++j) {
                    acc += w[i * D + j] * row[j];
                }
                out[i] = acc;
            }
        }
    }
}

/**
 * @brief Computes text and diffusion losses for one batch.
 *
 * @throws ShapeError If the inputs are inconsistent with each other or with the model.
 * @throws std::out_of_range If a token id is outside the vocabulary.
 */
ModelOutput FlowTinyModel::forward_and_loss(const ModelInput& input) {
    const Tensor& ids = input.InputIds;
    const Tensor& patches = input.Patches;
    if (ids.DType != ETensorDType::INT32 || ids.Rank != 2) {
        throw ShapeError(fmt::format("Expected INT32 token ids [B, L], got {}", shape_to_string(ids)));
    }
    if (patches.DType != ETensorDType::FP32 || patches.Rank != 3 || patches.Sizes[2] != mPatchDim) {
        throw ShapeError(fmt::format("Expected FP32 patches [B, N, {}], got {}", mPatchDim, shape_to_string(patches)));
    }
    const long B = patches.Sizes[0];
    const long N = patches.Sizes[1];
    const long D = mPatchDim;
    const long L = ids.Sizes[1];
    if (ids.Sizes[0] != B || static_cast<long>(input.Timesteps.size()) != B) {
        throw ShapeError(fmt::format("Batch mismatch: {} token rows, {} patch rows, {} timesteps",
                                     ids.Sizes[0], B, input.Timesteps.size()));
    }

    ensure_activations(B, N, L);
    mTimes = input.Timesteps;
    copy_tensor(ids, mTokens);

    // text: unigram cross entropy up to and including the terminating pad/EOS token
    const float* logits = mLogits.get<float>();
    const long V = mConfig.VocabSize;
    float max_logit = *std::max_element(logits, logits + V);
    double sum = 0.0;
    for (long v = 0; v < V; ++v) sum += std::exp(static_cast<double>(logits[v] - max_logit));
    const double lse = max_logit + std::log(sum);

    const std::int32_t* tokens = mTokens.get<std::int32_t>();
    double text_loss = 0.0;
    mTokenCount = 0;
    for (long b = 0; b < B; ++b) {
        for (long l = 0; l < L; ++l) {
            std::int32_t tok = tokens[b * L + l];
            if (tok < 0 || tok >= V) {
                throw std::out_of_range(fmt::format("Token id {} outside of vocabulary of size {}", tok, V));
            }
            text_loss += lse - logits[tok];
            ++mTokenCount;
            if (tok == mConfig.PadTokenId) break;
        }
    }
    if (mTokenCount > 0) text_loss /= mTokenCount;

    // image: rectified flow between noise (t = 0) and data (t = 1)
    std::normal_distribution<float> noise_dist(0.f, 1.f);
    const float* x = patches.get<float>();
    float* noise = mNoise.get<float>();
    float* noised = mNoised.get<float>();
    float* flow = mFlow.get<float>();
    for (long b = 0; b < B; ++b) {
        const float t = mTimes[b];
        for (long k = b * N * D; k < (b + 1) * N * D; ++k) {
            noise[k] = noise_dist(mNoiseGen);
            noised[k] = t * x[k] + (1.f - t) * noise[k];
            flow[k] = x[k] - noise[k];
        }
    }
    compute_prediction();

    const float* pred = mPred.get<float>();
    float* denoised = mDenoised.get<float>();
    double diffusion_loss = 0.0;
    for (long b = 0; b < B; ++b) {
        const float t = mTimes[b];
        for (long k = b * N * D; k < (b + 1) * N * D; ++k) {
            double diff = static_cast<double>(pred[k]) - flow[k];
            diffusion_loss += diff * diff;
            denoised[k] = noised[k] + (1.f - t) * pred[k];
        }
    }
    diffusion_loss /= static_cast<double>(B * N * D);
    mHasForward = true;

    ModelOutput output;
    output.Losses.Text = static_cast<float>(text_loss);
    output.Losses.Diffusion = static_cast<float>(diffusion_loss);
    output.Loss = output.Losses.Text + mConfig.DiffusionLossWeight * output.Losses.Diffusion;
    output.Diagnostics.DenoisedTokens = mDenoised;
    output.Diagnostics.Noise = mNoise;
    output.Diagnostics.Flow = mFlow;
    output.Diagnostics.PredFlow = mPred;
    output.Diagnostics.NoisedImage = mNoised;
    return output;
}

void FlowTinyModel::backward() {
    if (!mHasForward) {
        throw std::logic_error("backward() called without a preceding forward_and_loss()");
    }
    mHasForward = false;

    // text: d/dlogits of mean cross entropy = softmax - token histogram / count
    if (mTokenCount > 0) {
        const float* logits = mLogits.get<float>();
        float* grad = mLogitsGrad.get<float>();
        const long V = mConfig.VocabSize;
        float max_logit = *std::max_element(logits, logits + V);
        double sum = 0.0;
        for (long v = 0; v < V; ++v) sum += std::exp(static_cast<double>(logits[v] - max_logit));
        for (long v = 0; v < V; ++v) {
            grad[v] += static_cast<float>(std::exp(static_cast<double>(logits[v] - max_logit)) / sum);
        }
        const std::int32_t* tokens = mTokens.get<std::int32_t>();
        const long B = mTokens.Sizes[0];
        const long L = mTokens.Sizes[1];
        const float inv_count = 1.f / static_cast<float>(mTokenCount);
        for (long b = 0; b < B; ++b) {
            for (long l = 0; l < L; ++l) {
                std::int32_t tok = tokens[b * L + l];
                grad[tok] -= inv_count;
                if (tok == mConfig.PadTokenId) break;
            }
        }
    }

    // image
    const long B = mNoised.Sizes[0];
    const long N = mNoised.Sizes[1];
    const long D = mPatchDim;
    const float scale = mConfig.DiffusionLossWeight * 2.f / static_cast<float>(B * N * D);
    const float* x = mNoised.get<float>();
    const float* pred = mPred.get<float>();
    const float* flow = mFlow.get<float>();
    float* dw = mWeightGrad.get<float>();
    float* db = mBiasGrad.get<float>();
    float* dtime = mTimeGrad.get<float>();
    for (long b = 0; b < B; ++b) {
        const float t = mTimes[b];
        for (long n = 0; n < N; ++n) {
            const long row = (b * N + n) * D;
            for (long i = 0; i < D; ++i) {
                const float g = scale * (pred[row + i] - flow[row + i]);
                db[i] += g;
                dtime[i] += t * g;
                for (long j = 0; j < D; ++j) {
                    dw[i * D + j] += g * x[row + j];
                }
            }
        }
    }
}

ArchitectureOps FlowTinyModel::ops() {
    return ArchitectureOps{
        "flow-tiny",
        "linear rectified-flow image head with a unigram text head",
        [](const ModelConfig& config) -> std::unique_ptr<IModel> { return std::make_unique<FlowTinyModel>(config); },
    };
}

} // namespace models
