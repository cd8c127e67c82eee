// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRANSFUSE_SRC_TRAINING_ENCODING_H
#define TRANSFUSE_SRC_TRAINING_ENCODING_H

#include <cstdint>
#include <string>
#include <vector>

#include "utilities/tensor.h"

//! Text to token ids with a fixed vocabulary.
class ITokenizer {
public:
    virtual ~ITokenizer() = default;
    [[nodiscard]] virtual std::vector<std::int32_t> encode(const std::string& text) const = 0;
    [[nodiscard]] virtual int vocab_size() const = 0;
    [[nodiscard]] virtual std::int32_t eos_token_id() const = 0;
    [[nodiscard]] virtual std::int32_t pad_token_id() const = 0;
};

/**
 * @brief Tokenizes `text` into `target` (INT32 [L]).
 *
 * The sequence is truncated to L-1 tokens, terminated with the EOS token and filled
 * up with the pad token.
 */
void prepare_text(const ITokenizer& tokenizer, const std::string& text, Tensor& target);

//! Loads raw images from disk.
class IImageReader {
public:
    virtual ~IImageReader() = default;

    //! Reads the image at `path`, resized to a FP32 [3, S, S] tensor with values in [0, 1].
    virtual void load_image(const std::string& path, int image_size, Tensor& target) const = 0;
};

//! \brief Image autoencoder (VAE-like).
//! \details encode() may be called concurrently from several threads.
class IEncoder {
public:
    virtual ~IEncoder() = default;

    [[nodiscard]] virtual int latent_channels() const = 0;
    [[nodiscard]] virtual int downsample_factor() const = 0;

    //! FP32 [B, 3, S, S] images to FP32 [B, C, S/f, S/f] latents.
    virtual void encode(const Tensor& images, Tensor& latents) const = 0;

    //! FP32 [B, C, h, w] latents to FP32 [B, 3, f*h, f*w] images in [0, 1].
    virtual void decode(const Tensor& latents, Tensor& images) const = 0;
};

#endif //TRANSFUSE_SRC_TRAINING_ENCODING_H
