// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRANSFUSE_SRC_MODELS_PPM_IMAGE_H
#define TRANSFUSE_SRC_MODELS_PPM_IMAGE_H

#include <cstdint>
#include <string>
#include <vector>

#include "training/encoding.h"

namespace models {

//! 8-bit RGB image, interleaved row-major.
struct RgbImage {
    int Width = 0;
    int Height = 0;
    std::vector<std::uint8_t> Pixels;
};

//! Reads a binary (P6) PPM file with maxval 255. Throws std::runtime_error on malformed input.
RgbImage read_ppm(const std::string& file_name);
void write_ppm(const std::string& file_name, const RgbImage& image);

//! Converts a FP32 [3, H, W] tensor with values in [0, 1] to 8 bit.
RgbImage image_from_tensor(const Tensor& chw);

//! Loads PPM files, resizes them to S x S (nearest neighbor) and scales to [0, 1].
class PpmImageReader : public IImageReader {
public:
    void load_image(const std::string& path, int image_size, Tensor& target) const override;
};

} // namespace models

#endif //TRANSFUSE_SRC_MODELS_PPM_IMAGE_H
