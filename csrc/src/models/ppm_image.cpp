// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "models/ppm_image.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <fmt/core.h>

namespace models {

namespace {

//! Reads the next whitespace separated header token, skipping `#` comments.
std::string next_token(std::istream& in) {
    std::string token;
    while (in) {
        int c = in.get();
        if (c == '#') {
            std::string comment;
            std::getline(in, comment);
            continue;
        }
        if (c == EOF) break;
        if (std::isspace(c)) {
            if (!token.empty()) break;
            continue;
        }
        token.push_back(static_cast<char>(c));
    }
    return token;
}

int parse_positive(const std::string& token, const std::string& file_name) {
    int value = 0;
    try {
        value = std::stoi(token);
    } catch (const std::exception&) {
        throw std::runtime_error(fmt::format("Malformed PPM header in '{}': `{}`", file_name, token));
    }
    if (value <= 0) {
        throw std::runtime_error(fmt::format("Malformed PPM header in '{}': `{}`", file_name, token));
    }
    return value;
}

} // namespace

/**
 * @brief Read a binary PPM image.
 *
 * @param file_name Path of the `.ppm` file.
 * @return Decoded image.
 * @throws std::runtime_error If the file cannot be opened, is not P6 with maxval 255, or is truncated.
 */
RgbImage read_ppm(const std::string& file_name) {
    std::ifstream file(file_name, std::ios_base::binary);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("could not open image '{}'", file_name));
    }
    if (next_token(file) != "P6") {
        throw std::runtime_error(fmt::format("'{}' is not a binary PPM (P6) file", file_name));
    }
    RgbImage image;
    image.Width = parse_positive(next_token(file), file_name);
    image.Height = parse_positive(next_token(file), file_name);
    if (parse_positive(next_token(file), file_name) != 255) {
        throw std::runtime_error(fmt::format("'{}': only maxval 255 is supported", file_name));
    }
    // next_token consumed the single whitespace after maxval
    image.Pixels.resize(static_cast<std::size_t>(image.Width) * image.Height * 3);
    file.read(reinterpret_cast<char*>(image.Pixels.data()), static_cast<std::streamsize>(image.Pixels.size()));
    if (!file) {
        throw std::runtime_error(fmt::format("'{}' is truncated", file_name));
    }
    return image;
}

void write_ppm(const std::string& file_name, const RgbImage& image) {
    std::filesystem::path target(file_name);
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path());
    }
    std::ofstream file(file_name, std::ios_base::binary);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("could not open '{}' for writing", file_name));
    }
    file << "P6\n" << image.Width << " " << image.Height << "\n255\n";
    file.write(reinterpret_cast<const char*>(image.Pixels.data()), static_cast<std::streamsize>(image.Pixels.size()));
    if (!file) {
        throw std::runtime_error(fmt::format("error writing '{}'", file_name));
    }
}

RgbImage image_from_tensor(const Tensor& chw) {
    if (chw.Rank != 3 || chw.Sizes[0] != 3) {
        throw ShapeError(fmt::format("Expected an image tensor [3, H, W], got {}", shape_to_string(chw)));
    }
    RgbImage image;
    image.Height = static_cast<int>(chw.Sizes[1]);
    image.Width = static_cast<int>(chw.Sizes[2]);
    image.Pixels.resize(static_cast<std::size_t>(image.Width) * image.Height * 3);
    const float* data = chw.get<float>();
    const long plane = chw.Sizes[1] * chw.Sizes[2];
    for (long p = 0; p < plane; ++p) {
        for (long c = 0; c < 3; ++c) {
            float v = std::clamp(data[c * plane + p], 0.f, 1.f);
            image.Pixels[p * 3 + c] = static_cast<std::uint8_t>(std::lround(v * 255.f));
        }
    }
    return image;
}

void PpmImageReader::load_image(const std::string& path, int image_size, Tensor& target) const {
    if (target.shape() != std::vector<long>{3, image_size, image_size} || target.DType != ETensorDType::FP32) {
        throw ShapeError(fmt::format("Expected FP32 [3, {0}, {0}] image target, got {1}", image_size, shape_to_string(target)));
    }
    RgbImage image = read_ppm(path);
    float* out = target.get<float>();
    const long S = image_size;
    for (long y = 0; y < S; ++y) {
        const long sy = y * image.Height / S;
        for (long x = 0; x < S; ++x) {
            const long sx = x * image.Width / S;
            const std::uint8_t* px = image.Pixels.data() + (sy * image.Width + sx) * 3;
            for (long c = 0; c < 3; ++c) {
                out[(c * S + y) * S + x] = static_cast<float>(px[c]) / 255.f;
            }
        }
    }
}

} // namespace models
