// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "models/directory_pair_source.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <fmt/core.h>

namespace models {

namespace {

std::string read_caption(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("could not open caption '{}'", path.string()));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string caption = buffer.str();
    while (!caption.empty() && (caption.back() == '\n' || caption.back() == '\r')) {
        caption.pop_back();
    }
    return caption;
}

} // namespace

std::vector<TextImagePair> DirectoryPairSource::create_pairs(const std::vector<std::string>& sources) const {
    std::vector<TextImagePair> pairs;
    for (const auto& source : sources) {
        if (!std::filesystem::is_directory(source)) {
            throw std::runtime_error(fmt::format("pair source `{}` is not a directory", source));
        }

        std::vector<std::filesystem::path> images;
        for (const auto& entry : std::filesystem::directory_iterator(source)) {
            if (entry.is_regular_file() && entry.path().extension() == ".ppm") {
                images.push_back(entry.path());
            }
        }
        std::sort(images.begin(), images.end());

        for (const auto& image : images) {
            std::filesystem::path caption = image;
            caption.replace_extension(".txt");
            if (!std::filesystem::is_regular_file(caption)) {
                continue;
            }
            pairs.push_back(TextImagePair{read_caption(caption), image.string()});
        }
    }
    return pairs;
}

} // namespace models
