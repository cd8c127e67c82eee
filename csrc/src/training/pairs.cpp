// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "pairs.h"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

void save_pairs(const std::string& file_name, const std::vector<TextImagePair>& pairs) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& pair : pairs) {
        list.push_back({{"text", pair.Text}, {"image", pair.Image}});
    }
    nlohmann::json document;
    document["pairs"] = std::move(list);

    std::filesystem::path target(file_name);
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path());
    }
    std::string tmp_name = file_name + ".tmp";
    {
        std::ofstream file(tmp_name);
        if (!file.is_open()) {
            throw std::runtime_error(fmt::format("could not open pair file {} for writing", tmp_name));
        }
        file << std::setw(2) << document;
        if (!file.good()) {
            throw std::runtime_error(fmt::format("error writing pair file {}", tmp_name));
        }
    }
    std::filesystem::rename(tmp_name, target);
}

/**
 * @brief Read text-image pairs from a JSON pair cache.
 *
 * @param file_name Path of the pair cache.
 * @return Pairs in file order.
 * @throws std::runtime_error If the file cannot be opened or lacks the `pairs` list.
 * @throws nlohmann::json::exception On malformed JSON.
 */
std::vector<TextImagePair> load_pairs(const std::string& file_name) {
    std::ifstream file(file_name);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("could not open pair file {}", file_name));
    }
    nlohmann::json document = nlohmann::json::parse(file);
    if (!document.contains("pairs") || !document["pairs"].is_array()) {
        throw std::runtime_error(fmt::format("pair file {} has no `pairs` list", file_name));
    }

    std::vector<TextImagePair> pairs;
    for (const auto& entry : document["pairs"]) {
        pairs.push_back(TextImagePair{entry.at("text").get<std::string>(), entry.at("image").get<std::string>()});
    }
    return pairs;
}

std::vector<TextImagePair> ensure_pairs(const std::string& file_name, const IPairSource& source,
                                        const std::vector<std::string>& sources) {
    if (!std::filesystem::exists(file_name)) {
        save_pairs(file_name, source.create_pairs(sources));
    }
    return load_pairs(file_name);
}
