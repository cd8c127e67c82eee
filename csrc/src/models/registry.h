// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include "training/model.h"

namespace models {

//! Settings shared by all model architectures.
struct ModelConfig {
    int VocabSize = 0;
    std::int32_t PadTokenId = 0;
    int LatentChannels = 4;
    int PatchSize = 2;
    float DiffusionLossWeight = 5.f;
    bool GradientCheckpointing = false;
    std::uint64_t Seed = 42;
};

/**
 * @brief Operations for a specific model architecture.
 */
struct ArchitectureOps {
    std::string_view name;
    std::string_view description;

    std::unique_ptr<IModel> (*create)(const ModelConfig& config);
};

const ArchitectureOps& architecture_from_name(std::string_view name);

//! Instantiates the model registered under `name`; throws std::runtime_error for unknown names.
std::unique_ptr<IModel> create_model(std::string_view name, const ModelConfig& config);

std::vector<std::string_view> supported_models();

bool is_supported_model(std::string_view name);

} // namespace models
