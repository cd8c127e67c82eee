// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "models/registry.h"

#include <stdexcept>
#include <string>

#include <fmt/core.h>

#include "models/flow_model.h"

namespace models {

static const std::vector<ArchitectureOps>& registry() {
    static const std::vector<ArchitectureOps> kRegistry = {
        FlowTinyModel::ops(),
    };
    return kRegistry;
}

const ArchitectureOps& architecture_from_name(std::string_view name) {
    for (const auto& ops : registry()) {
        if (ops.name == name) return ops;
    }

    // Build helpful error message listing supported models
    std::string supported;
    for (const auto& ops : registry()) {
        if (!supported.empty()) supported += ", ";
        supported += ops.name;
    }
    throw std::runtime_error(fmt::format(
        "Unknown model '{}'. Supported models: {}",
        name, supported));
}

std::unique_ptr<IModel> create_model(std::string_view name, const ModelConfig& config) {
    return architecture_from_name(name).create(config);
}

std::vector<std::string_view> supported_models() {
    std::vector<std::string_view> out;
    out.reserve(registry().size());
    for (const auto& ops : registry()) out.push_back(ops.name);
    return out;
}

bool is_supported_model(std::string_view name) {
    for (const auto& ops : registry()) {
        if (ops.name == name) return true;
    }
    return false;
}

} // namespace models
