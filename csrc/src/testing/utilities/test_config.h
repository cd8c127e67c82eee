// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdio>
#include <cstdlib>

namespace testing_config {

struct TestSizeConfig {
    int B = 2;              // raw batch size
    int ImageSize = 32;
    int PatchSize = 2;
    int MaxLength = 16;
};

inline TestSizeConfig& mutable_cfg() {
    static TestSizeConfig cfg{};
    return cfg;
}

inline void set_test_config(const TestSizeConfig& cfg) {
    if(cfg.ImageSize % 8 != 0 || (cfg.ImageSize / 8) % cfg.PatchSize != 0) {
        fprintf(stderr, "ERROR: image size must be a multiple of 8 and the latent side divisible by the patch size\n");
        exit(EXIT_FAILURE);
    }
    mutable_cfg() = cfg;
}

inline const TestSizeConfig& get_test_config() {
    return mutable_cfg();
}

} // namespace testing_config
