// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <cstdint>
#include <tuple>

#include "training/patchify.h"
#include "utilities/allocator.h"
#include "../utilities/test_config.h"
#include "../utilities/test_utils.h"

TEST_CASE("patchify: [1, 4, 32, 32] latents with patch size 2", "[patchify]") {
    TensorAllocator alloc;
    Tensor latents = alloc.allocate(ETensorDType::FP32, "latents", {1, 4, 32, 32});
    testing_utils::fill_tensor(latents, testing_utils::uniform_host(latents.nelem(), -3.f, 3.f));

    PatchGrid grid = PatchGrid::of_latents(latents, 2);
    REQUIRE(grid.patch_shape() == std::vector<long>{1, 256, 16});

    Tensor patches = alloc.allocate(ETensorDType::FP32, "patches", grid.patch_shape());
    patchify(latents, 2, patches);
    CHECK(patches.shape() == std::vector<long>{1, 256, 16});

    Tensor restored = alloc.allocate(ETensorDType::FP32, "restored", {1, 4, 32, 32});
    unpatchify(patches, 2, 1, 4, 32, 32, restored);
    CHECK(restored.shape() == std::vector<long>{1, 4, 32, 32});
    CHECK(tensors_equal(latents, restored));
}

TEST_CASE("patchify: features are ordered channel-major inside a patch", "[patchify]") {
    TensorAllocator alloc;
    const long B = 2, C = 3, H = 4, W = 6, p = 2;
    Tensor latents = alloc.allocate(ETensorDType::FP32, "latents", {B, C, H, W});
    float* in = latents.get<float>();
    for (long i = 0; i < latents.nelem(); ++i) in[i] = static_cast<float>(i);

    Tensor patches = alloc.allocate(ETensorDType::FP32, "patches", {B, (H / p) * (W / p), C * p * p});
    patchify(latents, p, patches);
    const float* out = patches.get<float>();

    for (long b = 0; b < B; ++b)
    for (long hp = 0; hp < H / p; ++hp)
    for (long wp = 0; wp < W / p; ++wp)
    for (long c = 0; c < C; ++c)
    for (long i = 0; i < p; ++i)
    for (long j = 0; j < p; ++j) {
        long row = b * (H / p) * (W / p) + hp * (W / p) + wp;
        long feature = c * p * p + i * p + j;
        long src = ((b * C + c) * H + hp * p + i) * W + wp * p + j;
        REQUIRE(out[row * C * p * p + feature] == in[src]);
    }
}

TEST_CASE("patchify: round trip is exact for many shapes", "[patchify]") {
    auto [B, C, H, W, p] = GENERATE(table<long, long, long, long, long>({
        {1, 1, 2, 2, 1},
        {1, 4, 8, 8, 2},
        {3, 4, 8, 16, 4},
        {2, 3, 6, 9, 3},
        {2, 4, 4, 4, 4},
    }));
    CAPTURE(B, C, H, W, p);

    TensorAllocator alloc;
    PatchGrid grid = PatchGrid::create(B, C, H, W, p);
    Tensor latents = alloc.allocate(ETensorDType::FP32, "latents", grid.latent_shape());
    testing_utils::fill_tensor(latents, testing_utils::uniform_host(latents.nelem(), -1.f, 1.f, B * 1000 + H));
    Tensor patches = alloc.allocate(ETensorDType::FP32, "patches", grid.patch_shape());
    Tensor restored = alloc.allocate(ETensorDType::FP32, "restored", grid.latent_shape());

    patchify(latents, p, patches);
    unpatchify(patches, p, B, C, H, W, restored);
    CHECK(tensors_equal(latents, restored));
}

TEST_CASE("patchify: works on the configured test size", "[patchify]") {
    const auto& cfg = testing_config::get_test_config();
    const long side = cfg.ImageSize / 8;
    TensorAllocator alloc;
    PatchGrid grid = PatchGrid::create(cfg.B, 4, side, side, cfg.PatchSize);
    Tensor latents = alloc.allocate(ETensorDType::FP32, "latents", grid.latent_shape());
    testing_utils::fill_tensor(latents, testing_utils::uniform_host(latents.nelem(), -1.f, 1.f));
    Tensor patches = alloc.allocate(ETensorDType::FP32, "patches", grid.patch_shape());
    Tensor restored = alloc.allocate(ETensorDType::FP32, "restored", grid.latent_shape());
    patchify(latents, cfg.PatchSize, patches);
    unpatchify(patches, cfg.PatchSize, cfg.B, 4, side, side, restored);
    CHECK(tensors_equal(latents, restored));
}

TEST_CASE("patchify: non-divisible sizes raise ShapeError", "[patchify]") {
    TensorAllocator alloc;
    CHECK_THROWS_AS(PatchGrid::create(1, 4, 30, 32, 4), ShapeError);
    CHECK_THROWS_AS(PatchGrid::create(1, 4, 32, 30, 4), ShapeError);
    CHECK_THROWS_AS(PatchGrid::create(1, 4, 32, 32, 0), ShapeError);

    Tensor latents = alloc.allocate(ETensorDType::FP32, "latents", {1, 4, 6, 6});
    Tensor patches = alloc.allocate(ETensorDType::FP32, "patches", {1, 4, 36});
    CHECK_THROWS_AS(patchify(latents, 4, patches), ShapeError);
}

TEST_CASE("patchify: wrong flattened width raises ShapeError", "[patchify]") {
    TensorAllocator alloc;
    Tensor latents = alloc.allocate(ETensorDType::FP32, "latents", {1, 4, 8, 8});
    Tensor wrong = alloc.allocate(ETensorDType::FP32, "patches", {1, 16, 12});
    CHECK_THROWS_AS(patchify(latents, 2, wrong), ShapeError);
    CHECK_THROWS_AS(unpatchify(wrong, 2, 1, 4, 8, 8, latents), ShapeError);

    Tensor ints = alloc.allocate(ETensorDType::INT32, "patches", {1, 16, 16});
    CHECK_THROWS_AS(patchify(latents, 2, ints), ShapeError);
}
