// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Tests for the reference tokenizer, image codec, pair source, model registry and renderer.

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <numeric>

#include "models/byte_tokenizer.h"
#include "models/directory_pair_source.h"
#include "models/flow_model.h"
#include "models/pooling_encoder.h"
#include "models/ppm_image.h"
#include "models/ppm_renderer.h"
#include "models/registry.h"
#include "training/patchify.h"
#include "utilities/allocator.h"
#include "../utilities/test_utils.h"

using testing_utils::TempDir;
namespace fs = std::filesystem;

namespace {

void write_text(const std::string& file_name, const std::string& content) {
    std::ofstream out(file_name, std::ios::binary);
    out << content;
}

models::RgbImage gradient_image(int width, int height) {
    models::RgbImage image;
    image.Width = width;
    image.Height = height;
    image.Pixels.resize(static_cast<std::size_t>(width) * height * 3);
    for (std::size_t i = 0; i < image.Pixels.size(); ++i) {
        image.Pixels[i] = static_cast<std::uint8_t>((i * 7) % 256);
    }
    return image;
}

models::ModelConfig tiny_config() {
    models::ModelConfig config;
    config.VocabSize = 257;
    config.PadTokenId = models::ByteTokenizer::EndOfText;
    config.LatentChannels = 4;
    config.PatchSize = 2;
    return config;
}

} // namespace

TEST_CASE("ByteTokenizer encodes raw bytes", "[models]") {
    models::ByteTokenizer tokenizer;
    CHECK(tokenizer.encode("Ab") == std::vector<std::int32_t>{65, 98});
    CHECK(tokenizer.encode("\xc3\xa9") == std::vector<std::int32_t>{0xc3, 0xa9});
    CHECK(tokenizer.encode("").empty());

    TensorAllocator allocator;
    Tensor ids = allocator.allocate(ETensorDType::INT32, "ids", {6});
    prepare_text(tokenizer, "hi", ids);
    const std::int32_t* data = ids.get<std::int32_t>();
    CHECK(data[0] == 'h');
    CHECK(data[1] == 'i');
    for (int i = 2; i < 6; ++i) {
        CHECK(data[i] == models::ByteTokenizer::EndOfText);
    }
}

TEST_CASE("PPM images survive a write and read", "[models]") {
    TempDir dir("ppm");
    models::RgbImage image = gradient_image(5, 3);
    models::write_ppm(dir / "nested/img.ppm", image);

    models::RgbImage read = models::read_ppm(dir / "nested/img.ppm");
    CHECK(read.Width == 5);
    CHECK(read.Height == 3);
    CHECK(read.Pixels == image.Pixels);

    write_text(dir / "bad.ppm", "P3\n1 1\n255\n0 0 0\n");
    CHECK_THROWS_AS(models::read_ppm(dir / "bad.ppm"), std::runtime_error);
    write_text(dir / "short.ppm", "P6\n4 4\n255\nabc");
    CHECK_THROWS_AS(models::read_ppm(dir / "short.ppm"), std::runtime_error);
    CHECK_THROWS_AS(models::read_ppm(dir / "missing.ppm"), std::runtime_error);
}

TEST_CASE("PpmImageReader resizes to the requested square", "[models]") {
    TempDir dir("ppm");
    models::RgbImage image;
    image.Width = 2;
    image.Height = 2;
    image.Pixels = {255, 0, 0, 0, 255, 0, 0, 0, 255, 255, 255, 255};
    models::write_ppm(dir / "quad.ppm", image);

    TensorAllocator allocator;
    Tensor target = allocator.allocate(ETensorDType::FP32, "image", {3, 4, 4});
    models::PpmImageReader reader;
    reader.load_image(dir / "quad.ppm", 4, target);
    auto values = testing_utils::to_vector(target);
    // top-left quadrant is red, bottom-right is white
    CHECK(values[0] == 1.f);
    CHECK(values[16] == 0.f);
    CHECK(values[32] == 0.f);
    CHECK(values[15] == 1.f);
    CHECK(values[16 + 15] == 1.f);
    CHECK(values[32 + 15] == 1.f);

    Tensor wrong = allocator.allocate(ETensorDType::FP32, "wrong", {3, 8, 8});
    CHECK_THROWS_AS(reader.load_image(dir / "quad.ppm", 4, wrong), ShapeError);
}

TEST_CASE("PoolingEncoder maps images to latents and back", "[models]") {
    models::PoolingEncoder encoder;
    TensorAllocator allocator;
    Tensor images = allocator.allocate(ETensorDType::FP32, "images", {2, 3, 16, 24});
    testing_utils::fill_tensor(images, std::vector<float>(images.nelem(), 0.75f));
    Tensor latents = allocator.allocate(ETensorDType::FP32, "latents", {2, 4, 2, 3});
    encoder.encode(images, latents);
    for (float v : testing_utils::to_vector(latents)) {
        CHECK(v == Catch::Approx(0.5f));
    }

    Tensor decoded = allocator.allocate(ETensorDType::FP32, "decoded", {2, 3, 16, 24});
    encoder.decode(latents, decoded);
    for (float v : testing_utils::to_vector(decoded)) {
        CHECK(v == Catch::Approx(0.75f));
    }

    Tensor bad = allocator.allocate(ETensorDType::FP32, "bad", {2, 3, 12, 16});
    CHECK_THROWS_AS(encoder.encode(bad, latents), ShapeError);
}

TEST_CASE("DirectoryPairSource pairs images with captions", "[models]") {
    TempDir dir("pairs");
    fs::create_directories(dir / "a");
    fs::create_directories(dir / "b");
    models::write_ppm(dir / "a/02.ppm", gradient_image(2, 2));
    models::write_ppm(dir / "a/01.ppm", gradient_image(2, 2));
    models::write_ppm(dir / "a/03.ppm", gradient_image(2, 2));
    write_text(dir / "a/01.txt", "first\n");
    write_text(dir / "a/02.txt", "second\r\n");
    models::write_ppm(dir / "b/x.ppm", gradient_image(2, 2));
    write_text(dir / "b/x.txt", "other");

    models::DirectoryPairSource source;
    auto pairs = source.create_pairs({dir / "a", dir / "b"});
    REQUIRE(pairs.size() == 3);
    TextImagePair expected_first{"first", (fs::path(dir / "a") / "01.ppm").string()};
    TextImagePair expected_second{"second", (fs::path(dir / "a") / "02.ppm").string()};
    CHECK(pairs[0] == expected_first);
    CHECK(pairs[1] == expected_second);
    CHECK(pairs[2].Text == "other");

    CHECK_THROWS_AS(source.create_pairs({dir / "missing"}), std::runtime_error);
}

TEST_CASE("Model registry creates known architectures", "[models]") {
    CHECK(models::is_supported_model("flow-tiny"));
    CHECK_FALSE(models::is_supported_model("no-such-model"));
    CHECK_THROWS(models::create_model("no-such-model", tiny_config()));

    auto model = models::create_model("flow-tiny", tiny_config());
    CHECK(model->num_parameters() == 257 + 16 * 16 + 16 + 16);

    models::ModelConfig bad = tiny_config();
    bad.PadTokenId = 300;
    CHECK_THROWS_AS(models::create_model("flow-tiny", bad), std::invalid_argument);
}

TEST_CASE("FlowTinyModel losses and gradients", "[models]") {
    models::FlowTinyModel model(tiny_config());
    TensorAllocator allocator;

    Tensor ids = allocator.allocate(ETensorDType::INT32, "ids", {2, 6});
    models::ByteTokenizer tokenizer;
    Tensor first = reshape(slice(ids, 0, 0, 1), {6});
    Tensor second = reshape(slice(ids, 0, 1, 2), {6});
    prepare_text(tokenizer, "abc", first);
    prepare_text(tokenizer, "hello", second);

    Tensor patches = allocator.allocate(ETensorDType::FP32, "patches", {2, 4, 16});
    testing_utils::fill_tensor(patches, testing_utils::uniform_host(2 * 4 * 16, -1.f, 1.f));

    CHECK_THROWS_AS(model.backward(), std::logic_error);

    ModelInput input;
    input.InputIds = ids;
    input.Patches = patches;
    input.Timesteps = {0.2f, 0.7f};
    ModelOutput output = model.forward_and_loss(input);

    // logits start at zero, so the text loss is the uniform cross entropy
    CHECK(output.Losses.Text == Catch::Approx(std::log(257.0)).epsilon(1e-4));
    CHECK(output.Losses.Diffusion > 0.f);
    CHECK(output.Loss == Catch::Approx(output.Losses.Text + 5.f * output.Losses.Diffusion));
    CHECK(output.Diagnostics.PredFlow.shape() == patches.shape());
    CHECK(output.Diagnostics.NoisedImage.shape() == patches.shape());

    model.backward();
    auto logits_grad = testing_utils::to_vector(static_cast<TensorStore&>(model.gradients()).get("text.logits"));
    CHECK(std::accumulate(logits_grad.begin(), logits_grad.end(), 0.0) == Catch::Approx(0.0).margin(1e-5));
    auto bias_grad = testing_utils::to_vector(static_cast<TensorStore&>(model.gradients()).get("image.bias"));
    bool any_nonzero = false;
    for (float g : bias_grad) {
        CHECK(std::isfinite(g));
        any_nonzero = any_nonzero || g != 0.f;
    }
    CHECK(any_nonzero);

    ModelInput mismatched = input;
    mismatched.Timesteps = {0.5f};
    CHECK_THROWS_AS(model.forward_and_loss(mismatched), ShapeError);
}

TEST_CASE("PpmDiagnosticRenderer writes decoded images", "[models]") {
    TempDir dir("render");
    models::PoolingEncoder encoder;
    models::PpmDiagnosticRenderer renderer(dir / "out", encoder);
    TensorAllocator allocator;

    // no preview set: nothing to render
    renderer.render_inference(0, 10);
    CHECK(renderer.written().empty());

    Tensor preview = allocator.allocate(ETensorDType::FP32, "preview", {1, 4, 2, 2});
    renderer.set_preview(preview);
    renderer.render_inference(1, 20);
    REQUIRE(renderer.written().size() == 1);
    CHECK(fs::path(renderer.written()[0]).filename() == "inference_epoch_1_step_20.ppm");
    models::RgbImage image = models::read_ppm(renderer.written()[0]);
    CHECK(image.Width == 16);
    CHECK(image.Height == 16);

    Tensor latents = allocator.allocate(ETensorDType::FP32, "latents", {2, 4, 4, 4});
    testing_utils::fill_tensor(latents, testing_utils::uniform_host(latents.nelem(), -1.f, 1.f));
    Tensor patches = allocator.allocate(ETensorDType::FP32, "patches", {2, 4, 16});
    patchify(latents, 2, patches);

    DiagnosticBundle bundle;
    bundle.Latents = patches;
    bundle.PredFlow = patches;
    UnpatchifyFn to_grid = [](const Tensor& p, TensorAllocator& alloc) {
        Tensor grid = alloc.allocate(ETensorDType::FP32, "grid", {2, 4, 4, 4});
        unpatchify(p, 2, 2, 4, 4, 4, grid);
        return grid;
    };
    renderer.render_debug(bundle, to_grid, 0, 3);
    REQUIRE(renderer.written().size() == 3);
    CHECK(fs::path(renderer.written()[1]).filename() == "debug_epoch_0_step_3_latents.ppm");
    CHECK(fs::path(renderer.written()[2]).filename() == "debug_epoch_0_step_3_pred_flow.ppm");
    CHECK(fs::exists(renderer.written()[2]));

    Tensor not_an_image = allocator.allocate(ETensorDType::FP32, "x", {1, 4, 8, 8});
    CHECK_THROWS_AS(renderer.save_sample(not_an_image, "x"), ShapeError);
}
