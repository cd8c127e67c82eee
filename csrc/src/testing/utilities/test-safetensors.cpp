// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>

#include "utilities/safetensors.h"
#include "utilities/tensor_store.h"
#include "test_utils.h"

using testing_utils::TempDir;

namespace {

TensorStore make_store() {
    TensorStore store;
    Tensor weights = store.add("layer.weight", ETensorDType::FP32, {3, 4});
    testing_utils::fill_tensor(weights, testing_utils::uniform_host(12, -1.f, 1.f, 7));
    Tensor ids = store.add("input_ids", ETensorDType::INT32, {2, 5});
    for (long i = 0; i < ids.nelem(); ++i) {
        ids.get<std::int32_t>()[i] = static_cast<std::int32_t>(i * 3);
    }
    return store;
}

} // namespace

TEST_CASE("safetensors: written tensors read back bit-identical", "[safetensors]") {
    TempDir dir("safetensors");
    std::string file = dir / "store.safetensors";

    TensorStore original = make_store();
    write_safetensors(file, original, {{"batch_size", "2"}});

    REQUIRE(std::filesystem::exists(file));
    REQUIRE_FALSE(std::filesystem::exists(file + ".tmp"));

    SafeTensorsReader reader(file);
    CHECK(reader.has_entry("layer.weight"));
    CHECK(reader.has_entry("input_ids"));
    CHECK_FALSE(reader.has_entry("missing"));
    CHECK(reader.metadata().at("batch_size") == "2");
    CHECK(reader.find_entry("input_ids").dtype() == ETensorDType::INT32);
    CHECK(reader.find_entry("layer.weight").shape() == std::vector<long>{3, 4});

    TensorStore loaded;
    reader.read_all(loaded);
    CHECK(containers_equal(original, loaded));
}

TEST_CASE("safetensors: load_safetensors fills an existing container", "[safetensors]") {
    TempDir dir("safetensors");
    std::string file = dir / "store.safetensors";
    TensorStore original = make_store();
    write_safetensors(file, original);

    TensorStore target;
    target.add("layer.weight", ETensorDType::FP32, {3, 4});
    target.add("input_ids", ETensorDType::INT32, {2, 5});
    load_safetensors(file, target);
    CHECK(containers_equal(original, target));
}

TEST_CASE("safetensors: shape mismatch is rejected", "[safetensors]") {
    TempDir dir("safetensors");
    std::string file = dir / "store.safetensors";
    TensorStore original = make_store();
    write_safetensors(file, original);

    TensorStore target;
    Tensor wrong = target.add("layer.weight", ETensorDType::FP32, {4, 3});
    SafeTensorsReader reader(file);
    CHECK_THROWS(reader.find_entry("layer.weight").read_tensor(wrong));
    CHECK_THROWS(reader.find_entry("does.not.exist"));
}

TEST_CASE("safetensors: missing or truncated files throw", "[safetensors]") {
    TempDir dir("safetensors");
    CHECK_THROWS(SafeTensorsReader(dir / "absent.safetensors"));

    std::string file = dir / "short.safetensors";
    {
        std::ofstream out(file, std::ios::binary);
        out << "abc";
    }
    CHECK_THROWS(SafeTensorsReader(file));
}
