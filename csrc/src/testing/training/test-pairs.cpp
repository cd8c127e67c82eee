// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Tests for text preparation and the pair cache.

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

#include "training/encoding.h"
#include "training/pairs.h"
#include "utilities/allocator.h"
#include "../utilities/test_utils.h"
#include "fakes.h"

using testing_utils::TempDir;

namespace {

class CountingSource : public IPairSource {
public:
    std::vector<TextImagePair> create_pairs(const std::vector<std::string>& sources) const override {
        ++calls;
        if (sources.empty()) {
            throw std::runtime_error("no sources");
        }
        return testing_fakes::make_pairs(3);
    }
    mutable int calls = 0;
};

} // namespace

TEST_CASE("prepare_text terminates, truncates and pads", "[pairs]") {
    testing_fakes::CharTokenizer tokenizer;
    TensorAllocator allocator;
    Tensor ids = allocator.allocate(ETensorDType::INT32, "ids", {5});

    SECTION("short text is padded") {
        prepare_text(tokenizer, "ab", ids);
        const std::int32_t* data = ids.get<std::int32_t>();
        CHECK(data[2] == tokenizer.eos_token_id());
        CHECK(data[3] == tokenizer.pad_token_id());
        CHECK(data[4] == tokenizer.pad_token_id());
    }

    SECTION("long text keeps room for the end token") {
        prepare_text(tokenizer, "abcdefgh", ids);
        const std::int32_t* data = ids.get<std::int32_t>();
        CHECK(data[3] == tokenizer.encode("d").at(0));
        CHECK(data[4] == tokenizer.eos_token_id());
    }

    SECTION("targets must be vectors") {
        Tensor matrix = allocator.allocate(ETensorDType::INT32, "matrix", {2, 5});
        CHECK_THROWS_AS(prepare_text(tokenizer, "ab", matrix), ShapeError);
    }
}

TEST_CASE("ensure_pairs builds the pair cache once", "[pairs]") {
    TempDir dir("pairs");
    CountingSource source;
    const std::string file_name = dir / "cache/pairs.json";

    auto first = ensure_pairs(file_name, source, {"a"});
    auto second = ensure_pairs(file_name, source, {"a"});
    CHECK(source.calls == 1);
    CHECK(first == testing_fakes::make_pairs(3));
    CHECK(second == first);
    CHECK(load_pairs(file_name) == first);
}

TEST_CASE("ensure_pairs propagates source failures", "[pairs]") {
    TempDir dir("pairs");
    CountingSource source;
    CHECK_THROWS_AS(ensure_pairs(dir / "pairs.json", source, {}), std::runtime_error);
    CHECK_THROWS_AS(load_pairs(dir / "pairs.json"), std::runtime_error);
}

TEST_CASE("load_pairs rejects files without a pair list", "[pairs]") {
    TempDir dir("pairs");
    save_pairs(dir / "empty.json", {});
    CHECK(load_pairs(dir / "empty.json").empty());

    {
        std::ofstream out(dir / "other.json");
        out << R"({"items": []})";
    }
    CHECK_THROWS_AS(load_pairs(dir / "other.json"), std::runtime_error);
}
