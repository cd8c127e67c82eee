// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "encoding.h"

#include <algorithm>

#include <fmt/core.h>

void prepare_text(const ITokenizer& tokenizer, const std::string& text, Tensor& target) {
    if (target.Rank != 1 || target.Sizes[0] < 1) {
        throw ShapeError(fmt::format("Token target must be a non-empty vector, got {}", shape_to_string(target)));
    }
    std::int32_t* out = target.get<std::int32_t>();
    const long length = target.Sizes[0];

    std::vector<std::int32_t> tokens = tokenizer.encode(text);
    long n = std::min<long>(static_cast<long>(tokens.size()), length - 1);
    std::copy_n(tokens.begin(), n, out);
    out[n] = tokenizer.eos_token_id();
    std::fill(out + n + 1, out + length, tokenizer.pad_token_id());
}
