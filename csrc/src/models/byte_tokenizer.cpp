// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "models/byte_tokenizer.h"

namespace models {

std::vector<std::int32_t> ByteTokenizer::encode(const std::string& text) const {
    std::vector<std::int32_t> tokens;
    tokens.reserve(text.size());
    for (char c : text) {
        tokens.push_back(static_cast<std::int32_t>(static_cast<unsigned char>(c)));
    }
    return tokens;
}

} // namespace models
