// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRANSFUSE_SRC_MODELS_BYTE_TOKENIZER_H
#define TRANSFUSE_SRC_MODELS_BYTE_TOKENIZER_H

#include "training/encoding.h"

namespace models {

//! One token per UTF-8 byte (ids 0..255) plus an end-of-text token (256) that also serves as padding.
class ByteTokenizer : public ITokenizer {
public:
    static constexpr std::int32_t EndOfText = 256;

    [[nodiscard]] std::vector<std::int32_t> encode(const std::string& text) const override;
    [[nodiscard]] int vocab_size() const override { return 257; }
    [[nodiscard]] std::int32_t eos_token_id() const override { return EndOfText; }
    [[nodiscard]] std::int32_t pad_token_id() const override { return EndOfText; }
};

} // namespace models

#endif //TRANSFUSE_SRC_MODELS_BYTE_TOKENIZER_H
