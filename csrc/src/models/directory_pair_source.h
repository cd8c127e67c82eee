// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRANSFUSE_SRC_MODELS_DIRECTORY_PAIR_SOURCE_H
#define TRANSFUSE_SRC_MODELS_DIRECTORY_PAIR_SOURCE_H

#include "training/pairs.h"

namespace models {

//! \brief Pairs every `<name>.ppm` in a source directory with the caption in `<name>.txt`.
//! \details Images without a caption are skipped. Within a directory pairs are sorted by file name;
//! directories are visited in the given order.
class DirectoryPairSource : public IPairSource {
public:
    //! Throws std::runtime_error if a source is not a readable directory.
    std::vector<TextImagePair> create_pairs(const std::vector<std::string>& sources) const override;
};

} // namespace models

#endif //TRANSFUSE_SRC_MODELS_DIRECTORY_PAIR_SOURCE_H
