// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRANSFUSE_SRC_TRAINING_PAIRS_H
#define TRANSFUSE_SRC_TRAINING_PAIRS_H

#include <string>
#include <vector>

//! One raw training sample: a caption and the path of its image.
struct TextImagePair {
    std::string Text;
    std::string Image;

    bool operator==(const TextImagePair&) const = default;
};

//! Builds raw text-image pairs from source locations.
class IPairSource {
public:
    virtual ~IPairSource() = default;

    //! Throws if a source location cannot be read.
    virtual std::vector<TextImagePair> create_pairs(const std::vector<std::string>& sources) const = 0;
};

//! Writes `{"pairs": [{"text": ..., "image": ...}, ...]}` atomically.
void save_pairs(const std::string& file_name, const std::vector<TextImagePair>& pairs);

//! Reads a file written by save_pairs.
std::vector<TextImagePair> load_pairs(const std::string& file_name);

/**
 * @brief Loads the pair cache, constructing it from `sources` first if it does not exist.
 *
 * Failure to read the sources is propagated.
 */
std::vector<TextImagePair> ensure_pairs(const std::string& file_name, const IPairSource& source,
                                        const std::vector<std::string>& sources);

#endif //TRANSFUSE_SRC_TRAINING_PAIRS_H
