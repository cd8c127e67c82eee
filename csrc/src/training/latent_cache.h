// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRANSFUSE_SRC_TRAINING_LATENT_CACHE_H
#define TRANSFUSE_SRC_TRAINING_LATENT_CACHE_H

#include <string>
#include <vector>

#include "pairs.h"
#include "utilities/tensor.h"
#include "utilities/worker_pool.h"

class ITokenizer;
class IImageReader;
class IEncoder;

//! Description of a complete cache for one batch size; stored as `batch_{bs}.json` next to the shards.
struct CacheManifest {
    int BatchSize = 0;
    int NumShards = 0;
    int MaxLength = 0;
    int ImageSize = 0;
    std::vector<long> LatentShape;      //!< per-sample [C, h, w]

    bool operator==(const CacheManifest&) const = default;
};

struct LatentCacheConfig {
    std::string Directory = "dataset_cache";
    int MaxLength = 128;        //!< token ids per sample
    int ImageSize = 256;        //!< raw image side length
    bool ShowProgress = false;
};

struct CacheBuildResult {
    int NumShards = 0;
    bool Built = false;         //!< false if an existing complete cache was reused
};

/**
 * @brief Materializes encoded latents on disk, one shard per raw batch.
 *
 * Shard `i` of batch size `bs` is `batch_{bs}_{i}.safetensors` with tensors `input_ids`
 * (INT32 [bs, L]) and `image_latents` (FP32 [bs, C, h, w]). A cache for a given batch size is
 * either complete (manifest plus all shards) or rebuilt from scratch.
 */
class LatentCache {
public:
    LatentCache(LatentCacheConfig config, const ITokenizer& tokenizer, const IImageReader& images,
                const IEncoder& encoder, WorkerPool pool);

    /**
     * @brief Encodes `pairs` in dataset order into shards of `batch_size` samples.
     *
     * Trailing pairs that do not fill a batch are dropped. Does nothing if a complete cache
     * for this configuration exists and `force` is not set.
     */
    CacheBuildResult build(const std::vector<TextImagePair>& pairs, int batch_size, bool force);

    //! True if the manifest matches this configuration and every shard file exists.
    [[nodiscard]] bool is_complete(int batch_size, int num_shards) const;

    [[nodiscard]] CacheManifest expected_manifest(int batch_size, int num_shards) const;
    [[nodiscard]] const std::string& directory() const { return mConfig.Directory; }

    static std::string shard_name(int batch_size, int index);
    static std::string manifest_name(int batch_size);

private:
    void remove_shards(int batch_size) const;
    void encode_shard(const std::vector<TextImagePair>& pairs, int batch_size, int index) const;

    LatentCacheConfig mConfig;
    const ITokenizer* mTokenizer;
    const IImageReader* mImages;
    const IEncoder* mEncoder;
    WorkerPool mPool;
};

//! Reads the manifest of the cache in `directory` for `batch_size`. Throws if missing or invalid.
CacheManifest read_cache_manifest(const std::string& directory, int batch_size);

//! Shard indices of `batch_size` present in `directory`, ascending.
std::vector<int> list_shards(const std::string& directory, int batch_size);

/**
 * @brief Read-only, index-ordered view of a complete latent cache.
 */
class CachedDataset {
public:
    //! Throws std::runtime_error if the cache for `batch_size` is missing or incomplete.
    CachedDataset(std::string directory, int batch_size);

    [[nodiscard]] int size() const { return mManifest.NumShards; }
    [[nodiscard]] int batch_size() const { return mManifest.BatchSize; }
    [[nodiscard]] int max_length() const { return mManifest.MaxLength; }
    [[nodiscard]] const std::vector<long>& latent_shape() const { return mManifest.LatentShape; }
    [[nodiscard]] const CacheManifest& manifest() const { return mManifest; }

    [[nodiscard]] std::string path(int index) const;

    //! Reads shard `index` into `input_ids` (INT32 [bs, L]) and `latents` (FP32 [bs, C, h, w]).
    void load(int index, Tensor& input_ids, Tensor& latents) const;

private:
    std::string mDirectory;
    CacheManifest mManifest;
};

#endif //TRANSFUSE_SRC_TRAINING_LATENT_CACHE_H
