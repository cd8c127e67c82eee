// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "latent_cache.h"

#include <atomic>
#include <algorithm>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <stdexcept>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "encoding.h"
#include "utilities/safetensors.h"
#include "utilities/tensor_store.h"
#include "utilities/utils.h"

namespace {

//! Parses the shard index out of `batch_{bs}_{i}.safetensors`; -1 if the name does not match.
int parse_shard_index(const std::string& file_name, int batch_size) {
    const std::string prefix = fmt::format("batch_{}_", batch_size);
    const std::string suffix = ".safetensors";
    if (!file_name.starts_with(prefix) || !file_name.ends_with(suffix)) {
        return -1;
    }
    const char* first = file_name.data() + prefix.size();
    const char* last = file_name.data() + file_name.size() - suffix.size();
    if (first == last) {
        return -1;
    }
    int index = -1;
    auto [ptr, ec] = std::from_chars(first, last, index);
    if (ec != std::errc{} || ptr != last || index < 0) {
        return -1;
    }
    return index;
}

nlohmann::json manifest_to_json(const CacheManifest& manifest) {
    return nlohmann::json{
        {"batch_size", manifest.BatchSize},
        {"num_shards", manifest.NumShards},
        {"max_length", manifest.MaxLength},
        {"image_size", manifest.ImageSize},
        {"latent_shape", manifest.LatentShape},
    };
}

void write_manifest(const std::string& directory, const CacheManifest& manifest) {
    std::string file_name = directory + "/" + LatentCache::manifest_name(manifest.BatchSize);
    std::string tmp_name = file_name + ".tmp";
    {
        std::ofstream file(tmp_name);
        if (!file.is_open()) {
            throw std::runtime_error(fmt::format("could not open cache manifest {} for writing", tmp_name));
        }
        file << std::setw(2) << manifest_to_json(manifest);
        if (!file.good()) {
            throw std::runtime_error(fmt::format("error writing cache manifest {}", tmp_name));
        }
    }
    std::filesystem::rename(tmp_name, file_name);
}

} // namespace

CacheManifest read_cache_manifest(const std::string& directory, int batch_size) {
    std::string file_name = directory + "/" + LatentCache::manifest_name(batch_size);
    std::ifstream file(file_name);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("could not open cache manifest {}", file_name));
    }
    nlohmann::json data = nlohmann::json::parse(file);
    CacheManifest manifest;
    manifest.BatchSize = data.at("batch_size").get<int>();
    manifest.NumShards = data.at("num_shards").get<int>();
    manifest.MaxLength = data.at("max_length").get<int>();
    manifest.ImageSize = data.at("image_size").get<int>();
    manifest.LatentShape = data.at("latent_shape").get<std::vector<long>>();
    if (manifest.BatchSize != batch_size || manifest.LatentShape.size() != 3) {
        throw std::runtime_error(fmt::format("invalid cache manifest {}", file_name));
    }
    return manifest;
}

std::vector<int> list_shards(const std::string& directory, int batch_size) {
    std::vector<int> indices;
    if (!std::filesystem::is_directory(directory)) {
        return indices;
    }
    for (const auto& entry : std::filesystem::directory_iterator(directory)) {
        if (!entry.is_regular_file()) continue;
        int index = parse_shard_index(entry.path().filename().string(), batch_size);
        if (index >= 0) {
            indices.push_back(index);
        }
    }
    std::sort(indices.begin(), indices.end());
    return indices;
}

LatentCache::LatentCache(LatentCacheConfig config, const ITokenizer& tokenizer, const IImageReader& images,
                         const IEncoder& encoder, WorkerPool pool) :
    mConfig(std::move(config)), mTokenizer(&tokenizer), mImages(&images), mEncoder(&encoder), mPool(pool) {
    if (mConfig.MaxLength <= 0 || mConfig.ImageSize <= 0 || mConfig.ImageSize % mEncoder->downsample_factor() != 0) {
        throw std::invalid_argument(fmt::format("Invalid cache configuration: max_length {}, image_size {}",
                                                mConfig.MaxLength, mConfig.ImageSize));
    }
}

std::string LatentCache::shard_name(int batch_size, int index) {
    return fmt::format("batch_{}_{}.safetensors", batch_size, index);
}

std::string LatentCache::manifest_name(int batch_size) {
    return fmt::format("batch_{}.json", batch_size);
}

CacheManifest LatentCache::expected_manifest(int batch_size, int num_shards) const {
    const long side = mConfig.ImageSize / mEncoder->downsample_factor();
    return CacheManifest{batch_size, num_shards, mConfig.MaxLength, mConfig.ImageSize,
                         {static_cast<long>(mEncoder->latent_channels()), side, side}};
}

bool LatentCache::is_complete(int batch_size, int num_shards) const {
    CacheManifest manifest;
    try {
        manifest = read_cache_manifest(mConfig.Directory, batch_size);
    } catch (const std::exception&) {
        // missing or unreadable manifest means the cache needs to be rebuilt
        return false;
    }
    if (manifest != expected_manifest(batch_size, num_shards)) {
        return false;
    }
    for (int i = 0; i < num_shards; ++i) {
        if (!std::filesystem::is_regular_file(mConfig.Directory + "/" + shard_name(batch_size, i))) {
            return false;
        }
    }
    return true;
}

//! Removes the manifest, all shards and all leftover temporaries for `batch_size`.
void LatentCache::remove_shards(int batch_size) const {
    const std::string prefix = fmt::format("batch_{}_", batch_size);
    const std::string manifest = manifest_name(batch_size);
    std::vector<std::filesystem::path> doomed;
    for (const auto& entry : std::filesystem::directory_iterator(mConfig.Directory)) {
        std::string name = entry.path().filename().string();
        bool is_shard = parse_shard_index(name, batch_size) >= 0;
        bool is_leftover = name.starts_with(prefix) && name.ends_with(".tmp");
        if (is_shard || is_leftover || name == manifest || name == manifest + ".tmp") {
            doomed.push_back(entry.path());
        }
    }
    for (const auto& path : doomed) {
        std::filesystem::remove(path);
    }
}

/**
 * @brief Encode one raw batch and write it as a shard.
 *
 * Raw images only live for the duration of this call. The shard is written through a
 * temporary file and renamed, so an interrupted build never leaves a truncated shard.
 */
void LatentCache::encode_shard(const std::vector<TextImagePair>& pairs, int batch_size, int index) const {
    const long S = mConfig.ImageSize;
    const long f = mEncoder->downsample_factor();
    const long C = mEncoder->latent_channels();

    TensorStore shard;
    Tensor input_ids = shard.add("input_ids", ETensorDType::INT32, {batch_size, mConfig.MaxLength});
    Tensor latents = shard.add("image_latents", ETensorDType::FP32, {batch_size, C, S / f, S / f});
    {
        TensorStore raw;
        Tensor images = raw.add("images", ETensorDType::FP32, {batch_size, 3, S, S});
        for (int b = 0; b < batch_size; ++b) {
            const TextImagePair& pair = pairs.at(static_cast<std::size_t>(index) * batch_size + b);
            Tensor image = reshape(slice(images, 0, b, b + 1), {3, S, S});
            mImages->load_image(pair.Image, mConfig.ImageSize, image);
            Tensor ids = reshape(slice(input_ids, 0, b, b + 1), {mConfig.MaxLength});
            prepare_text(*mTokenizer, pair.Text, ids);
        }
        mEncoder->encode(images, latents);
    }

    write_safetensors(mConfig.Directory + "/" + shard_name(batch_size, index), shard,
                      {{"batch_size", std::to_string(batch_size)}, {"index", std::to_string(index)}});
}

/**
 * @brief Build the shard cache for `batch_size` unless a complete one already exists.
 *
 * @param pairs Raw pairs in dataset order.
 * @param batch_size Number of samples per shard.
 * @param force Re-encode even if a complete cache exists.
 * @return Number of shards and whether they were encoded in this call.
 * @throws std::invalid_argument If there are fewer pairs than `batch_size`.
 * @throws std::exception Propagates the first encode or I/O failure, after all shards ran.
 */
CacheBuildResult LatentCache::build(const std::vector<TextImagePair>& pairs, int batch_size, bool force) {
    if (batch_size <= 0) {
        throw std::invalid_argument(fmt::format("Invalid batch size {}", batch_size));
    }
    const int num_shards = static_cast<int>(pairs.size() / batch_size);
    if (num_shards == 0) {
        throw std::invalid_argument(fmt::format("{} pairs are not enough for a single batch of {}", pairs.size(), batch_size));
    }

    std::filesystem::create_directories(mConfig.Directory);
    if (!force && is_complete(batch_size, num_shards)) {
        return CacheBuildResult{num_shards, false};
    }

    remove_shards(batch_size);

    std::atomic<int> done{0};
    std::mutex progress_lock;
    mPool.run(num_shards, [&](int index) {
        encode_shard(pairs, batch_size, index);
        int finished = done.fetch_add(1);
        if (mConfig.ShowProgress) {
            std::lock_guard<std::mutex> lock(progress_lock);
            show_progress_bar(finished, num_shards, "Caching");
        }
    });

    // only a fully written shard set gets a manifest
    write_manifest(mConfig.Directory, expected_manifest(batch_size, num_shards));
    return CacheBuildResult{num_shards, true};
}

CachedDataset::CachedDataset(std::string directory, int batch_size) : mDirectory(std::move(directory)) {
    mManifest = read_cache_manifest(mDirectory, batch_size);
    std::vector<int> present = list_shards(mDirectory, batch_size);
    for (int i = 0; i < mManifest.NumShards; ++i) {
        if (!std::binary_search(present.begin(), present.end(), i)) {
            throw std::runtime_error(fmt::format("latent cache {} is incomplete: shard {} is missing", mDirectory, i));
        }
    }
}

std::string CachedDataset::path(int index) const {
    if (index < 0 || index >= size()) {
        throw std::out_of_range(fmt::format("Shard index {} out of range [0, {})", index, size()));
    }
    return mDirectory + "/" + LatentCache::shard_name(mManifest.BatchSize, index);
}

void CachedDataset::load(int index, Tensor& input_ids, Tensor& latents) const {
    std::string file_name = path(index);
    SafeTensorsReader reader(file_name);
    reader.find_entry("input_ids").read_tensor(input_ids);
    reader.find_entry("image_latents").read_tensor(latents);
}
