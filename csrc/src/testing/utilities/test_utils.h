// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <cstddef>
#include <filesystem>
#include <iterator>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "utilities/tensor.h"

namespace testing_utils {

inline std::vector<float> uniform_host(long n, float low, float high, uint64_t seed = 12345ULL) {
    std::mt19937_64 gen(seed);
    std::uniform_real_distribution<float> dist(low, high);
    std::vector<float> data;
    data.reserve(n);
    std::generate_n(std::back_inserter(data), n, [&]() { return dist(gen); });
    return data;
}

inline void fill_normal(std::vector<float>& v, float mean = 0.0f, float stddev = 1.0f, uint64_t seed = 12345ULL) {
    std::mt19937_64 gen(seed);
    std::normal_distribution<float> dist(mean, stddev);
    for (auto& x : v) x = dist(gen);
}

// Copies host data into an existing FP32 tensor of the same element count.
inline void fill_tensor(Tensor& dst, const std::vector<float>& src) {
    if (dst.nelem() != static_cast<long>(src.size())) {
        throw std::runtime_error("fill_tensor: size mismatch");
    }
    std::memcpy(dst.Data, src.data(), src.size() * sizeof(float));
}

inline std::vector<float> to_vector(const Tensor& src) {
    const float* p = src.get<float>();
    return std::vector<float>(p, p + src.nelem());
}

// -----------------------------------------------------------------------------

// Scratch directory below the system temp path, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        mPath = std::filesystem::temp_directory_path() /
                ("transfuse_test_" + tag + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(mPath);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(mPath, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return mPath; }
    [[nodiscard]] std::string str() const { return mPath.string(); }
    [[nodiscard]] std::string operator/(const std::string& name) const { return (mPath / name).string(); }

private:
    std::filesystem::path mPath;
};

} // namespace testing_utils
