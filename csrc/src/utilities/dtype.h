// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRANSFUSE_SRC_UTILITIES_DTYPE_H
#define TRANSFUSE_SRC_UTILITIES_DTYPE_H

#include <cstddef>
#include <cstdint>
#include <string_view>

enum class ETensorDType : int {
    FP32,
    FP64,
    INT32,
    INT64,
    BYTE
};

//! Size in bytes of a single element of `type`.
constexpr std::size_t get_dtype_size(ETensorDType type) {
    switch (type) {
        case ETensorDType::FP32: return 4;
        case ETensorDType::FP64: return 8;
        case ETensorDType::INT32: return 4;
        case ETensorDType::INT64: return 8;
        case ETensorDType::BYTE: return 1;
    }
    return 0;
}

template<typename T>
inline constexpr ETensorDType dtype_from_type = ETensorDType::BYTE;

template<> inline constexpr ETensorDType dtype_from_type<float> = ETensorDType::FP32;
template<> inline constexpr ETensorDType dtype_from_type<double> = ETensorDType::FP64;
template<> inline constexpr ETensorDType dtype_from_type<std::int32_t> = ETensorDType::INT32;
template<> inline constexpr ETensorDType dtype_from_type<std::int64_t> = ETensorDType::INT64;
template<> inline constexpr ETensorDType dtype_from_type<std::byte> = ETensorDType::BYTE;
template<> inline constexpr ETensorDType dtype_from_type<std::uint8_t> = ETensorDType::BYTE;

//! Safetensors name of the dtype (F32, I32, ...).
const char* dtype_to_str(ETensorDType dtype);

//! Parses a safetensors dtype name; throws std::runtime_error for unsupported types.
ETensorDType dtype_from_str(std::string_view dtype);

#endif //TRANSFUSE_SRC_UTILITIES_DTYPE_H
