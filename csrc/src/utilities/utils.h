// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRANSFUSE_SRC_UTILITIES_UTILS_H
#define TRANSFUSE_SRC_UTILITIES_UTILS_H

#include <concepts>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

template<std::integral Dst, std::integral Src>
constexpr Dst narrow(Src input) {
    if constexpr (std::is_signed_v<Src>) {
        if (std::is_unsigned_v<Dst> && input < 0) {
            throw std::out_of_range("Cannot convert negative number to unsigned");
        }
        if (std::is_signed_v<Dst> && input < std::numeric_limits<Dst>::min())
        {
            throw std::out_of_range("Out of range in integer conversion: underflow");
        }
    }

    if (input > std::numeric_limits<Dst>::max())
    {
        throw std::out_of_range("Out of range in integer conversion: overflow");
    }

    return static_cast<Dst>(input);
}

bool iequals(std::string_view lhs, std::string_view rhs);

//! Replaces every occurrence of `needle` in `haystack`.
std::string replace_all(std::string haystack, std::string_view needle, std::string_view replacement);

/**
 * @brief Displays a simple progress bar on stderr.
 *
 * @param current Current item index (0-based).
 * @param total Total number of items.
 * @param label Prefix label for the progress bar.
 */
void show_progress_bar(int current, int total, const std::string& label);

#endif //TRANSFUSE_SRC_UTILITIES_UTILS_H
