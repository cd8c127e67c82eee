// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "utils.h"
#include "dtype.h"

#include <algorithm>
#include <cctype>
#include <iostream>

#include <fmt/format.h>

const char* dtype_to_str(ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP32: return "F32";
        case ETensorDType::FP64: return "F64";
        case ETensorDType::INT32: return "I32";
        case ETensorDType::INT64: return "I64";
        case ETensorDType::BYTE: return "U8";
    }
    throw std::logic_error("Unknown dtype");
}

/**
 * @brief Parses the dtype names used in safetensors headers.
 *
 * Accepts the canonical upper-case names as well as lower-case spellings
 * (`fp32`, `int32`, ...) that are convenient on the command line.
 *
 * @param dtype Name to parse.
 * @return The matching ETensorDType.
 *
 * @throws std::runtime_error If the name does not denote a supported dtype.
 */
ETensorDType dtype_from_str(std::string_view dtype) {
    if (iequals(dtype, "F32") || iequals(dtype, "fp32")) return ETensorDType::FP32;
    if (iequals(dtype, "F64") || iequals(dtype, "fp64")) return ETensorDType::FP64;
    if (iequals(dtype, "I32") || iequals(dtype, "int32")) return ETensorDType::INT32;
    if (iequals(dtype, "I64") || iequals(dtype, "int64")) return ETensorDType::INT64;
    if (iequals(dtype, "U8") || iequals(dtype, "byte")) return ETensorDType::BYTE;
    throw std::runtime_error(fmt::format("Unsupported dtype `{}`", dtype));
}

/**
 * @brief Case-insensitive equality comparison for two string views (ASCII-ish semantics).
 *
 * @param lhs Left-hand string view.
 * @param rhs Right-hand string view.
 * @return True if both views have the same length and match case-insensitively; false otherwise.
 */
bool iequals(std::string_view lhs, std::string_view rhs) {
    return std::ranges::equal(
        lhs, rhs, [](unsigned char a, unsigned char b) {
            return std::tolower(a) == std::tolower(b);
    });
}

std::string replace_all(std::string haystack, std::string_view needle, std::string_view replacement) {
    if (needle.empty()) return haystack;
    size_t pos = haystack.find(needle);
    while (pos != std::string::npos) {
        haystack.replace(pos, needle.size(), replacement);
        pos = haystack.find(needle, pos + replacement.size());
    }
    return haystack;
}

void show_progress_bar(int current, int total, const std::string& label) {
    if (total <= 0) return;
    const int bar_width = 40;
    float progress = static_cast<float>(current + 1) / total;
    int pos = static_cast<int>(bar_width * progress);

    std::cerr << "\r" << label << ": [";
    for (int i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos) std::cerr << ">";
        else std::cerr << " ";
    }
    std::cerr << "] " << static_cast<int>(progress * 100.0) << "% ("
              << (current + 1) << "/" << total << ")" << std::flush;

    if (current + 1 == total) {
        std::cerr << std::endl;
    }
}
