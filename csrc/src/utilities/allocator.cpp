// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "allocator.h"

#include <algorithm>
#include <functional>
#include <new>
#include <numeric>

#include <fmt/core.h>

/**
 * @brief Allocate zero-initialized host storage for a tensor and record it under @p name.
 *
 * @tparam Container Container type providing .size() and iteration over dimension sizes.
 * @param dtype Element type of the tensor.
 * @param name Logical name used for stats and error reporting.
 * @param shape Tensor shape (rank = shape.size()).
 * @return A Tensor describing the allocated storage.
 *
 * @throws std::runtime_error If the rank exceeds MAX_TENSOR_DIM, a dimension is negative,
 *         or the allocation fails.
 */
template<typename Container>
Tensor TensorAllocator::allocate_impl(ETensorDType dtype, const char* name, const Container& shape) {
    if(shape.size() > MAX_TENSOR_DIM) {
        throw std::runtime_error(fmt::format("Tensor rank too large for `{}`", name));
    }
    if(std::any_of(std::begin(shape), std::end(shape), [](long s) { return s < 0; })) {
        throw std::runtime_error(fmt::format("Negative dimension for tensor `{}`", name));
    }

    std::size_t total = std::accumulate(std::begin(shape), std::end(shape), 1l, std::multiplies<>());
    std::size_t bytes = total * get_dtype_size(dtype);

    std::unique_ptr<std::byte[]> storage;
    try {
        // always keep at least one byte so Data is never null for empty tensors
        storage = std::make_unique<std::byte[]>(std::max<std::size_t>(bytes, 1));
    } catch (const std::bad_alloc&) {
        throw std::runtime_error(fmt::format("Out of memory allocating {} bytes for tensor `{}`", bytes, name));
    }

    Tensor tensor = Tensor::from_pointer(storage.get(), dtype, shape);
    mAllocations.push_back(sAllocationData{std::move(storage), bytes, name});
    return tensor;
}

Tensor TensorAllocator::allocate(ETensorDType dtype, const char* name, const std::vector<long>& shape) {
    return allocate_impl(dtype, name, shape);
}

Tensor TensorAllocator::allocate(ETensorDType dtype, const char* name, const std::initializer_list<long>& shape) {
    return allocate_impl(dtype, name, shape);
}

std::size_t TensorAllocator::total_allocation() const {
    std::size_t total = 0;
    for (const auto& alloc : mAllocations)
        total += alloc.Size;
    return total;
}

std::vector<std::pair<std::string, std::size_t>> TensorAllocator::get_tensor_stats() const {
    std::vector<std::pair<std::string, std::size_t>> stats;
    stats.reserve(mAllocations.size());
    for (const auto& alloc : mAllocations)
        stats.emplace_back(alloc.Name, alloc.Size);
    std::sort(stats.begin(), stats.end(), [](const auto& a, const auto& b) { return a.second > b.second; });
    return stats;
}
