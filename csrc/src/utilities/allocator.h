// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRANSFUSE_SRC_UTILITIES_ALLOCATOR_H
#define TRANSFUSE_SRC_UTILITIES_ALLOCATOR_H

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "tensor.h"

//! Owns host memory for tensors. Tensors handed out stay valid until the allocator is destroyed.
class TensorAllocator {
public:
    TensorAllocator() = default;
    ~TensorAllocator() noexcept = default;
    TensorAllocator(TensorAllocator&&) noexcept = default;
    TensorAllocator(const TensorAllocator&) = delete;
    TensorAllocator& operator=(TensorAllocator&&) noexcept = default;
    TensorAllocator& operator=(const TensorAllocator&) = delete;

    Tensor allocate(ETensorDType dtype, const char* name, const std::vector<long>& shape);
    Tensor allocate(ETensorDType dtype, const char* name, const std::initializer_list<long>& shape);

    [[nodiscard]] std::size_t total_allocation() const;
    [[nodiscard]] std::size_t num_allocations() const { return mAllocations.size(); }

    //! Per-tensor allocation sizes, largest first.
    [[nodiscard]] std::vector<std::pair<std::string, std::size_t>> get_tensor_stats() const;

private:
    template<typename Container>
    Tensor allocate_impl(ETensorDType dtype, const char* name, const Container& shape);

    struct sAllocationData {
        std::unique_ptr<std::byte[]> Pointer;
        std::size_t Size;
        std::string Name;
    };

    std::vector<sAllocationData> mAllocations;
};

#endif //TRANSFUSE_SRC_UTILITIES_ALLOCATOR_H
