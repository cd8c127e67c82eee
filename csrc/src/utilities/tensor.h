// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRANSFUSE_SRC_UTILITIES_TENSOR_H
#define TRANSFUSE_SRC_UTILITIES_TENSOR_H

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include "dtype.h"
#include "utils.h"

constexpr int MAX_TENSOR_DIM = 5;

//! Raised whenever a tensor does not have the shape an operation requires.
class ShapeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//! \brief The Tensor class represents a contiguous view on host memory that is associated
//! with a specific data type and shape. It does not own its memory.
struct Tensor {
    ETensorDType DType = ETensorDType::FP32;
    std::array<long, MAX_TENSOR_DIM> Sizes{};
    std::byte* Data = nullptr;
    int Rank = 0;

    [[nodiscard]] constexpr std::size_t bytes() const {
        return nelem() * get_dtype_size(DType);
    }

    [[nodiscard]] constexpr std::size_t nelem() const {
        std::size_t sz = 1;
        for(int i = 0; i < Rank; ++i) {
            sz *= Sizes[i];
        }
        return sz;
    }

    [[nodiscard]] bool is_null() const { return Data == nullptr; }
    [[nodiscard]] bool has_value() const { return Data != nullptr; }

    [[nodiscard]] std::vector<long> shape() const {
        return std::vector<long>(Sizes.begin(), Sizes.begin() + Rank);
    }

    static Tensor empty(ETensorDType dtype, const std::vector<long>& shape) {
        if (shape.size() > MAX_TENSOR_DIM) throw std::runtime_error("Tensor rank too large");
        Tensor t;
        t.DType = dtype;
        t.Rank = (int)shape.size();
        for (int i = 0; i < t.Rank; ++i) t.Sizes[i] = shape[i];
        for (int i = t.Rank; i < MAX_TENSOR_DIM; ++i) t.Sizes[i] = 1;
        return t;
    }

    template<class TargetType>
    [[nodiscard]] constexpr const TargetType* get() const {
        if(dtype_from_type<TargetType> != DType) {
            throw std::logic_error(std::string("DType mismatch: expected ") +
                dtype_to_str(dtype_from_type<TargetType>) + ", got " + dtype_to_str(DType));
        }

        return reinterpret_cast<const TargetType*>(Data);
    }

    template<typename TargetType>
    [[nodiscard]] constexpr TargetType* get() {
        if(dtype_from_type<TargetType> != DType) {
            throw std::logic_error(std::string("DType mismatch: expected ") +
                dtype_to_str(dtype_from_type<TargetType>) + ", got " + dtype_to_str(DType));
        }

        return reinterpret_cast<TargetType*>(Data);
    }

    template<typename Container>
    static Tensor from_pointer(std::byte* ptr, ETensorDType dtype, const Container& shape)
    {
        if(shape.size() > MAX_TENSOR_DIM) {
            throw std::runtime_error("Tensor rank too large");
        }

        int rank = narrow<int>(shape.size());
        std::array<long, MAX_TENSOR_DIM> sizes{};
        std::copy(shape.begin(), shape.end(), sizes.begin());
        std::fill(sizes.begin() + shape.size(), sizes.end(), 1);

        return Tensor{dtype, sizes, ptr, rank};
    }
};

Tensor slice(const Tensor& src, int dim, long start, long end);

//! Reinterprets `src` with a new shape of identical element count (no copy).
Tensor reshape(const Tensor& src, const std::vector<long>& shape);

//! Human readable shape, e.g. `[2, 4, 32, 32]`.
std::string shape_to_string(const Tensor& t);

//! True if both tensors have the same dtype, shape and bytes.
bool tensors_equal(const Tensor& a, const Tensor& b);

void fill_zero(Tensor& dst);
void copy_tensor(const Tensor& src, Tensor& dst);

//! Named collection of tensors, e.g. model parameters or optimizer moments.
class ITensorContainer {
public:
    virtual ~ITensorContainer() = default;
    virtual void iterate_tensors(const std::function<void(std::string, const Tensor&)>& callback) = 0;
};

#endif //TRANSFUSE_SRC_UTILITIES_TENSOR_H
