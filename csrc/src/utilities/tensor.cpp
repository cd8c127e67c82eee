// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "tensor.h"

#include <cstring>

#include <fmt/format.h>
#include <fmt/ranges.h>

/**
 * @brief Create a contiguous view into @p src by slicing the first dimension.
 *
 * Only dimension 0 is supported because slices must remain contiguous with the
 * current Tensor storage/layout assumptions.
 *
 * @param src  Source tensor to slice (view semantics; no copy).
 * @param dim  Dimension to slice; must be 0.
 * @param start  Inclusive start index along @p dim (in elements).
 * @param end    Exclusive end index along @p dim (in elements).
 * @return Tensor view that shares storage with @p src and has Sizes[dim] = end-start.
 *
 * @throws std::logic_error if @p dim != 0 or if indices are out of bounds.
 */
Tensor slice(const Tensor& src, int dim, long start, long end) {
    if (dim != 0)
        throw std::logic_error("Slices must be contiguous, so only the first dimension can be sliced.");

    if (start < 0 || start >= src.Sizes[dim] || end > src.Sizes[dim] || end < start)
        throw std::logic_error("Slice out of bounds.");

    std::size_t row = 1;
    for (int i = 1; i < src.Rank; ++i)
        row *= src.Sizes[i];

    Tensor dst = src;
    dst.Sizes[dim] = end - start;
    std::ptrdiff_t offset = start * row * get_dtype_size(src.DType);
    dst.Data = src.Data + offset;
    return dst;
}

/**
 * @brief Reinterpret a contiguous tensor with a different shape.
 *
 * @param src Source view; the result shares its storage.
 * @param shape New shape; its element count must equal `src.nelem()`.
 * @return A view with the requested shape.
 *
 * @throws ShapeError If the element counts differ or the rank is too large.
 */
Tensor reshape(const Tensor& src, const std::vector<long>& shape) {
    if (shape.size() > MAX_TENSOR_DIM)
        throw ShapeError(fmt::format("Cannot reshape to rank {}", shape.size()));

    std::size_t total = 1;
    for (long s : shape) {
        if (s < 0) throw ShapeError(fmt::format("Negative dimension in reshape to [{}]", fmt::join(shape, ", ")));
        total *= s;
    }
    if (total != src.nelem()) {
        throw ShapeError(fmt::format("Cannot reshape {} ({} elements) to [{}]",
                                     shape_to_string(src), src.nelem(), fmt::join(shape, ", ")));
    }
    return Tensor::from_pointer(src.Data, src.DType, shape);
}

std::string shape_to_string(const Tensor& t) {
    return fmt::format("[{}]", fmt::join(t.Sizes.begin(), t.Sizes.begin() + t.Rank, ", "));
}

bool tensors_equal(const Tensor& a, const Tensor& b) {
    if (a.DType != b.DType || a.Rank != b.Rank) return false;
    for (int i = 0; i < a.Rank; ++i)
        if (a.Sizes[i] != b.Sizes[i]) return false;
    if (a.bytes() == 0) return true;
    return std::memcmp(a.Data, b.Data, a.bytes()) == 0;
}

void fill_zero(Tensor& dst) {
    if (!dst.Data || dst.bytes() == 0) return;
    std::memset(dst.Data, 0, dst.bytes());
}

/**
 * @brief Copy the contents of @p src into @p dst.
 *
 * @throws std::logic_error If dtype or element count differ.
 */
void copy_tensor(const Tensor& src, Tensor& dst) {
    if (src.DType != dst.DType)
        throw std::logic_error(fmt::format("DType mismatch in copy: {} vs {}", dtype_to_str(src.DType), dtype_to_str(dst.DType)));
    if (src.nelem() != dst.nelem())
        throw std::logic_error(fmt::format("Size mismatch in copy: {} vs {}", shape_to_string(src), shape_to_string(dst)));
    if (src.bytes() == 0) return;
    std::memcpy(dst.Data, src.Data, src.bytes());
}
