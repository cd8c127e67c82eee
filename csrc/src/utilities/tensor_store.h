// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRANSFUSE_SRC_UTILITIES_TENSOR_STORE_H
#define TRANSFUSE_SRC_UTILITIES_TENSOR_STORE_H

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "allocator.h"
#include "tensor.h"

//! \brief An ITensorContainer that owns its tensors.
//! \details Tensors are kept in insertion order; names are unique.
class TensorStore : public ITensorContainer {
public:
    TensorStore() = default;
    TensorStore(TensorStore&&) noexcept = default;
    TensorStore& operator=(TensorStore&&) noexcept = default;

    //! Allocates a new zero-filled tensor. Throws std::logic_error if the name is taken.
    Tensor& add(const std::string& name, ETensorDType dtype, const std::vector<long>& shape);

    //! Allocates a new tensor holding a copy of `src`.
    Tensor& add_copy(const std::string& name, const Tensor& src);

    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] const Tensor& get(std::string_view name) const;
    [[nodiscard]] Tensor& get(std::string_view name);

    [[nodiscard]] std::size_t size() const { return mTensors.size(); }
    [[nodiscard]] bool empty() const { return mTensors.empty(); }
    [[nodiscard]] std::vector<std::string> names() const;

    void iterate_tensors(const std::function<void(std::string, const Tensor&)>& callback) override;

    //! Deep copy of every tensor in `source`.
    static TensorStore copy_of(ITensorContainer& source);

private:
    TensorAllocator mAllocator;
    std::vector<std::pair<std::string, Tensor>> mTensors;
};

//! \brief Copies every tensor of `src` into the tensor of the same name in `dst`.
//! \throws std::runtime_error if a tensor is missing on either side or shapes differ.
void copy_tensors(ITensorContainer& src, ITensorContainer& dst);

//! True if both containers hold the same names with bit-identical contents.
bool containers_equal(ITensorContainer& a, ITensorContainer& b);

#endif //TRANSFUSE_SRC_UTILITIES_TENSOR_STORE_H
