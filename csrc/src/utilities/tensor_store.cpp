// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "tensor_store.h"

#include <algorithm>
#include <map>
#include <unordered_map>

#include <fmt/core.h>

Tensor& TensorStore::add(const std::string& name, ETensorDType dtype, const std::vector<long>& shape) {
    if (contains(name))
        throw std::logic_error(fmt::format("Tensor `{}` already exists", name));
    Tensor t = mAllocator.allocate(dtype, name.c_str(), shape);
    mTensors.emplace_back(name, t);
    return mTensors.back().second;
}

Tensor& TensorStore::add_copy(const std::string& name, const Tensor& src) {
    Tensor& dst = add(name, src.DType, src.shape());
    copy_tensor(src, dst);
    return dst;
}

bool TensorStore::contains(std::string_view name) const {
    return std::any_of(mTensors.begin(), mTensors.end(), [&](const auto& e) { return e.first == name; });
}

const Tensor& TensorStore::get(std::string_view name) const {
    for (const auto& [n, t] : mTensors)
        if (n == name) return t;
    throw std::out_of_range(fmt::format("Tensor not found: {}", name));
}

Tensor& TensorStore::get(std::string_view name) {
    for (auto& [n, t] : mTensors)
        if (n == name) return t;
    throw std::out_of_range(fmt::format("Tensor not found: {}", name));
}

std::vector<std::string> TensorStore::names() const {
    std::vector<std::string> result;
    result.reserve(mTensors.size());
    for (const auto& e : mTensors)
        result.push_back(e.first);
    return result;
}

void TensorStore::iterate_tensors(const std::function<void(std::string, const Tensor&)>& callback) {
    for (const auto& [name, tensor] : mTensors)
        callback(name, tensor);
}

TensorStore TensorStore::copy_of(ITensorContainer& source) {
    TensorStore store;
    source.iterate_tensors([&store](std::string name, const Tensor& tensor) {
        store.add_copy(name, tensor);
    });
    return store;
}

/**
 * @brief Copy tensors by name from @p src into the (pre-allocated) tensors of @p dst.
 *
 * Both containers must hold exactly the same set of names, and each pair must agree
 * in dtype and shape. This is used to adopt restored checkpoint state into live model
 * and optimizer buffers.
 *
 * @throws std::runtime_error On missing/extra names or dtype/shape mismatches.
 */
void copy_tensors(ITensorContainer& src, ITensorContainer& dst) {
    std::unordered_map<std::string, Tensor> targets;
    dst.iterate_tensors([&targets](std::string name, const Tensor& tensor) {
        targets.emplace(std::move(name), tensor);
    });

    std::size_t copied = 0;
    src.iterate_tensors([&](std::string name, const Tensor& tensor) {
        auto found = targets.find(name);
        if (found == targets.end())
            throw std::runtime_error(fmt::format("Unexpected tensor `{}`", name));
        Tensor& target = found->second;
        if (target.DType != tensor.DType || target.shape() != tensor.shape())
            throw std::runtime_error(fmt::format("Tensor `{}` mismatch: expected {} {}, got {} {}", name,
                                                 dtype_to_str(target.DType), shape_to_string(target),
                                                 dtype_to_str(tensor.DType), shape_to_string(tensor)));
        copy_tensor(tensor, target);
        ++copied;
    });

    if (copied != targets.size())
        throw std::runtime_error(fmt::format("Missing tensors: expected {}, got {}", targets.size(), copied));
}

bool containers_equal(ITensorContainer& a, ITensorContainer& b) {
    std::map<std::string, Tensor> lhs;
    std::map<std::string, Tensor> rhs;
    a.iterate_tensors([&lhs](std::string name, const Tensor& t) { lhs.emplace(std::move(name), t); });
    b.iterate_tensors([&rhs](std::string name, const Tensor& t) { rhs.emplace(std::move(name), t); });
    if (lhs.size() != rhs.size()) return false;
    for (const auto& [name, tensor] : lhs) {
        auto found = rhs.find(name);
        if (found == rhs.end() || !tensors_equal(tensor, found->second)) return false;
    }
    return true;
}
