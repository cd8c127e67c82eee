// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRANSFUSE_SRC_UTILITIES_SAFETENSORS_H
#define TRANSFUSE_SRC_UTILITIES_SAFETENSORS_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "tensor.h"

class TensorStore;

//! One tensor entry inside a safetensors file.
class SafeTensorEntry {
public:
    SafeTensorEntry(std::string name, std::vector<long> shape, ETensorDType dtype, std::string file_name,
                    std::ptrdiff_t data_begin, std::ptrdiff_t data_end);

    [[nodiscard]] const std::string& name() const { return mName; }
    [[nodiscard]] const std::vector<long>& shape() const { return mShape; }
    [[nodiscard]] ETensorDType dtype() const { return mDType; }

    //! Reads the full tensor into `target`, which must match in dtype and shape.
    void read_tensor(Tensor& target) const;

private:
    std::string mName;
    std::vector<long> mShape;
    ETensorDType mDType;
    std::string mFileName;
    std::ptrdiff_t mDataBegin;
    std::ptrdiff_t mDataEnd;
};

class SafeTensorsReader {
public:
    explicit SafeTensorsReader(const std::string& file_name);

    [[nodiscard]] const std::vector<SafeTensorEntry>& entries() const { return mEntries; }
    [[nodiscard]] const SafeTensorEntry& find_entry(std::string_view name) const;
    [[nodiscard]] bool has_entry(std::string_view name) const;

    //! String key/value pairs of the `__metadata__` section.
    [[nodiscard]] const std::map<std::string, std::string>& metadata() const { return mMetaData; }

    //! Reads every tensor present in both the file and `container`.
    void load_tensors(ITensorContainer& container) const;

    //! Allocates and reads every tensor of the file into `store`.
    void read_all(TensorStore& store) const;

private:
    std::vector<SafeTensorEntry> mEntries;
    std::map<std::string, std::string> mMetaData;
};

/**
 * @brief Writes a safetensors file atomically.
 *
 * Usage: register all tensors, call prepare_metadata(), write every tensor, then finalize().
 * Data goes to `<file>.tmp`, which is renamed onto the final name only in finalize(), so a
 * reader never observes a partially written file.
 */
class SafeTensorWriter {
public:
    explicit SafeTensorWriter(std::string file_name);
    ~SafeTensorWriter();
    SafeTensorWriter(const SafeTensorWriter&) = delete;
    SafeTensorWriter& operator=(const SafeTensorWriter&) = delete;

    void set_metadata(const std::string& key, const std::string& value);
    void register_tensor(const std::string& name, const Tensor& tensor);
    void prepare_metadata();
    void write_tensor(const std::string& name, const Tensor& tensor);
    void finalize();

private:
    struct sTensorInfo {
        ETensorDType DType;
        std::vector<long> Shape;
        long Begin;
        long Size;
        bool Done = false;
    };

    std::string mFileName;
    std::map<std::string, sTensorInfo> mRegisteredTensors;
    std::map<std::string, std::string> mUserMetaData;
    bool mMetaFinalized = false;
    std::byte* mMappedFile = nullptr;
    std::size_t mTotalSize = 0;
    std::size_t mHeaderSize = 0;
    int mFileDescriptor = -1;
};

void load_safetensors(const std::string& file_name, ITensorContainer& tensors);
void write_safetensors(const std::string& file_name, ITensorContainer& tensors,
                       const std::map<std::string, std::string>& metadata = {});

#endif //TRANSFUSE_SRC_UTILITIES_SAFETENSORS_H
