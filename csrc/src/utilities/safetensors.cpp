// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "safetensors.h"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <unordered_map>

#include <fcntl.h>
#include <sys/mman.h>
#include <unistd.h>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "tensor_store.h"

namespace {

// headers larger than this are certainly corrupt
constexpr std::uint64_t kMaxHeaderSize = 100'000'000;

/**
 * @brief Parsed SafeTensors header data.
 *
 * The SafeTensors file starts with an 8-byte little-endian unsigned integer
 * indicating the JSON header size in bytes, followed by the JSON header.
 */
struct sSafeTensorsHeader {
    /** @brief Size of the JSON header (bytes), not including this 8-byte length field. */
    std::uint64_t HeaderSize;
    /** @brief Parsed JSON metadata for all tensor entries and optional "__metadata__". */
    nlohmann::json MetaData;
};

/**
 * @brief Read and parse the SafeTensors JSON header from a file.
 *
 * @param file_name Path to the `.safetensors` file.
 * @return A struct containing the header size (bytes) and parsed JSON metadata.
 *
 * @throws std::runtime_error If the file cannot be read or the header is invalid.
 */
sSafeTensorsHeader read_safetensors_header(const std::string& file_name) {
    std::uint64_t header_size = 0;
    std::ifstream file(file_name, std::ios_base::binary);
    file.read(reinterpret_cast<char*>(&header_size), sizeof(header_size));
    if (!file) {
        throw std::runtime_error("Error opening safetensors file '" + file_name + "'");
    }
    if (header_size == 0 || header_size > kMaxHeaderSize) {
        throw std::runtime_error(fmt::format("Invalid safetensors header size {} in '{}'", header_size, file_name));
    }

    std::vector<char> header(header_size, '\0');
    file.read(header.data(), (long)header_size);
    if (!file) {
        throw std::runtime_error("Truncated safetensors header in '" + file_name + "'");
    }
    auto parsed = nlohmann::json::parse(header.begin(), header.end());
    return {header_size, std::move(parsed)};
}

} // namespace

SafeTensorEntry::SafeTensorEntry(std::string name, std::vector<long> shape, ETensorDType dtype, std::string file_name,
                                 std::ptrdiff_t data_begin, std::ptrdiff_t data_end)
    : mName(std::move(name)), mShape(std::move(shape)), mDType(dtype), mFileName(std::move(file_name)),
      mDataBegin(data_begin), mDataEnd(data_end) {
}

/**
 * @brief Read the full tensor for this entry into @p target, validating dtype, rank and shape.
 *
 * @param target Destination tensor whose dtype, rank and sizes must match this entry.
 *
 * @throws std::runtime_error On dtype/rank/shape mismatch or I/O errors.
 */
void SafeTensorEntry::read_tensor(Tensor& target) const {
    if (target.DType != mDType)
        throw std::runtime_error(fmt::format("DType mismatch for tensor `{}`: tensor has {}, file has {}",
                                             mName, dtype_to_str(target.DType), dtype_to_str(mDType)));

    if (target.Rank != static_cast<int>(mShape.size()))
        throw std::runtime_error(fmt::format("Rank mismatch for tensor `{}`: expected {}, got {}",
                                             mName, mShape.size(), target.Rank));

    for (int i = 0; i < target.Rank; ++i)
        if (mShape[i] != target.Sizes[i])
            throw std::runtime_error(fmt::format("Shape mismatch for tensor `{}` at dim {}: expected {}, got {}",
                                                 mName, i, mShape[i], target.Sizes[i]));

    if (static_cast<std::ptrdiff_t>(target.bytes()) != mDataEnd - mDataBegin)
        throw std::runtime_error(fmt::format("Size mismatch for tensor `{}`: file has {} bytes, tensor has {}",
                                             mName, mDataEnd - mDataBegin, target.bytes()));

    if (target.bytes() == 0) return;

    std::ifstream file(mFileName, std::ios_base::binary);
    file.seekg(mDataBegin);
    file.read(reinterpret_cast<char*>(target.Data), static_cast<std::streamsize>(target.bytes()));
    if (!file)
        throw std::runtime_error(fmt::format("Error reading tensor `{}` from '{}'", mName, mFileName));
}

/**
 * @brief Parse a single `.safetensors` file.
 *
 * Reads the JSON header, computes the absolute data offsets (including the
 * header length field and JSON header), and stores entries referencing the file.
 *
 * @param file_name Path to a `.safetensors` file.
 *
 * @throws std::runtime_error / nlohmann::json exceptions on I/O or parse failures.
 */
SafeTensorsReader::SafeTensorsReader(const std::string& file_name) {
    auto [HeaderSize, MetaData] = read_safetensors_header(file_name);
    std::ptrdiff_t offset = HeaderSize + sizeof(HeaderSize);
    for (const auto& el : MetaData.items()) {
        const std::string& name = el.key();
        if (name == "__metadata__") {
            for (const auto& meta : el.value().items())
                mMetaData[meta.key()] = meta.value().get<std::string>();
            continue;
        }

        ETensorDType dtype = dtype_from_str(el.value()["dtype"].get<std::string_view>());
        auto shape = el.value()["shape"].get<std::vector<long>>();
        auto begin = el.value()["data_offsets"][0].get<std::ptrdiff_t>();
        auto end = el.value()["data_offsets"][1].get<std::ptrdiff_t>();

        mEntries.emplace_back(name, shape, dtype, file_name, begin + offset, end + offset);
    }
}

/**
 * @brief Find an entry by tensor name.
 *
 * @throws std::out_of_range If no entry with this name exists.
 */
const SafeTensorEntry& SafeTensorsReader::find_entry(std::string_view name) const {
    for (auto& entry : mEntries)
        if (entry.name() == name)
            return entry;
    throw std::out_of_range(fmt::format("Entry not found: {}", name));
}

bool SafeTensorsReader::has_entry(std::string_view name) const {
    for (auto& entry : mEntries)
        if (entry.name() == name)
            return true;
    return false;
}

/**
 * @brief Load all tensors present in both the reader and the container.
 *
 * @param container Tensor container providing named tensors to populate.
 *
 * @throws std::runtime_error On shape/rank/dtype mismatches.
 */
void SafeTensorsReader::load_tensors(ITensorContainer& container) const {
    std::unordered_map<std::string, Tensor> named_tensors;
    container.iterate_tensors([&named_tensors](std::string name, const Tensor& tensor) {
        named_tensors.emplace(std::move(name), tensor);
    });

    for (const auto& entry : mEntries)
        if (auto found = named_tensors.find(entry.name()); found != named_tensors.end())
            entry.read_tensor(found->second);
}

void SafeTensorsReader::read_all(TensorStore& store) const {
    for (const auto& entry : mEntries) {
        Tensor& target = store.add(entry.name(), entry.dtype(), entry.shape());
        entry.read_tensor(target);
    }
}

/**
 * @brief Convenience function to load SafeTensors into an ITensorContainer.
 *
 * @param file_name Path to `.safetensors` file.
 * @param tensors Container to populate.
 */
void load_safetensors(const std::string& file_name, ITensorContainer& tensors) {
    try {
        SafeTensorsReader reader(file_name);
        reader.load_tensors(tensors);
    } catch (std::exception& e) {
        throw std::runtime_error(fmt::format("Error loading safetensors file '{}': {}", file_name, e.what()));
    }
}

SafeTensorWriter::SafeTensorWriter(std::string file_name) : mFileName(std::move(file_name)) {
}

/**
 * @brief Destroy the writer and clean up any temporary resources.
 *
 * If a temporary file is still open/mapped (i.e. finalize() was never reached),
 * it is unmapped, closed and removed. Errors are ignored here since a destructor
 * must not throw.
 */
SafeTensorWriter::~SafeTensorWriter() {
    if (mFileDescriptor >= 0) {
        std::string temp_name = mFileName + ".tmp";
        if (mMappedFile) {
            munmap(mMappedFile, mTotalSize);
        }
        close(mFileDescriptor);
        unlink(temp_name.c_str());
    }
}

void SafeTensorWriter::set_metadata(const std::string& key, const std::string& value) {
    if (mMetaFinalized)
        throw std::logic_error("Cannot set metadata after it has been finalized");
    mUserMetaData[key] = value;
}

/**
 * @brief Register a tensor for later writing (metadata + offsets are derived from registrations).
 *
 * Must be called before prepare_metadata().
 *
 * @throws std::logic_error If metadata has already been finalized or the name is taken.
 */
void SafeTensorWriter::register_tensor(const std::string& name, const Tensor& tensor) {
    if (mMetaFinalized)
        throw std::logic_error("Cannot register tensor after metadata has been finalized");
    if (name == "__metadata__")
        throw std::logic_error("Reserved tensor name __metadata__");
    auto [it, inserted] = mRegisteredTensors.insert({name, {tensor.DType, tensor.shape(), 0, (long)tensor.bytes()}});
    if (!inserted)
        throw std::logic_error("Tensor " + name + " registered twice");
}

/**
 * @brief Build the JSON header, create and map the temporary file, and write the header.
 *
 * The header is padded with spaces to a multiple of 8 bytes so that tensor data starts
 * aligned.
 *
 * @throws std::system_error On file open/truncate/mmap failures.
 */
void SafeTensorWriter::prepare_metadata() {
    nlohmann::json meta_data;
    nlohmann::json user = nlohmann::json::object({{"format", "pt"}, {"writer", "transfuse"}});
    for (const auto& [key, value] : mUserMetaData)
        user[key] = value;
    meta_data["__metadata__"] = user;

    long offset = 0;
    for (auto& [name, tensor] : mRegisteredTensors) {
        meta_data[name]["dtype"] = dtype_to_str(tensor.DType);
        meta_data[name]["shape"] = tensor.Shape;
        tensor.Begin = offset;
        meta_data[name]["data_offsets"] = std::vector<long>{offset, offset + tensor.Size};
        offset += tensor.Size;
    }

    std::string header = meta_data.dump();
    header.append((8 - header.size() % 8) % 8, ' ');
    std::uint64_t header_size = header.size();
    mHeaderSize = header_size + sizeof(header_size);

    std::string temp_name = mFileName + ".tmp";
    mFileDescriptor = open(temp_name.c_str(), O_RDWR | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR | S_IRGRP);
    if (mFileDescriptor == -1)
        throw std::system_error(errno, std::system_category(), "Error opening file '" + temp_name + "' for writing");
    mTotalSize = mHeaderSize + offset;
    if (ftruncate(mFileDescriptor, mTotalSize) < 0)
        throw std::system_error(errno, std::system_category(), "Error truncating file " + temp_name);

    std::byte* host_ptr = (std::byte*)mmap(nullptr, mTotalSize, PROT_WRITE, MAP_SHARED, mFileDescriptor, 0);
    if (host_ptr == MAP_FAILED)
        throw std::system_error(errno, std::system_category(), "Error memory-mapping file " + temp_name);

    std::memcpy(host_ptr, &header_size, sizeof(header_size));
    std::memcpy(host_ptr + sizeof(header_size), header.data(), header_size);

    mMappedFile = host_ptr;
    mMetaFinalized = true;
}

/**
 * @brief Write an entire tensor into the output file.
 *
 * @throws std::logic_error If metadata is not finalized, the tensor was already written,
 *         or dtype/size differ from the registration.
 * @throws std::out_of_range If @p name was not registered.
 */
void SafeTensorWriter::write_tensor(const std::string& name, const Tensor& tensor) {
    if (!mMetaFinalized)
        throw std::logic_error("Cannot write tensor before metadata has been finalized");

    auto found = mRegisteredTensors.find(name);
    if (found == mRegisteredTensors.end())
        throw std::out_of_range("Invalid tensor " + name);

    if (found->second.Done)
        throw std::logic_error("Tensor " + name + " has already been written");

    if (found->second.DType != tensor.DType || found->second.Size != (long)tensor.bytes())
        throw std::logic_error(fmt::format("Tensor `{}` does not match its registration", name));

    if (tensor.bytes() > 0)
        std::memcpy(mMappedFile + mHeaderSize + found->second.Begin, tensor.Data, tensor.bytes());
    found->second.Done = true;
}

/**
 * @brief Finalize the file: verify all tensors written, flush, and rename the temp file.
 *
 * @throws std::logic_error If any registered tensor has not been written.
 * @throws std::system_error On unmap/sync failures.
 */
void SafeTensorWriter::finalize() {
    if (!mMetaFinalized)
        throw std::logic_error("Cannot finalize before metadata has been prepared");

    for (auto& [name, tensor] : mRegisteredTensors)
        if (!tensor.Done)
            throw std::logic_error("Tensor " + name + " has not been written");

    std::string temp_name = mFileName + ".tmp";
    if (mMappedFile) {
        if (munmap(mMappedFile, mTotalSize) != 0)
            throw std::system_error(errno, std::system_category(), "Error unmapping file " + temp_name);
        mMappedFile = nullptr;
    }
    if (mFileDescriptor >= 0) {
        if (fsync(mFileDescriptor) != 0)
            throw std::system_error(errno, std::system_category(), "Error syncing file " + temp_name);
        close(mFileDescriptor);
        mFileDescriptor = -1;
        std::filesystem::rename(temp_name, mFileName);
    }
}

/**
 * @brief Convenience function to write all tensors from a container into a SafeTensors file.
 *
 * Registers all tensors, writes metadata, writes each tensor in full, then finalizes.
 *
 * @param file_name Output `.safetensors` path.
 * @param tensors Tensor container providing named tensors to serialize.
 * @param metadata Extra string entries for the `__metadata__` section.
 */
void write_safetensors(const std::string& file_name, ITensorContainer& tensors,
                       const std::map<std::string, std::string>& metadata) {
    SafeTensorWriter writer(file_name);
    for (const auto& [key, value] : metadata)
        writer.set_metadata(key, value);
    tensors.iterate_tensors([&writer](std::string name, const Tensor& tensor) {
        writer.register_tensor(name, tensor);
    });
    writer.prepare_metadata();
    tensors.iterate_tensors([&writer](std::string name, const Tensor& tensor) {
        writer.write_tensor(name, tensor);
    });
    writer.finalize();
}
