#include "peerdrop/transfer/file_source.hpp"
#include "peerdrop/core/utils.hpp"
#include <algorithm>

namespace peerdrop::transfer {

FileSystemSource::FileSystemSource(std::filesystem::path path)
    : path_(std::move(path))
    , size_(core::utils::FileUtils::file_size(path_).value_or(0)) {
}

core::TransferResult FileSystemSource::read(std::uint64_t offset, std::size_t length, std::vector<std::uint8_t>& out) {
    out.clear();
    
    if (offset > size_) {
        return core::TransferResult(core::TransferError::READ_ERROR, "Read offset beyond end of " + path_.string());
    }
    
    if (!stream_.is_open()) {
        stream_.open(path_, std::ios::binary);
        if (!stream_.is_open()) {
            return core::TransferResult(core::TransferError::READ_ERROR, "Cannot open " + path_.string());
        }
    }
    
    auto to_read = static_cast<std::size_t>(std::min<std::uint64_t>(length, size_ - offset));
    out.resize(to_read);
    
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset));
    stream_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(to_read));
    
    if (static_cast<std::size_t>(stream_.gcount()) != to_read) {
        out.clear();
        return core::TransferResult(core::TransferError::READ_ERROR,
                                    "Short read at offset " + std::to_string(offset) + " of " + path_.string());
    }
    
    return core::TransferResult();
}

MemorySource::MemorySource(std::vector<std::uint8_t> data)
    : data_(std::move(data)) {
}

core::TransferResult MemorySource::read(std::uint64_t offset, std::size_t length, std::vector<std::uint8_t>& out) {
    out.clear();
    
    if (offset > data_.size()) {
        return core::TransferResult(core::TransferError::READ_ERROR, "Read offset beyond end of buffer");
    }
    
    auto to_read = static_cast<std::size_t>(std::min<std::uint64_t>(length, data_.size() - offset));
    out.assign(data_.begin() + static_cast<std::ptrdiff_t>(offset),
               data_.begin() + static_cast<std::ptrdiff_t>(offset + to_read));
    return core::TransferResult();
}

}
