#pragma once

#include "peerdrop/core/error.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>

namespace peerdrop::transfer {

// Random-access byte source for an outgoing file. Contents are assumed
// stable for the lifetime of the session.
class FileSource {
public:
    virtual ~FileSource() = default;
    
    virtual std::uint64_t size() const = 0;
    
    // Replaces `out` with up to `length` bytes starting at `offset`.
    // Fails with READ_ERROR; a short read before size() is an error too.
    virtual core::TransferResult read(std::uint64_t offset, std::size_t length, std::vector<std::uint8_t>& out) = 0;
};

class FileSystemSource : public FileSource {
public:
    explicit FileSystemSource(std::filesystem::path path);
    
    std::uint64_t size() const override { return size_; }
    core::TransferResult read(std::uint64_t offset, std::size_t length, std::vector<std::uint8_t>& out) override;
    
    const std::filesystem::path& path() const { return path_; }
    
private:
    std::filesystem::path path_;
    std::uint64_t size_;
    std::ifstream stream_;
};

class MemorySource : public FileSource {
public:
    explicit MemorySource(std::vector<std::uint8_t> data);
    
    std::uint64_t size() const override { return data_.size(); }
    core::TransferResult read(std::uint64_t offset, std::size_t length, std::vector<std::uint8_t>& out) override;
    
private:
    std::vector<std::uint8_t> data_;
};

}
