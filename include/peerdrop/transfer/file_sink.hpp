#pragma once

#include "peerdrop/core/error.hpp"
#include "peerdrop/transfer/file_descriptor.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace peerdrop::transfer {

// Writes completed files into an output directory under their announced
// names. Existing files are never overwritten; a numeric suffix is added.
class FileSink {
public:
    explicit FileSink(std::filesystem::path output_dir);
    
    core::TransferResult save(const FileDescriptor& descriptor,
                              const std::vector<std::uint8_t>& data,
                              std::filesystem::path& saved_path);
    
    const std::filesystem::path& output_dir() const { return output_dir_; }
    
    static std::string sanitize_filename(const std::string& name);
    
private:
    std::filesystem::path output_dir_;
    
    std::filesystem::path unique_path(const std::string& name) const;
};

}
