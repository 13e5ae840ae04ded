#include "peerdrop/transfer/file_sink.hpp"
#include "peerdrop/core/logger.hpp"
#include "peerdrop/core/utils.hpp"
#include <fstream>

namespace peerdrop::transfer {

FileSink::FileSink(std::filesystem::path output_dir)
    : output_dir_(std::move(output_dir)) {
}

core::TransferResult FileSink::save(const FileDescriptor& descriptor,
                                    const std::vector<std::uint8_t>& data,
                                    std::filesystem::path& saved_path) {
    if (!core::utils::FileUtils::create_directories(output_dir_)) {
        return core::TransferResult(core::TransferError::WRITE_ERROR,
                                    "Cannot create output directory " + output_dir_.string());
    }
    
    auto name = sanitize_filename(descriptor.name.empty() ? descriptor.file_id : descriptor.name);
    auto path = unique_path(name);
    
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return core::TransferResult(core::TransferError::WRITE_ERROR, "Cannot open " + path.string());
    }
    
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    file.close();
    if (!file) {
        return core::TransferResult(core::TransferError::WRITE_ERROR, "Failed writing " + path.string());
    }
    
    if (data.size() != descriptor.size_bytes) {
        LOG_WARN("{} announced {} bytes but {} arrived", descriptor.name, descriptor.size_bytes, data.size());
    }
    
    saved_path = path;
    LOG_INFO("Saved {} ({})", path.string(), core::utils::StringUtils::format_bytes(data.size()));
    return core::TransferResult();
}

std::string FileSink::sanitize_filename(const std::string& name) {
    // Only the last path component, never anything that climbs out of output_dir
    auto base = std::filesystem::path(name).filename().string();
    
    std::string result;
    result.reserve(base.size());
    for (char c : base) {
        if (c == '/' || c == '\\' || c == ':' || static_cast<unsigned char>(c) < 0x20) {
            result.push_back('_');
        } else {
            result.push_back(c);
        }
    }
    
    if (result.empty() || result == "." || result == "..") {
        return "download";
    }
    return result;
}

std::filesystem::path FileSink::unique_path(const std::string& name) const {
    auto candidate = output_dir_ / name;
    if (!std::filesystem::exists(candidate)) {
        return candidate;
    }
    
    auto stem = std::filesystem::path(name).stem().string();
    auto extension = std::filesystem::path(name).extension().string();
    for (int i = 1; ; ++i) {
        candidate = output_dir_ / (stem + " (" + std::to_string(i) + ")" + extension);
        if (!std::filesystem::exists(candidate)) {
            return candidate;
        }
    }
}

}
