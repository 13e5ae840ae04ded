#include "peerdrop/transfer/file_descriptor.hpp"
#include "peerdrop/core/utils.hpp"
#include <unordered_map>

namespace peerdrop::transfer {

FileDescriptor describe_file(const std::filesystem::path& path, const std::string& file_id) {
    FileDescriptor descriptor;
    descriptor.file_id = file_id;
    descriptor.name = path.filename().string();
    descriptor.size_bytes = std::filesystem::file_size(path);
    descriptor.mime_type = guess_mime_type(path);
    return descriptor;
}

std::string guess_mime_type(const std::filesystem::path& path) {
    static const std::unordered_map<std::string, std::string> mime_types = {
        {".txt", "text/plain"},
        {".md", "text/markdown"},
        {".csv", "text/csv"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".svg", "image/svg+xml"},
        {".webp", "image/webp"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".mp4", "video/mp4"},
        {".webm", "video/webm"},
    };
    
    auto extension = core::utils::FileUtils::get_file_extension(path);
    auto it = mime_types.find(extension);
    if (it != mime_types.end()) {
        return it->second;
    }
    return "application/octet-stream";
}

}
