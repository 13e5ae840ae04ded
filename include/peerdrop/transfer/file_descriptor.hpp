#pragma once

#include "peerdrop/network/file_descriptor.hpp"
#include <filesystem>
#include <string>

namespace peerdrop::transfer {

using network::FileDescriptor;

// Throws std::filesystem::filesystem_error when the path cannot be stat'ed
FileDescriptor describe_file(const std::filesystem::path& path, const std::string& file_id);

std::string guess_mime_type(const std::filesystem::path& path);

}
