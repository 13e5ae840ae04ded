#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace peerdrop::network {

// What a batch announcement says about one file
struct FileDescriptor {
    std::string file_id;
    std::string name;
    std::uint64_t size_bytes = 0;
    std::string mime_type;
    
    FileDescriptor() = default;
    FileDescriptor(std::string id, std::string file_name, std::uint64_t size, std::string mime)
        : file_id(std::move(id))
        , name(std::move(file_name))
        , size_bytes(size)
        , mime_type(std::move(mime)) {}
    
    bool operator==(const FileDescriptor& other) const = default;
};

}
