#pragma once

#include "peerdrop/core/error.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace peerdrop::crypto {

// Identifier and token generation backed by libsodium
class SecureRandom {
public:
    static bool initialize();
    static bool is_initialized() { return initialized_; }
    
    static core::TransferResult generate_bytes(std::span<std::uint8_t> output);
    static std::vector<std::uint8_t> generate_bytes(std::size_t count);
    
    // RFC 4122 version 4 UUID, 36 characters
    static std::string generate_uuid();
    
    // 8 lowercase hex characters, the leading group of a fresh UUID
    static std::string generate_session_id();
    
    static std::string generate_file_id() { return generate_uuid(); }
    
private:
    static bool initialized_;
};

}
