#include "peerdrop/crypto/random.hpp"
#include "peerdrop/core/logger.hpp"
#include <sodium.h>
#include <array>
#include <stdexcept>

namespace peerdrop::crypto {

bool SecureRandom::initialized_ = false;

bool SecureRandom::initialize() {
    if (initialized_) {
        return true;
    }
    
    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }
    
    initialized_ = true;
    LOG_DEBUG("Random identifier generator initialized");
    return true;
}

core::TransferResult SecureRandom::generate_bytes(std::span<std::uint8_t> output) {
    if (!initialize()) {
        return core::TransferResult(core::TransferError::INVALID_STATE, "Random generator not initialized");
    }
    
    if (output.empty()) {
        return core::TransferResult(core::TransferError::INVALID_STATE, "Output buffer is empty");
    }
    
    randombytes_buf(output.data(), output.size());
    return core::TransferResult();
}

std::vector<std::uint8_t> SecureRandom::generate_bytes(std::size_t count) {
    std::vector<std::uint8_t> result(count);
    auto status = generate_bytes(std::span<std::uint8_t>(result));
    if (!status.success()) {
        throw std::runtime_error("Failed to generate random bytes: " + status.message);
    }
    return result;
}

std::string SecureRandom::generate_uuid() {
    std::array<std::uint8_t, 16> bytes{};
    auto status = generate_bytes(std::span<std::uint8_t>(bytes));
    if (!status.success()) {
        throw std::runtime_error("Failed to generate UUID: " + status.message);
    }
    
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);
    
    std::array<char, 33> hex{};
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
    
    std::string raw(hex.data(), 32);
    return raw.substr(0, 8) + "-" + raw.substr(8, 4) + "-" + raw.substr(12, 4) + "-" +
           raw.substr(16, 4) + "-" + raw.substr(20, 12);
}

std::string SecureRandom::generate_session_id() {
    return generate_uuid().substr(0, 8);
}

}
