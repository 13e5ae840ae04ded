#pragma once

#include "peerdrop/network/protocol.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace peerdrop::network {

constexpr std::size_t FILE_ID_FIELD_SIZE = 36;
constexpr std::size_t CHUNK_HEADER_SIZE = FILE_ID_FIELD_SIZE + 4 + 4;

class MalformedFrameError : public ProtocolError {
public:
    using ProtocolError::ProtocolError;
};

// On the wire: file id space-padded to 36 bytes, then chunk_index and
// total_chunks as little-endian u32.
struct ChunkHeader {
    std::string file_id;
    std::uint32_t chunk_index = 0;
    std::uint32_t total_chunks = 0;
    
    std::vector<std::uint8_t> serialize() const;
    static ChunkHeader deserialize(std::span<const std::uint8_t> data);
};

struct ChunkFrame {
    ChunkHeader header;
    std::vector<std::uint8_t> payload;
};

std::vector<std::uint8_t> encode_chunk(const std::string& file_id,
                                       std::uint32_t chunk_index,
                                       std::uint32_t total_chunks,
                                       std::span<const std::uint8_t> payload);

// Throws MalformedFrameError when the buffer is shorter than the header
ChunkFrame decode_chunk(std::span<const std::uint8_t> frame);

}
