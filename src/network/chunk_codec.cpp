#include "peerdrop/network/chunk_codec.hpp"
#include <algorithm>

namespace peerdrop::network {

namespace {
    void write_uint32_le(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
        buffer.push_back(value & 0xFF);
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back((value >> 16) & 0xFF);
        buffer.push_back((value >> 24) & 0xFF);
    }
    
    std::uint32_t read_uint32_le(std::span<const std::uint8_t> data) {
        return static_cast<std::uint32_t>(data[0]) |
               (static_cast<std::uint32_t>(data[1]) << 8) |
               (static_cast<std::uint32_t>(data[2]) << 16) |
               (static_cast<std::uint32_t>(data[3]) << 24);
    }
    
    void write_file_id(std::vector<std::uint8_t>& buffer, const std::string& file_id) {
        auto length = std::min(file_id.size(), FILE_ID_FIELD_SIZE);
        buffer.insert(buffer.end(), file_id.begin(), file_id.begin() + length);
        buffer.insert(buffer.end(), FILE_ID_FIELD_SIZE - length, static_cast<std::uint8_t>(' '));
    }
    
    std::string read_file_id(std::span<const std::uint8_t> data) {
        std::string id(reinterpret_cast<const char*>(data.data()), FILE_ID_FIELD_SIZE);
        auto end = id.find_last_not_of(' ');
        if (end == std::string::npos) {
            return "";
        }
        id.erase(end + 1);
        return id;
    }
}

std::vector<std::uint8_t> ChunkHeader::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(CHUNK_HEADER_SIZE);
    write_file_id(buffer, file_id);
    write_uint32_le(buffer, chunk_index);
    write_uint32_le(buffer, total_chunks);
    return buffer;
}

ChunkHeader ChunkHeader::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() < CHUNK_HEADER_SIZE) {
        throw MalformedFrameError("Chunk frame of " + std::to_string(data.size()) +
                                  " bytes is shorter than the " + std::to_string(CHUNK_HEADER_SIZE) +
                                  " byte header");
    }
    
    ChunkHeader header;
    header.file_id = read_file_id(data.subspan(0, FILE_ID_FIELD_SIZE));
    header.chunk_index = read_uint32_le(data.subspan(FILE_ID_FIELD_SIZE, 4));
    header.total_chunks = read_uint32_le(data.subspan(FILE_ID_FIELD_SIZE + 4, 4));
    return header;
}

std::vector<std::uint8_t> encode_chunk(const std::string& file_id,
                                       std::uint32_t chunk_index,
                                       std::uint32_t total_chunks,
                                       std::span<const std::uint8_t> payload) {
    std::vector<std::uint8_t> frame;
    frame.reserve(CHUNK_HEADER_SIZE + payload.size());
    write_file_id(frame, file_id);
    write_uint32_le(frame, chunk_index);
    write_uint32_le(frame, total_chunks);
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

ChunkFrame decode_chunk(std::span<const std::uint8_t> frame) {
    ChunkFrame chunk;
    chunk.header = ChunkHeader::deserialize(frame);
    auto payload = frame.subspan(CHUNK_HEADER_SIZE);
    chunk.payload.assign(payload.begin(), payload.end());
    return chunk;
}

}
