#include "peerdrop/network/protocol.hpp"
#include <algorithm>

namespace peerdrop::network {

namespace {
    constexpr std::uint32_t MAX_BATCH_FILES = 65536;
    
    void write_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value) {
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }
    
    void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
        buffer.push_back((value >> 24) & 0xFF);
        buffer.push_back((value >> 16) & 0xFF);
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }
    
    void write_uint64(std::vector<std::uint8_t>& buffer, std::uint64_t value) {
        buffer.push_back((value >> 56) & 0xFF);
        buffer.push_back((value >> 48) & 0xFF);
        buffer.push_back((value >> 40) & 0xFF);
        buffer.push_back((value >> 32) & 0xFF);
        buffer.push_back((value >> 24) & 0xFF);
        buffer.push_back((value >> 16) & 0xFF);
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }
    
    void write_string(std::vector<std::uint8_t>& buffer, const std::string& str) {
        write_uint32(buffer, static_cast<std::uint32_t>(str.size()));
        buffer.insert(buffer.end(), str.begin(), str.end());
    }
    
    std::uint8_t read_uint8(std::span<const std::uint8_t>& data) {
        if (data.empty()) throw ProtocolError("Insufficient data for uint8");
        auto value = data[0];
        data = data.subspan(1);
        return value;
    }
    
    std::uint16_t read_uint16(std::span<const std::uint8_t>& data) {
        if (data.size() < 2) throw ProtocolError("Insufficient data for uint16");
        std::uint16_t value = static_cast<std::uint16_t>((static_cast<std::uint16_t>(data[0]) << 8) |
                                                         static_cast<std::uint16_t>(data[1]));
        data = data.subspan(2);
        return value;
    }
    
    std::uint32_t read_uint32(std::span<const std::uint8_t>& data) {
        if (data.size() < 4) throw ProtocolError("Insufficient data for uint32");
        std::uint32_t value = (static_cast<std::uint32_t>(data[0]) << 24) |
                             (static_cast<std::uint32_t>(data[1]) << 16) |
                             (static_cast<std::uint32_t>(data[2]) << 8) |
                             static_cast<std::uint32_t>(data[3]);
        data = data.subspan(4);
        return value;
    }
    
    std::uint64_t read_uint64(std::span<const std::uint8_t>& data) {
        if (data.size() < 8) throw ProtocolError("Insufficient data for uint64");
        std::uint64_t value = (static_cast<std::uint64_t>(data[0]) << 56) |
                             (static_cast<std::uint64_t>(data[1]) << 48) |
                             (static_cast<std::uint64_t>(data[2]) << 40) |
                             (static_cast<std::uint64_t>(data[3]) << 32) |
                             (static_cast<std::uint64_t>(data[4]) << 24) |
                             (static_cast<std::uint64_t>(data[5]) << 16) |
                             (static_cast<std::uint64_t>(data[6]) << 8) |
                             static_cast<std::uint64_t>(data[7]);
        data = data.subspan(8);
        return value;
    }
    
    std::string read_string(std::span<const std::uint8_t>& data) {
        auto length = read_uint32(data);
        if (data.size() < length) throw ProtocolError("Insufficient data for string");
        std::string str(reinterpret_cast<const char*>(data.data()), length);
        data = data.subspan(length);
        return str;
    }
    
    bool is_known_signaling_type(std::uint8_t value) {
        switch (static_cast<SignalingType>(value)) {
            case SignalingType::JOIN_ROOM:
            case SignalingType::LEAVE_ROOM:
            case SignalingType::WELCOME:
            case SignalingType::USER_JOINED:
            case SignalingType::OFFER:
            case SignalingType::ANSWER:
            case SignalingType::ICE_CANDIDATE:
                return true;
        }
        return false;
    }
}

const char* to_string(SignalingType type) {
    switch (type) {
        case SignalingType::JOIN_ROOM: return "join-room";
        case SignalingType::LEAVE_ROOM: return "leave-room";
        case SignalingType::WELCOME: return "welcome";
        case SignalingType::USER_JOINED: return "user-joined";
        case SignalingType::OFFER: return "offer";
        case SignalingType::ANSWER: return "answer";
        case SignalingType::ICE_CANDIDATE: return "ice-candidate";
    }
    return "unknown";
}

std::vector<std::uint8_t> FileBatchAnnouncement::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint32(buffer, static_cast<std::uint32_t>(files.size()));
    for (const auto& file : files) {
        write_string(buffer, file.file_id);
        write_string(buffer, file.name);
        write_uint64(buffer, file.size_bytes);
        write_string(buffer, file.mime_type);
    }
    return buffer;
}

FileBatchAnnouncement FileBatchAnnouncement::deserialize(std::span<const std::uint8_t> data) {
    FileBatchAnnouncement msg;
    auto span = data;
    auto count = read_uint32(span);
    if (count > MAX_BATCH_FILES) {
        throw ProtocolError("Batch announcement lists too many files");
    }
    msg.files.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        FileDescriptor file;
        file.file_id = read_string(span);
        file.name = read_string(span);
        file.size_bytes = read_uint64(span);
        file.mime_type = read_string(span);
        msg.files.push_back(std::move(file));
    }
    return msg;
}

std::vector<std::uint8_t> SignalingMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.push_back(static_cast<std::uint8_t>(type));
    write_string(buffer, room_id);
    write_string(buffer, target);
    write_string(buffer, sender);
    write_string(buffer, payload);
    return buffer;
}

SignalingMessage SignalingMessage::deserialize(std::span<const std::uint8_t> data) {
    SignalingMessage msg;
    auto span = data;
    auto type = read_uint8(span);
    if (!is_known_signaling_type(type)) {
        throw ProtocolError("Unknown signaling message type " + std::to_string(type));
    }
    msg.type = static_cast<SignalingType>(type);
    msg.room_id = read_string(span);
    msg.target = read_string(span);
    msg.sender = read_string(span);
    msg.payload = read_string(span);
    return msg;
}

std::vector<std::uint8_t> encode_control(ControlType type, std::span<const std::uint8_t> body) {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(CONTROL_HEADER_SIZE + body.size());
    write_uint32(buffer, PROTOCOL_MAGIC);
    write_uint16(buffer, PROTOCOL_VERSION);
    buffer.push_back(static_cast<std::uint8_t>(type));
    buffer.insert(buffer.end(), body.begin(), body.end());
    return buffer;
}

std::pair<ControlType, std::vector<std::uint8_t>> decode_control(std::span<const std::uint8_t> data) {
    if (data.size() < CONTROL_HEADER_SIZE) {
        throw ProtocolError("Insufficient data for control header");
    }
    
    auto span = data;
    if (read_uint32(span) != PROTOCOL_MAGIC) {
        throw ProtocolError("Invalid control message magic");
    }
    auto version = read_uint16(span);
    if (version != PROTOCOL_VERSION) {
        throw ProtocolError("Unsupported protocol version " + std::to_string(version));
    }
    auto type = static_cast<ControlType>(read_uint8(span));
    if (type != ControlType::BATCH_ANNOUNCE) {
        throw ProtocolError("Unknown control message type");
    }
    
    return {type, std::vector<std::uint8_t>(span.begin(), span.end())};
}

}
