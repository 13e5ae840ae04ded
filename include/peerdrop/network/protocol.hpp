#pragma once

#include "peerdrop/network/file_descriptor.hpp"
#include <concepts>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace peerdrop::network {

constexpr std::uint32_t PROTOCOL_MAGIC = 0x50445250; // "PDRP"
constexpr std::uint16_t PROTOCOL_VERSION = 1;
constexpr std::size_t CONTROL_HEADER_SIZE = 7;
constexpr std::size_t MAX_FRAME_SIZE = 16 * 1024 * 1024;

class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Transport-level kind of a channel message. Control messages and chunk
// frames are told apart by this tag, never by looking at the bytes.
enum class ChannelMessageKind : std::uint8_t {
    CONTROL = 0x01,
    BINARY  = 0x02
};

struct ChannelMessage {
    ChannelMessageKind kind = ChannelMessageKind::BINARY;
    std::vector<std::uint8_t> data;
};

enum class ControlType : std::uint8_t {
    BATCH_ANNOUNCE = 0x20
};

template<typename T>
concept MessagePayload = requires(T t) {
    { t.serialize() } -> std::convertible_to<std::vector<std::uint8_t>>;
    { T::deserialize(std::declval<std::span<const std::uint8_t>>()) } -> std::same_as<T>;
};

// Sent once per session before the first chunk of a batch
struct FileBatchAnnouncement {
    std::vector<FileDescriptor> files;
    
    std::vector<std::uint8_t> serialize() const;
    static FileBatchAnnouncement deserialize(std::span<const std::uint8_t> data);
};

enum class SignalingType : std::uint8_t {
    JOIN_ROOM     = 0x01,
    LEAVE_ROOM    = 0x02,
    WELCOME       = 0x03,
    USER_JOINED   = 0x04,
    OFFER         = 0x10,
    ANSWER        = 0x11,
    ICE_CANDIDATE = 0x12
};

const char* to_string(SignalingType type);

// Relay envelope. The relay reads room_id and target and fills in sender;
// payload is opaque to it.
struct SignalingMessage {
    SignalingType type = SignalingType::JOIN_ROOM;
    std::string room_id;
    std::string target;
    std::string sender;
    std::string payload;
    
    std::vector<std::uint8_t> serialize() const;
    static SignalingMessage deserialize(std::span<const std::uint8_t> data);
};

// [magic u32][version u16][type u8][body]
std::vector<std::uint8_t> encode_control(ControlType type, std::span<const std::uint8_t> body);
std::pair<ControlType, std::vector<std::uint8_t>> decode_control(std::span<const std::uint8_t> data);

template<MessagePayload T>
ChannelMessage make_control_message(ControlType type, const T& payload) {
    auto body = payload.serialize();
    return ChannelMessage{ChannelMessageKind::CONTROL, encode_control(type, body)};
}

}

static_assert(peerdrop::network::MessagePayload<peerdrop::network::FileBatchAnnouncement>);
static_assert(peerdrop::network::MessagePayload<peerdrop::network::SignalingMessage>);
