#include <gtest/gtest.h>
#include "peerdrop/network/protocol.hpp"

using namespace peerdrop::network;
using peerdrop::network::FileDescriptor;

class ProtocolTest : public ::testing::Test {
protected:
    FileBatchAnnouncement make_batch() {
        FileBatchAnnouncement batch;
        batch.files.emplace_back("id-1", "report.pdf", 200000, "application/pdf");
        batch.files.emplace_back("id-2", "empty.txt", 0, "text/plain");
        batch.files.emplace_back("id-3", "photo \xC3\xA9t\xC3\xA9.jpg", 5ull * 1024 * 1024 * 1024, "image/jpeg");
        return batch;
    }
};

TEST_F(ProtocolTest, BatchAnnouncementRoundTrip) {
    auto batch = make_batch();
    auto decoded = FileBatchAnnouncement::deserialize(batch.serialize());
    
    ASSERT_EQ(decoded.files.size(), 3u);
    EXPECT_EQ(decoded.files[0], batch.files[0]);
    EXPECT_EQ(decoded.files[1], batch.files[1]);
    EXPECT_EQ(decoded.files[2].size_bytes, 5ull * 1024 * 1024 * 1024);
    EXPECT_EQ(decoded.files[2].name, batch.files[2].name);
}

TEST_F(ProtocolTest, EmptyBatch) {
    FileBatchAnnouncement batch;
    auto decoded = FileBatchAnnouncement::deserialize(batch.serialize());
    EXPECT_TRUE(decoded.files.empty());
}

TEST_F(ProtocolTest, TruncatedBatchThrows) {
    auto data = make_batch().serialize();
    data.resize(data.size() - 3);
    EXPECT_THROW(FileBatchAnnouncement::deserialize(data), ProtocolError);
}

TEST_F(ProtocolTest, HugeFileCountRejected) {
    std::vector<std::uint8_t> data = {0xFF, 0xFF, 0xFF, 0xFF};
    EXPECT_THROW(FileBatchAnnouncement::deserialize(data), ProtocolError);
}

TEST_F(ProtocolTest, ControlEnvelope) {
    auto message = make_control_message(ControlType::BATCH_ANNOUNCE, make_batch());
    
    EXPECT_EQ(message.kind, ChannelMessageKind::CONTROL);
    ASSERT_GE(message.data.size(), CONTROL_HEADER_SIZE);
    EXPECT_EQ(message.data[0], 'P');
    EXPECT_EQ(message.data[1], 'D');
    EXPECT_EQ(message.data[2], 'R');
    EXPECT_EQ(message.data[3], 'P');
    
    auto [type, body] = decode_control(message.data);
    EXPECT_EQ(type, ControlType::BATCH_ANNOUNCE);
    EXPECT_EQ(FileBatchAnnouncement::deserialize(body).files.size(), 3u);
}

TEST_F(ProtocolTest, ControlRejectsBadMagic) {
    auto data = encode_control(ControlType::BATCH_ANNOUNCE, {});
    data[0] = 'X';
    EXPECT_THROW(decode_control(data), ProtocolError);
}

TEST_F(ProtocolTest, ControlRejectsOtherVersion) {
    auto data = encode_control(ControlType::BATCH_ANNOUNCE, {});
    data[5] = 0x02;
    EXPECT_THROW(decode_control(data), ProtocolError);
}

TEST_F(ProtocolTest, ControlRejectsUnknownType) {
    auto data = encode_control(ControlType::BATCH_ANNOUNCE, {});
    data[6] = 0x7F;
    EXPECT_THROW(decode_control(data), ProtocolError);
}

TEST_F(ProtocolTest, ControlRejectsShortBuffer) {
    std::vector<std::uint8_t> data = {'P', 'D', 'R'};
    EXPECT_THROW(decode_control(data), ProtocolError);
}

TEST_F(ProtocolTest, SignalingMessageRoundTrip) {
    SignalingMessage message;
    message.type = SignalingType::ICE_CANDIDATE;
    message.room_id = "a1b2c3d4";
    message.target = "peer-2";
    message.sender = "peer-1";
    message.payload = "127.0.0.1:40123";
    
    auto decoded = SignalingMessage::deserialize(message.serialize());
    EXPECT_EQ(decoded.type, SignalingType::ICE_CANDIDATE);
    EXPECT_EQ(decoded.room_id, "a1b2c3d4");
    EXPECT_EQ(decoded.target, "peer-2");
    EXPECT_EQ(decoded.sender, "peer-1");
    EXPECT_EQ(decoded.payload, "127.0.0.1:40123");
}

TEST_F(ProtocolTest, SignalingRejectsUnknownType) {
    SignalingMessage message;
    auto data = message.serialize();
    data[0] = 0x55;
    EXPECT_THROW(SignalingMessage::deserialize(data), ProtocolError);
}

TEST_F(ProtocolTest, SignalingTypeNames) {
    EXPECT_STREQ(to_string(SignalingType::JOIN_ROOM), "join-room");
    EXPECT_STREQ(to_string(SignalingType::USER_JOINED), "user-joined");
    EXPECT_STREQ(to_string(SignalingType::ICE_CANDIDATE), "ice-candidate");
}
