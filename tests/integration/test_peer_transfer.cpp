#include <gtest/gtest.h>
#include "peerdrop/crypto/random.hpp"
#include "peerdrop/network/relay_server.hpp"
#include "peerdrop/network/tcp_relay_client.hpp"
#include "peerdrop/network/tcp_transport.hpp"
#include "peerdrop/transfer/transfer_session.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <optional>

using namespace peerdrop;
using namespace std::chrono_literals;

namespace {

bool run_until(boost::asio::io_context& io_context, const std::function<bool()>& done,
               std::chrono::milliseconds timeout = 10s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done() && std::chrono::steady_clock::now() < deadline) {
        io_context.restart();
        io_context.run_for(10ms);
    }
    return done();
}

class CollectingObserver : public transfer::SessionObserver {
public:
    explicit CollectingObserver(boost::asio::io_context& io_context)
        : io_context_(io_context) {}
    
    void attach(std::weak_ptr<transfer::TransferSession> session) { session_ = std::move(session); }
    
    void on_state_changed(transfer::ConnectionStatus, transfer::SessionState state) override {
        states.push_back(state);
    }
    
    void on_files_announced(const std::vector<transfer::FileDescriptor>& files) override {
        announced = files;
        close_when_done();
    }
    
    void on_progress(const transfer::TransferProgress& progress) override {
        last_progress[progress.file_id] = progress;
    }
    
    void on_file_received(const transfer::FileDescriptor& descriptor, const std::vector<std::uint8_t>& data) override {
        received[descriptor.file_id] = std::make_pair(descriptor, data);
        close_when_done();
    }
    
    void on_batch_sent(std::size_t sent, std::size_t failed) override {
        batch = std::make_pair(sent, failed);
        if (close_on_failed_batch && failed > 0) {
            post_close();
        }
    }
    
    void on_error(const std::string& file_id, const core::TransferResult& error) override {
        errors.push_back(file_id + ": " + error.message);
    }
    
    std::vector<transfer::SessionState> states;
    std::vector<transfer::FileDescriptor> announced;
    std::map<std::string, transfer::TransferProgress> last_progress;
    std::map<std::string, std::pair<transfer::FileDescriptor, std::vector<std::uint8_t>>> received;
    std::optional<std::pair<std::size_t, std::size_t>> batch;
    std::vector<std::string> errors;
    bool close_on_receipt = false;
    bool close_on_failed_batch = false;
    
private:
    void close_when_done() {
        if (!close_on_receipt || announced.empty() || received.size() < announced.size()) {
            return;
        }
        post_close();
    }
    
    void post_close() {
        boost::asio::post(io_context_, [weak = session_]() {
            if (auto session = weak.lock()) {
                session->close();
            }
        });
    }
    
    boost::asio::io_context& io_context_;
    std::weak_ptr<transfer::TransferSession> session_;
};

std::vector<std::uint8_t> pattern(std::size_t size, std::uint8_t seed) {
    std::vector<std::uint8_t> data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::uint8_t>((i * 131 + seed) & 0xFF);
    }
    return data;
}

}

class PeerTransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(crypto::SecureRandom::initialize());
        relay_ = std::make_unique<network::RelayServer>(0, "127.0.0.1");
        ASSERT_TRUE(relay_->start());
    }
    
    void TearDown() override {
        relay_->stop();
    }
    
    std::shared_ptr<network::TcpRelayClient> make_relay_client() {
        return std::make_shared<network::TcpRelayClient>(io_context_, "127.0.0.1", relay_->get_port());
    }
    
    boost::asio::io_context io_context_;
    std::unique_ptr<network::RelayServer> relay_;
};

TEST_F(PeerTransferTest, RelayIntroducesRoomMembers) {
    auto alice = make_relay_client();
    auto bob = make_relay_client();
    
    std::vector<network::RelayEvent> alice_events;
    std::vector<network::RelayEvent> bob_events;
    alice->set_event_handler([&](const network::RelayEvent& event) { alice_events.push_back(event); });
    bob->set_event_handler([&](const network::RelayEvent& event) { bob_events.push_back(event); });
    
    alice->connect();
    alice->join_room("room-1");
    ASSERT_TRUE(run_until(io_context_, [&] { return relay_->room_size("room-1") == 1 && !alice->handle().empty(); }));
    
    bob->connect();
    bob->join_room("room-1");
    ASSERT_TRUE(run_until(io_context_, [&] { return !alice_events.empty() && !bob->handle().empty(); }));
    
    EXPECT_EQ(alice_events[0].type, network::SignalingType::USER_JOINED);
    EXPECT_EQ(alice_events[0].sender, bob->handle());
    EXPECT_NE(alice->handle(), bob->handle());
    
    alice->send_offer(bob->handle(), "opaque offer");
    ASSERT_TRUE(run_until(io_context_, [&] { return !bob_events.empty(); }));
    EXPECT_EQ(bob_events[0].type, network::SignalingType::OFFER);
    EXPECT_EQ(bob_events[0].sender, alice->handle());
    EXPECT_EQ(bob_events[0].payload, "opaque offer");
    
    // Nobody else in the room hears about it
    EXPECT_EQ(alice_events.size(), 1u);
    
    bob->close();
    ASSERT_TRUE(run_until(io_context_, [&] { return relay_->room_size("room-1") == 1; }));
    
    alice->close();
}

TEST_F(PeerTransferTest, MessagesToUnknownHandlesAreDropped) {
    auto alice = make_relay_client();
    std::vector<network::RelayEvent> events;
    alice->set_event_handler([&](const network::RelayEvent& event) { events.push_back(event); });
    
    alice->connect();
    alice->join_room("room-2");
    alice->send_candidate("peer-999", "10.0.0.1:1000");
    ASSERT_TRUE(run_until(io_context_, [&] { return relay_->room_size("room-2") == 1; }));
    
    run_until(io_context_, [] { return false; }, 100ms);
    EXPECT_TRUE(events.empty());
    EXPECT_TRUE(alice->is_connected());
    
    alice->close();
}

TEST_F(PeerTransferTest, TransportsOpenChannelWithMatchingToken) {
    auto offerer = std::make_shared<network::TcpPeerTransport>(io_context_, "127.0.0.1", "127.0.0.1");
    auto answerer = std::make_shared<network::TcpPeerTransport>(io_context_, "127.0.0.1", "127.0.0.1");
    
    std::vector<std::string> candidates;
    std::shared_ptr<network::ByteChannel> offer_channel;
    std::shared_ptr<network::ByteChannel> answer_channel;
    std::vector<network::ChannelMessage> received;
    
    network::TransportHandlers offer_handlers;
    offer_handlers.on_local_candidate = [&](const std::string& candidate) { candidates.push_back(candidate); };
    offer_handlers.on_channel_open = [&](std::shared_ptr<network::ByteChannel> channel) { offer_channel = channel; };
    offer_handlers.on_channel_message = [&](network::ChannelMessage message) { received.push_back(std::move(message)); };
    offerer->set_handlers(offer_handlers);
    
    network::TransportHandlers answer_handlers;
    answer_handlers.on_channel_open = [&](std::shared_ptr<network::ByteChannel> channel) { answer_channel = channel; };
    answerer->set_handlers(answer_handlers);
    
    auto offer = offerer->create_offer();
    EXPECT_EQ(offer.rfind(network::TcpPeerTransport::DESCRIPTION_PREFIX, 0), 0u);
    EXPECT_GT(offerer->listening_port(), 0);
    
    auto answer = answerer->accept_offer(offer);
    EXPECT_NO_THROW(offerer->accept_answer(answer));
    EXPECT_THROW(offerer->accept_answer("peerdrop-tcp/1 someone-else"), network::ProtocolError);
    
    ASSERT_TRUE(run_until(io_context_, [&] { return !candidates.empty(); }));
    EXPECT_EQ(candidates[0], "127.0.0.1:" + std::to_string(offerer->listening_port()));
    
    answerer->add_remote_candidate(candidates[0]);
    ASSERT_TRUE(run_until(io_context_, [&] { return offer_channel && answer_channel; }));
    
    auto payload = pattern(1000, 3);
    ASSERT_TRUE(answer_channel->send(network::ChannelMessage{network::ChannelMessageKind::BINARY, payload}).success());
    ASSERT_TRUE(run_until(io_context_, [&] { return !received.empty(); }));
    
    // The hello token is consumed by the transport and never surfaces
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].kind, network::ChannelMessageKind::BINARY);
    EXPECT_EQ(received[0].data, payload);
    
    offerer->close();
    answerer->close();
}

TEST_F(PeerTransferTest, OffererRejectsForgedToken) {
    auto offerer = std::make_shared<network::TcpPeerTransport>(io_context_, "127.0.0.1", "127.0.0.1");
    auto intruder = std::make_shared<network::TcpPeerTransport>(io_context_, "127.0.0.1", "127.0.0.1");
    
    bool offer_open = false;
    bool intruder_closed = false;
    network::TransportHandlers offer_handlers;
    offer_handlers.on_channel_open = [&](std::shared_ptr<network::ByteChannel>) { offer_open = true; };
    offerer->set_handlers(offer_handlers);
    
    network::TransportHandlers intruder_handlers;
    intruder_handlers.on_channel_closed = [&]() { intruder_closed = true; };
    intruder->set_handlers(intruder_handlers);
    
    offerer->create_offer();
    intruder->accept_offer("peerdrop-tcp/1 forged-token");
    intruder->add_remote_candidate("127.0.0.1:" + std::to_string(offerer->listening_port()));
    
    ASSERT_TRUE(run_until(io_context_, [&] { return intruder_closed; }));
    EXPECT_FALSE(offer_open);
    
    offerer->close();
    intruder->close();
}

TEST_F(PeerTransferTest, TransportFailsWhenNoCandidateAnswers) {
    auto answerer = std::make_shared<network::TcpPeerTransport>(io_context_, "127.0.0.1", "127.0.0.1");
    
    std::string failure;
    network::TransportHandlers handlers;
    handlers.on_failed = [&](const std::string& reason) { failure = reason; };
    answerer->set_handlers(handlers);
    
    // Grab a free port, then release it so nothing listens there
    std::uint16_t dead_port;
    {
        network::tcp::acceptor probe(io_context_, network::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        dead_port = probe.local_endpoint().port();
    }
    
    answerer->accept_offer("peerdrop-tcp/1 token");
    EXPECT_THROW(answerer->add_remote_candidate("not-a-candidate"), network::ProtocolError);
    answerer->add_remote_candidate("127.0.0.1:" + std::to_string(dead_port));
    
    ASSERT_TRUE(run_until(io_context_, [&] { return !failure.empty(); }));
    EXPECT_EQ(failure, "No reachable candidate");
    
    answerer->close();
}

TEST_F(PeerTransferTest, DescriptionParsing) {
    EXPECT_EQ(network::TcpPeerTransport::parse_description("peerdrop-tcp/1 abc"), "abc");
    EXPECT_THROW(network::TcpPeerTransport::parse_description("v=0 o=- 46117 2 IN IP4"), network::ProtocolError);
    EXPECT_THROW(network::TcpPeerTransport::parse_description("peerdrop-tcp/1"), network::ProtocolError);
}

TEST_F(PeerTransferTest, SendsBatchEndToEnd) {
    auto session_id = crypto::SecureRandom::generate_session_id();
    
    auto big = pattern(300000, 1);
    auto text = std::vector<std::uint8_t>{'h', 'e', 'l', 'l', 'o', '\n'};
    
    std::vector<transfer::OutgoingFile> files;
    files.push_back({transfer::FileDescriptor(crypto::SecureRandom::generate_file_id(), "big.bin", big.size(),
                                              "application/octet-stream"),
                     std::make_shared<transfer::MemorySource>(big)});
    files.push_back({transfer::FileDescriptor(crypto::SecureRandom::generate_file_id(), "empty.txt", 0, "text/plain"),
                     std::make_shared<transfer::MemorySource>(std::vector<std::uint8_t>{})});
    files.push_back({transfer::FileDescriptor(crypto::SecureRandom::generate_file_id(), "hello.txt", text.size(),
                                              "text/plain"),
                     std::make_shared<transfer::MemorySource>(text)});
    auto expected = files;
    
    auto sender_observer = std::make_shared<CollectingObserver>(io_context_);
    auto sender_relay = make_relay_client();
    auto sender = std::make_shared<transfer::TransferSession>(
        io_context_, session_id, transfer::SessionRole::INITIATOR, sender_relay,
        std::make_shared<network::TcpPeerTransport>(io_context_, "127.0.0.1", "127.0.0.1"), sender_observer);
    sender_observer->attach(sender);
    
    auto receiver_observer = std::make_shared<CollectingObserver>(io_context_);
    receiver_observer->close_on_receipt = true;
    auto receiver_relay = make_relay_client();
    auto receiver = std::make_shared<transfer::TransferSession>(
        io_context_, session_id, transfer::SessionRole::RESPONDER, receiver_relay,
        std::make_shared<network::TcpPeerTransport>(io_context_, "127.0.0.1", "127.0.0.1"), receiver_observer);
    receiver_observer->attach(receiver);
    
    ASSERT_TRUE(sender->queue_files(std::move(files)).success());
    
    sender_relay->connect();
    ASSERT_TRUE(sender->start().success());
    ASSERT_TRUE(run_until(io_context_, [&] { return relay_->room_size(session_id) == 1; }));
    EXPECT_EQ(sender->state(), transfer::SessionState::AWAITING_PEER);
    
    receiver_relay->connect();
    ASSERT_TRUE(receiver->start().success());
    
    ASSERT_TRUE(run_until(io_context_, [&] { return sender->is_terminal() && receiver->is_terminal(); }, 20s));
    
    EXPECT_TRUE(sender_observer->errors.empty());
    EXPECT_TRUE(receiver_observer->errors.empty());
    EXPECT_EQ(sender->state(), transfer::SessionState::CLOSED);
    EXPECT_EQ(receiver->state(), transfer::SessionState::CLOSED);
    
    std::vector<transfer::SessionState> sender_states = {
        transfer::SessionState::AWAITING_PEER, transfer::SessionState::NEGOTIATING,
        transfer::SessionState::OPEN, transfer::SessionState::CLOSED};
    EXPECT_EQ(sender_observer->states, sender_states);
    
    ASSERT_TRUE(sender_observer->batch.has_value());
    EXPECT_EQ(*sender_observer->batch, std::make_pair(std::size_t{3}, std::size_t{0}));
    
    ASSERT_EQ(receiver_observer->announced.size(), 3u);
    ASSERT_EQ(receiver_observer->received.size(), 3u);
    
    std::map<std::string, std::vector<std::uint8_t>> contents = {
        {expected[0].descriptor.file_id, big},
        {expected[1].descriptor.file_id, {}},
        {expected[2].descriptor.file_id, text}};
    
    for (const auto& file : expected) {
        auto it = receiver_observer->received.find(file.descriptor.file_id);
        ASSERT_NE(it, receiver_observer->received.end()) << file.descriptor.name;
        EXPECT_EQ(it->second.first, file.descriptor);
        EXPECT_EQ(it->second.second, contents[file.descriptor.file_id]);
        
        auto progress = receiver_observer->last_progress.find(file.descriptor.file_id);
        ASSERT_NE(progress, receiver_observer->last_progress.end());
        EXPECT_EQ(progress->second.bytes_transferred, file.descriptor.size_bytes);
        EXPECT_EQ(progress->second.total_bytes, file.descriptor.size_bytes);
        EXPECT_EQ(progress->second.eta_seconds, 0.0);
    }
    
    sender_relay->close();
    receiver_relay->close();
}

TEST_F(PeerTransferTest, SenderClosingAfterFailedFileStillDeliversQueuedFrames) {
    auto session_id = crypto::SecureRandom::generate_session_id();
    
    // Large enough that most of its chunks are still queued when the batch ends
    auto good = pattern(3 * 1024 * 1024, 9);
    
    std::vector<transfer::OutgoingFile> files;
    files.push_back({transfer::FileDescriptor(crypto::SecureRandom::generate_file_id(), "good.bin", good.size(),
                                              "application/octet-stream"),
                     std::make_shared<transfer::MemorySource>(good)});
    files.push_back({transfer::FileDescriptor(crypto::SecureRandom::generate_file_id(), "truncated.bin", 10,
                                              "application/octet-stream"),
                     std::make_shared<transfer::MemorySource>(std::vector<std::uint8_t>(5, 0x11))});
    auto good_id = files[0].descriptor.file_id;
    
    auto sender_observer = std::make_shared<CollectingObserver>(io_context_);
    sender_observer->close_on_failed_batch = true;
    auto sender_relay = make_relay_client();
    auto sender = std::make_shared<transfer::TransferSession>(
        io_context_, session_id, transfer::SessionRole::INITIATOR, sender_relay,
        std::make_shared<network::TcpPeerTransport>(io_context_, "127.0.0.1", "127.0.0.1"), sender_observer);
    sender_observer->attach(sender);
    
    auto receiver_observer = std::make_shared<CollectingObserver>(io_context_);
    auto receiver_relay = make_relay_client();
    auto receiver = std::make_shared<transfer::TransferSession>(
        io_context_, session_id, transfer::SessionRole::RESPONDER, receiver_relay,
        std::make_shared<network::TcpPeerTransport>(io_context_, "127.0.0.1", "127.0.0.1"), receiver_observer);
    receiver_observer->attach(receiver);
    
    ASSERT_TRUE(sender->queue_files(std::move(files)).success());
    
    sender_relay->connect();
    ASSERT_TRUE(sender->start().success());
    ASSERT_TRUE(run_until(io_context_, [&] { return relay_->room_size(session_id) == 1; }));
    
    receiver_relay->connect();
    ASSERT_TRUE(receiver->start().success());
    
    ASSERT_TRUE(run_until(io_context_, [&] { return sender->is_terminal() && receiver->is_terminal(); }, 20s));
    
    EXPECT_EQ(sender->state(), transfer::SessionState::CLOSED);
    ASSERT_TRUE(sender_observer->batch.has_value());
    EXPECT_EQ(*sender_observer->batch, std::make_pair(std::size_t{1}, std::size_t{1}));
    ASSERT_EQ(sender_observer->errors.size(), 1u);
    
    EXPECT_EQ(receiver_observer->announced.size(), 2u);
    ASSERT_EQ(receiver_observer->received.size(), 1u);
    auto it = receiver_observer->received.find(good_id);
    ASSERT_NE(it, receiver_observer->received.end());
    EXPECT_EQ(it->second.second, good);
    
    sender_relay->close();
    receiver_relay->close();
}

TEST_F(PeerTransferTest, ClosedConnectionFlushesQueuedFrames) {
    using boost::asio::ip::tcp;
    
    tcp::acceptor acceptor(io_context_, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    tcp::socket accepted(io_context_);
    bool accepted_ok = false;
    acceptor.async_accept(accepted, [&](const boost::system::error_code& ec) { accepted_ok = !ec; });
    
    tcp::socket connecting(io_context_);
    bool connected_ok = false;
    connecting.async_connect(acceptor.local_endpoint(), [&](const boost::system::error_code& ec) { connected_ok = !ec; });
    ASSERT_TRUE(run_until(io_context_, [&] { return accepted_ok && connected_ok; }));
    
    auto writer = std::make_shared<network::Connection>(io_context_, std::move(connecting));
    auto reader = std::make_shared<network::Connection>(io_context_, std::move(accepted));
    
    std::size_t frames_received = 0;
    bool reader_closed = false;
    reader->set_message_handler([&](network::ChannelMessage message) {
        if (message.data.size() == 65580) {
            ++frames_received;
        }
    });
    reader->set_disconnect_handler([&](std::shared_ptr<network::Connection>) { reader_closed = true; });
    
    bool writer_closed = false;
    writer->set_disconnect_handler([&](std::shared_ptr<network::Connection>) { writer_closed = true; });
    writer->start();
    reader->start();
    
    constexpr std::size_t frame_count = 64;
    for (std::size_t i = 0; i < frame_count; ++i) {
        ASSERT_TRUE(writer->send(network::ChannelMessageKind::BINARY, pattern(65580, static_cast<std::uint8_t>(i))));
    }
    EXPECT_GT(writer->buffered_amount(), 0u);
    
    writer->close();
    EXPECT_TRUE(writer_closed);
    EXPECT_FALSE(writer->is_connected());
    EXPECT_FALSE(writer->send(network::ChannelMessageKind::BINARY, {1}));
    
    ASSERT_TRUE(run_until(io_context_, [&] { return reader_closed; }));
    EXPECT_EQ(frames_received, frame_count);
    
    ASSERT_TRUE(run_until(io_context_, [&] { return writer->get_state() == network::ConnectionState::DISCONNECTED; }));
    EXPECT_EQ(writer->buffered_amount(), 0u);
}
