#pragma once

#include "peerdrop/core/error.hpp"
#include "peerdrop/network/byte_channel.hpp"
#include "peerdrop/network/peer_transport.hpp"
#include "peerdrop/network/relay_client.hpp"
#include "peerdrop/transfer/flow_control.hpp"
#include "peerdrop/transfer/reassembly_buffer.hpp"
#include "peerdrop/transfer/session_observer.hpp"
#include <boost/asio.hpp>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace peerdrop::transfer {

// One file-sharing interaction between two endpoints.
//
// Drives the signaling handshake for its role, owns the byte-channel once
// it opens, and routes channel traffic into a FlowControlledSender and a
// ReassemblyBuffer. Relay, transport and channel events are expected on
// the io_context thread and are handled one at a time; public methods must
// be called from that thread as well.
//
//   Idle -> AwaitingPeer -> Negotiating -> Open -> Closed
//   (responder: Idle -> Negotiating), Failed from any non-terminal state
class TransferSession : public std::enable_shared_from_this<TransferSession> {
public:
    TransferSession(boost::asio::io_context& io_context,
                    std::string session_id,
                    SessionRole role,
                    std::shared_ptr<network::RelayClient> relay,
                    std::shared_ptr<network::PeerTransport> transport,
                    std::shared_ptr<SessionObserver> observer,
                    SenderOptions sender_options = {});
    ~TransferSession();
    
    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;
    
    // Registers with the relay under the session id
    core::TransferResult start();
    
    // Files go out, announcement first, as soon as the channel is open
    core::TransferResult queue_files(std::vector<OutgoingFile> files);
    
    // Explicit teardown; safe to call at any point
    void close();
    
    void handle_relay_event(const network::RelayEvent& event);
    void handle_local_candidate(const std::string& candidate);
    void handle_channel_open(std::shared_ptr<network::ByteChannel> channel);
    void handle_channel_message(network::ChannelMessage message);
    void handle_channel_closed();
    void handle_transport_failure(const std::string& reason);
    
    const std::string& session_id() const { return session_id_; }
    SessionRole role() const { return role_; }
    SessionState state() const { return state_; }
    ConnectionStatus status() const { return to_connection_status(state_); }
    const std::optional<std::string>& peer_handle() const { return peer_handle_; }
    bool is_terminal() const { return state_ == SessionState::CLOSED || state_ == SessionState::FAILED; }
    
    std::size_t pending_files() const { return pending_files_.size(); }
    std::size_t receiving_files() const { return reassembly_.in_flight(); }
    std::size_t ignored_messages() const { return ignored_messages_; }
    bool is_sending() const { return sender_ && sender_->is_active(); }
    std::optional<FileDescriptor> announced_file(const std::string& file_id) const;
    
private:
    void on_user_joined(const network::RelayEvent& event);
    void on_offer(const network::RelayEvent& event);
    void on_answer(const network::RelayEvent& event);
    void on_remote_candidate(const network::RelayEvent& event);
    
    void on_control_message(const std::vector<std::uint8_t>& data);
    void on_chunk_frame(const std::vector<std::uint8_t>& data);
    
    void start_sending();
    void ignore_stale(const network::RelayEvent& event, const char* reason);
    bool is_from_peer(const network::RelayEvent& event) const;
    
    void transition(SessionState next);
    void fail(const core::TransferResult& error);
    void shutdown(SessionState final_state);
    void release_resources();
    
    boost::asio::io_context& io_context_;
    std::string session_id_;
    SessionRole role_;
    SessionState state_;
    std::optional<std::string> peer_handle_;
    
    std::shared_ptr<network::RelayClient> relay_;
    std::shared_ptr<network::PeerTransport> transport_;
    std::shared_ptr<SessionObserver> observer_;
    std::shared_ptr<network::ByteChannel> channel_;
    
    SenderOptions sender_options_;
    std::shared_ptr<FlowControlledSender> sender_;
    std::vector<OutgoingFile> pending_files_;
    
    ReassemblyBuffer reassembly_;
    std::unordered_map<std::string, FileDescriptor> announced_;
    
    bool started_;
    std::size_t ignored_messages_;
};

}
