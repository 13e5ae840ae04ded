#include "peerdrop/transfer/transfer_session.hpp"
#include "peerdrop/core/logger.hpp"
#include "peerdrop/network/chunk_codec.hpp"
#include <stdexcept>

namespace peerdrop::transfer {

ConnectionStatus to_connection_status(SessionState state) {
    switch (state) {
        case SessionState::AWAITING_PEER:
        case SessionState::NEGOTIATING:
            return ConnectionStatus::CONNECTING;
        case SessionState::OPEN:
            return ConnectionStatus::CONNECTED;
        case SessionState::FAILED:
            return ConnectionStatus::FAILED;
        case SessionState::IDLE:
        case SessionState::CLOSED:
        default:
            return ConnectionStatus::DISCONNECTED;
    }
}

const char* to_string(SessionRole role) {
    return role == SessionRole::INITIATOR ? "initiator" : "responder";
}

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::IDLE: return "idle";
        case SessionState::AWAITING_PEER: return "awaiting-peer";
        case SessionState::NEGOTIATING: return "negotiating";
        case SessionState::OPEN: return "open";
        case SessionState::CLOSED: return "closed";
        case SessionState::FAILED: return "failed";
    }
    return "unknown";
}

const char* to_string(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::DISCONNECTED: return "disconnected";
        case ConnectionStatus::CONNECTING: return "connecting";
        case ConnectionStatus::CONNECTED: return "connected";
        case ConnectionStatus::FAILED: return "failed";
    }
    return "unknown";
}

TransferSession::TransferSession(boost::asio::io_context& io_context,
                                 std::string session_id,
                                 SessionRole role,
                                 std::shared_ptr<network::RelayClient> relay,
                                 std::shared_ptr<network::PeerTransport> transport,
                                 std::shared_ptr<SessionObserver> observer,
                                 SenderOptions sender_options)
    : io_context_(io_context)
    , session_id_(std::move(session_id))
    , role_(role)
    , state_(SessionState::IDLE)
    , relay_(std::move(relay))
    , transport_(std::move(transport))
    , observer_(std::move(observer))
    , sender_options_(sender_options)
    , started_(false)
    , ignored_messages_(0) {
    if (session_id_.empty()) {
        throw std::invalid_argument("Session id must not be empty");
    }
    if (!relay_ || !transport_) {
        throw std::invalid_argument("Session requires a relay client and a transport");
    }
    if (!observer_) {
        observer_ = std::make_shared<SessionObserver>();
    }
}

TransferSession::~TransferSession() {
    if (sender_) {
        sender_->cancel();
    }
}

core::TransferResult TransferSession::start() {
    if (started_ || is_terminal()) {
        return core::TransferResult(core::TransferError::INVALID_STATE,
                                    std::string("Session already ") + (started_ ? "started" : to_string(state_)));
    }
    started_ = true;
    
    std::weak_ptr<TransferSession> weak = weak_from_this();
    
    relay_->set_event_handler([weak](const network::RelayEvent& event) {
        if (auto self = weak.lock()) {
            self->handle_relay_event(event);
        }
    });
    
    network::TransportHandlers handlers;
    handlers.on_local_candidate = [weak](const std::string& candidate) {
        if (auto self = weak.lock()) {
            self->handle_local_candidate(candidate);
        }
    };
    handlers.on_channel_open = [weak](std::shared_ptr<network::ByteChannel> channel) {
        if (auto self = weak.lock()) {
            self->handle_channel_open(std::move(channel));
        }
    };
    handlers.on_channel_message = [weak](network::ChannelMessage message) {
        if (auto self = weak.lock()) {
            self->handle_channel_message(std::move(message));
        }
    };
    handlers.on_channel_closed = [weak]() {
        if (auto self = weak.lock()) {
            self->handle_channel_closed();
        }
    };
    handlers.on_failed = [weak](const std::string& reason) {
        if (auto self = weak.lock()) {
            self->handle_transport_failure(reason);
        }
    };
    transport_->set_handlers(std::move(handlers));
    
    LOG_INFO("Session {} starting as {}", session_id_, to_string(role_));
    relay_->join_room(session_id_);
    
    if (role_ == SessionRole::INITIATOR) {
        transition(SessionState::AWAITING_PEER);
    }
    
    return core::TransferResult();
}

core::TransferResult TransferSession::queue_files(std::vector<OutgoingFile> files) {
    if (is_terminal()) {
        return core::TransferResult(core::TransferError::INVALID_STATE,
                                    std::string("Session is ") + to_string(state_));
    }
    
    if (state_ != SessionState::OPEN) {
        for (auto& file : files) {
            pending_files_.push_back(std::move(file));
        }
        LOG_DEBUG("Holding {} files until the channel opens", pending_files_.size());
        return core::TransferResult();
    }
    
    if (!sender_) {
        pending_files_ = std::move(files);
        start_sending();
        return core::TransferResult();
    }
    
    // Observer callbacks may close the session and release sender_
    auto sender = sender_;
    if (!sender->has_announced()) {
        return sender->send_batch(std::move(files));
    }
    
    // Later additions reuse the open channel. The announcement already went
    // out, so the receiver falls back to a generic descriptor for these.
    for (auto& file : files) {
        if (is_terminal()) {
            return core::TransferResult(core::TransferError::CHANNEL_UNAVAILABLE, "Session closed while queueing");
        }
        auto result = sender->send_file(std::move(file));
        if (!result.success()) {
            return result;
        }
    }
    return core::TransferResult();
}

void TransferSession::close() {
    if (is_terminal()) {
        return;
    }
    LOG_INFO("Closing session {}", session_id_);
    shutdown(SessionState::CLOSED);
}

void TransferSession::handle_relay_event(const network::RelayEvent& event) {
    if (is_terminal()) {
        return;
    }
    
    switch (event.type) {
        case network::SignalingType::USER_JOINED:
            on_user_joined(event);
            break;
        case network::SignalingType::OFFER:
            on_offer(event);
            break;
        case network::SignalingType::ANSWER:
            on_answer(event);
            break;
        case network::SignalingType::ICE_CANDIDATE:
            on_remote_candidate(event);
            break;
        default:
            LOG_DEBUG("Session {} ignoring relay message {}", session_id_, network::to_string(event.type));
            break;
    }
}

void TransferSession::on_user_joined(const network::RelayEvent& event) {
    if (role_ != SessionRole::INITIATOR || state_ != SessionState::AWAITING_PEER) {
        ignore_stale(event, "peer already chosen");
        return;
    }
    if (event.sender.empty()) {
        ignore_stale(event, "no peer handle");
        return;
    }
    
    peer_handle_ = event.sender;
    LOG_INFO("Peer {} joined session {}", event.sender, session_id_);
    transition(SessionState::NEGOTIATING);
    
    std::string offer;
    try {
        offer = transport_->create_offer();
    } catch (const std::exception& e) {
        fail(core::TransferResult(core::TransferError::NEGOTIATION_FAILURE,
                                  std::string("Could not create offer: ") + e.what()));
        return;
    }
    
    if (state_ == SessionState::NEGOTIATING) {
        relay_->send_offer(*peer_handle_, offer);
    }
}

void TransferSession::on_offer(const network::RelayEvent& event) {
    if (role_ != SessionRole::RESPONDER || state_ != SessionState::IDLE) {
        ignore_stale(event, "not expecting an offer");
        return;
    }
    if (event.sender.empty()) {
        ignore_stale(event, "no peer handle");
        return;
    }
    
    peer_handle_ = event.sender;
    LOG_INFO("Offer from {} for session {}", event.sender, session_id_);
    transition(SessionState::NEGOTIATING);
    
    std::string answer;
    try {
        answer = transport_->accept_offer(event.payload);
    } catch (const std::exception& e) {
        fail(core::TransferResult(core::TransferError::NEGOTIATION_FAILURE,
                                  std::string("Could not accept offer: ") + e.what()));
        return;
    }
    
    if (state_ == SessionState::NEGOTIATING) {
        relay_->send_answer(*peer_handle_, answer);
    }
}

void TransferSession::on_answer(const network::RelayEvent& event) {
    if (role_ != SessionRole::INITIATOR || state_ != SessionState::NEGOTIATING || !is_from_peer(event)) {
        ignore_stale(event, "unexpected answer");
        return;
    }
    
    try {
        transport_->accept_answer(event.payload);
    } catch (const std::exception& e) {
        fail(core::TransferResult(core::TransferError::NEGOTIATION_FAILURE,
                                  std::string("Could not accept answer: ") + e.what()));
    }
}

void TransferSession::on_remote_candidate(const network::RelayEvent& event) {
    if ((state_ != SessionState::NEGOTIATING && state_ != SessionState::OPEN) || !is_from_peer(event)) {
        ignore_stale(event, "candidate from unknown peer");
        return;
    }
    
    try {
        transport_->add_remote_candidate(event.payload);
    } catch (const std::exception& e) {
        // One bad candidate does not sink the negotiation
        LOG_WARN("Session {} rejected candidate from {}: {}", session_id_, event.sender, e.what());
    }
}

void TransferSession::handle_local_candidate(const std::string& candidate) {
    if (!peer_handle_ || (state_ != SessionState::NEGOTIATING && state_ != SessionState::OPEN)) {
        LOG_DEBUG("Session {} dropping local candidate, no peer yet", session_id_);
        return;
    }
    relay_->send_candidate(*peer_handle_, candidate);
}

void TransferSession::handle_channel_open(std::shared_ptr<network::ByteChannel> channel) {
    if (state_ != SessionState::NEGOTIATING || !channel) {
        LOG_WARN("Session {} got a channel while {}", session_id_, to_string(state_));
        if (channel) {
            channel->close();
        }
        return;
    }
    
    channel_ = std::move(channel);
    transition(SessionState::OPEN);
    
    if (!pending_files_.empty() && state_ == SessionState::OPEN) {
        start_sending();
    }
}

void TransferSession::start_sending() {
    auto sender = std::make_shared<FlowControlledSender>(io_context_, channel_, sender_options_);
    sender_ = sender;
    
    std::weak_ptr<TransferSession> weak = weak_from_this();
    SenderHandlers handlers;
    handlers.on_progress = [weak](const TransferProgress& progress) {
        if (auto self = weak.lock()) {
            self->observer_->on_progress(progress);
        }
    };
    handlers.on_file_finished = [weak](const std::string& file_id, const core::TransferResult& result) {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        if (result.success()) {
            self->observer_->on_file_sent(file_id);
        } else {
            self->observer_->on_error(file_id, result);
        }
    };
    handlers.on_batch_finished = [weak](std::size_t sent, std::size_t failed) {
        if (auto self = weak.lock()) {
            LOG_INFO("Session {} sent {} files, {} failed", self->session_id_, sent, failed);
            self->observer_->on_batch_sent(sent, failed);
        }
    };
    sender->set_handlers(std::move(handlers));
    
    auto files = std::move(pending_files_);
    pending_files_.clear();
    
    auto result = sender->send_batch(std::move(files));
    if (!result.success()) {
        LOG_ERROR("Session {} could not start sending: {}", session_id_, result.message);
        observer_->on_error("", result);
    }
}

void TransferSession::handle_channel_message(network::ChannelMessage message) {
    if (state_ != SessionState::OPEN) {
        LOG_WARN("Session {} dropping channel message while {}", session_id_, to_string(state_));
        return;
    }
    
    if (message.kind == network::ChannelMessageKind::CONTROL) {
        on_control_message(message.data);
    } else {
        on_chunk_frame(message.data);
    }
}

void TransferSession::on_control_message(const std::vector<std::uint8_t>& data) {
    network::FileBatchAnnouncement announcement;
    try {
        auto [type, body] = network::decode_control(data);
        if (type != network::ControlType::BATCH_ANNOUNCE) {
            return;
        }
        announcement = network::FileBatchAnnouncement::deserialize(body);
    } catch (const network::ProtocolError& e) {
        LOG_WARN("Session {} dropping control message: {}", session_id_, e.what());
        observer_->on_error("", core::TransferResult(core::TransferError::MALFORMED_FRAME, e.what()));
        return;
    }
    
    for (const auto& file : announcement.files) {
        announced_[file.file_id] = file;
    }
    LOG_INFO("Session {} peer announced {} files", session_id_, announcement.files.size());
    observer_->on_files_announced(announcement.files);
}

void TransferSession::on_chunk_frame(const std::vector<std::uint8_t>& data) {
    network::ChunkFrame frame;
    try {
        frame = network::decode_chunk(data);
    } catch (const network::MalformedFrameError& e) {
        LOG_WARN("Session {} dropping malformed frame of {} bytes", session_id_, data.size());
        observer_->on_error("", core::TransferResult(core::TransferError::MALFORMED_FRAME, e.what()));
        return;
    }
    
    auto file_id = frame.header.file_id;
    auto result = reassembly_.on_frame(std::move(frame));
    
    if (!result.status.success()) {
        LOG_WARN("Session {} rejected frame for {}: {}", session_id_, file_id, result.status.message);
        observer_->on_error(file_id, result.status);
        return;
    }
    
    if (result.progress) {
        observer_->on_progress(*result.progress);
    }
    
    if (result.completed && !is_terminal()) {
        auto descriptor = announced_file(result.completed->file_id)
            .value_or(FileDescriptor(result.completed->file_id,
                                     result.completed->file_id,
                                     result.completed->data.size(),
                                     "application/octet-stream"));
        if (descriptor.size_bytes != result.completed->data.size()) {
            LOG_WARN("Received {} bytes for {} but {} were announced",
                     result.completed->data.size(), descriptor.name, descriptor.size_bytes);
        }
        LOG_INFO("Session {} received {} ({} bytes)", session_id_, descriptor.name, result.completed->data.size());
        announced_.erase(result.completed->file_id);
        observer_->on_file_received(descriptor, result.completed->data);
    }
}

std::optional<FileDescriptor> TransferSession::announced_file(const std::string& file_id) const {
    auto it = announced_.find(file_id);
    if (it == announced_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void TransferSession::handle_channel_closed() {
    if (is_terminal()) {
        return;
    }
    
    if (state_ == SessionState::OPEN) {
        LOG_INFO("Session {} channel closed by peer", session_id_);
        if (reassembly_.in_flight() > 0) {
            LOG_WARN("Discarding {} partially received files", reassembly_.in_flight());
        }
        shutdown(SessionState::CLOSED);
        return;
    }
    
    fail(core::TransferResult(core::TransferError::NEGOTIATION_FAILURE, "Channel closed before it opened"));
}

void TransferSession::handle_transport_failure(const std::string& reason) {
    if (is_terminal()) {
        return;
    }
    fail(core::TransferResult(core::TransferError::NEGOTIATION_FAILURE, reason));
}

void TransferSession::ignore_stale(const network::RelayEvent& event, const char* reason) {
    ++ignored_messages_;
    LOG_WARN("Session {} ignored {} from '{}' while {}: {}",
             session_id_, network::to_string(event.type), event.sender, to_string(state_), reason);
}

bool TransferSession::is_from_peer(const network::RelayEvent& event) const {
    return peer_handle_ && *peer_handle_ == event.sender;
}

void TransferSession::transition(SessionState next) {
    if (state_ == next) {
        return;
    }
    LOG_DEBUG("Session {}: {} -> {}", session_id_, to_string(state_), to_string(next));
    state_ = next;
    observer_->on_state_changed(to_connection_status(next), next);
}

void TransferSession::fail(const core::TransferResult& error) {
    if (is_terminal()) {
        return;
    }
    LOG_ERROR("Session {} failed: {}", session_id_, error.message);
    observer_->on_error("", error);
    shutdown(SessionState::FAILED);
}

void TransferSession::shutdown(SessionState final_state) {
    // Set before releasing anything so handlers fired during teardown see a
    // terminal session and back off
    auto previous = state_;
    state_ = final_state;
    
    release_resources();
    
    LOG_DEBUG("Session {}: {} -> {}", session_id_, to_string(previous), to_string(final_state));
    observer_->on_state_changed(to_connection_status(final_state), final_state);
}

void TransferSession::release_resources() {
    if (sender_) {
        sender_->cancel();
        sender_.reset();
    }
    
    if (channel_) {
        channel_->close();
        channel_.reset();
    }
    
    transport_->close();
    if (started_) {
        relay_->leave_room();
    }
    
    reassembly_.clear();
    pending_files_.clear();
    announced_.clear();
}

}
