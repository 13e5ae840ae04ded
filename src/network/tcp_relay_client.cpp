#include "peerdrop/network/tcp_relay_client.hpp"
#include "peerdrop/core/logger.hpp"
#include <boost/asio/connect.hpp>

namespace peerdrop::network {

TcpRelayClient::TcpRelayClient(boost::asio::io_context& io_context, std::string host, std::uint16_t port)
    : io_context_(io_context)
    , host_(std::move(host))
    , port_(port)
    , resolver_(io_context)
    , socket_(io_context)
    , closing_(false) {
}

TcpRelayClient::~TcpRelayClient() {
    boost::system::error_code ec;
    socket_.close(ec);
}

void TcpRelayClient::connect() {
    LOG_INFO("Connecting to relay {}:{}", host_, port_);
    
    std::weak_ptr<TcpRelayClient> weak = weak_from_this();
    resolver_.async_resolve(host_, std::to_string(port_),
        [weak](boost::system::error_code ec, tcp::resolver::results_type results) {
            auto self = weak.lock();
            if (!self || self->closing_) {
                return;
            }
            if (ec) {
                self->report_error("Could not resolve relay " + self->host_ + ": " + ec.message());
                return;
            }
            
            boost::asio::async_connect(self->socket_, results,
                [weak](boost::system::error_code ec, const tcp::endpoint&) {
                    auto self = weak.lock();
                    if (!self || self->closing_) {
                        return;
                    }
                    if (ec) {
                        self->report_error("Could not reach relay " + self->host_ + ":" +
                                           std::to_string(self->port_) + ": " + ec.message());
                        return;
                    }
                    self->on_connected(std::move(self->socket_));
                });
        });
}

void TcpRelayClient::close() {
    if (closing_) {
        return;
    }
    closing_ = true;
    
    boost::system::error_code ec;
    resolver_.cancel();
    socket_.close(ec);
    outbox_.clear();
    
    if (connection_) {
        connection_->close();
        connection_.reset();
    }
}

void TcpRelayClient::on_connected(tcp::socket socket) {
    connection_ = std::make_shared<Connection>(io_context_, std::move(socket));
    
    std::weak_ptr<TcpRelayClient> weak = weak_from_this();
    connection_->set_message_handler([weak](ChannelMessage message) {
        if (auto self = weak.lock()) {
            self->on_message(message);
        }
    });
    connection_->set_disconnect_handler([weak](std::shared_ptr<Connection>) {
        auto self = weak.lock();
        if (self && !self->closing_) {
            self->report_error("Relay connection lost");
        }
    });
    connection_->start();
    
    LOG_INFO("Connected to relay {}:{}", host_, port_);
    
    auto pending = std::move(outbox_);
    outbox_.clear();
    for (auto& message : pending) {
        send(std::move(message));
    }
}

void TcpRelayClient::on_message(const ChannelMessage& message) {
    SignalingMessage signal;
    try {
        signal = SignalingMessage::deserialize(message.data);
    } catch (const ProtocolError& e) {
        LOG_WARN("Malformed message from relay: {}", e.what());
        return;
    }
    
    if (signal.type == SignalingType::WELCOME) {
        handle_ = signal.sender;
        LOG_DEBUG("Relay assigned handle {}", handle_);
        return;
    }
    
    if (event_handler_) {
        event_handler_(RelayEvent{signal.type, signal.sender, signal.payload});
    }
}

void TcpRelayClient::join_room(const std::string& room_id) {
    room_id_ = room_id;
    
    SignalingMessage message;
    message.type = SignalingType::JOIN_ROOM;
    message.room_id = room_id;
    send(std::move(message));
}

void TcpRelayClient::leave_room() {
    if (room_id_.empty()) {
        return;
    }
    
    SignalingMessage message;
    message.type = SignalingType::LEAVE_ROOM;
    message.room_id = room_id_;
    room_id_.clear();
    send(std::move(message));
}

void TcpRelayClient::send_offer(const std::string& target, const std::string& description) {
    send(SignalingMessage{SignalingType::OFFER, room_id_, target, handle_, description});
}

void TcpRelayClient::send_answer(const std::string& target, const std::string& description) {
    send(SignalingMessage{SignalingType::ANSWER, room_id_, target, handle_, description});
}

void TcpRelayClient::send_candidate(const std::string& target, const std::string& candidate) {
    send(SignalingMessage{SignalingType::ICE_CANDIDATE, room_id_, target, handle_, candidate});
}

void TcpRelayClient::send(SignalingMessage message) {
    if (closing_) {
        return;
    }
    
    if (!connection_) {
        outbox_.push_back(std::move(message));
        return;
    }
    
    if (!connection_->send_message(message)) {
        LOG_WARN("Relay connection unavailable, dropped {}", to_string(message.type));
    }
}

void TcpRelayClient::report_error(const std::string& reason) {
    LOG_ERROR("{}", reason);
    if (error_handler_) {
        error_handler_(reason);
    }
}

}
