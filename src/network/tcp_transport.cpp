#include "peerdrop/network/tcp_transport.hpp"
#include "peerdrop/core/logger.hpp"
#include "peerdrop/core/utils.hpp"
#include "peerdrop/crypto/random.hpp"

namespace peerdrop::network {

TcpByteChannel::TcpByteChannel(std::shared_ptr<Connection> connection)
    : connection_(std::move(connection)) {
}

bool TcpByteChannel::is_open() const {
    return connection_ && connection_->is_connected();
}

core::TransferResult TcpByteChannel::send(ChannelMessage message) {
    if (!is_open()) {
        return core::TransferResult(core::TransferError::CHANNEL_UNAVAILABLE, "Channel is closed");
    }
    
    if (message.data.size() > MAX_FRAME_SIZE) {
        return core::TransferResult(core::TransferError::WRITE_ERROR,
                                    "Message of " + std::to_string(message.data.size()) + " bytes exceeds frame limit");
    }
    
    if (!connection_->send(message.kind, std::move(message.data))) {
        return core::TransferResult(core::TransferError::CHANNEL_UNAVAILABLE, "Connection refused the message");
    }
    return core::TransferResult();
}

std::size_t TcpByteChannel::buffered_amount() const {
    return connection_ ? connection_->buffered_amount() : 0;
}

void TcpByteChannel::close() {
    if (connection_) {
        connection_->close();
    }
}

TcpPeerTransport::TcpPeerTransport(boost::asio::io_context& io_context,
                                   std::string listen_address,
                                   std::string advertise_address)
    : io_context_(io_context)
    , listen_address_(std::move(listen_address))
    , advertise_address_(std::move(advertise_address))
    , acceptor_(io_context)
    , connect_socket_(io_context)
    , role_(Role::NONE)
    , connecting_(false)
    , closed_(false) {
}

TcpPeerTransport::~TcpPeerTransport() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    connect_socket_.close(ec);
}

std::shared_ptr<TcpPeerTransport> TcpPeerTransport::from_config(boost::asio::io_context& io_context,
                                                                const core::Config& config) {
    return std::make_shared<TcpPeerTransport>(
        io_context,
        config.get_string("transport.listen_address", "0.0.0.0"),
        config.get_string("transport.advertise_address", "127.0.0.1"));
}

std::string TcpPeerTransport::parse_description(const std::string& description) {
    auto parts = core::utils::StringUtils::split(core::utils::StringUtils::trim(description), ' ');
    if (parts.size() != 2 || parts[0] != DESCRIPTION_PREFIX || parts[1].empty()) {
        throw ProtocolError("Unrecognized session description");
    }
    return parts[1];
}

std::string TcpPeerTransport::create_offer() {
    if (role_ != Role::NONE) {
        throw ProtocolError("Transport already negotiating");
    }
    
    tcp::endpoint endpoint(boost::asio::ip::make_address(listen_address_), 0);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    
    role_ = Role::OFFERER;
    token_ = crypto::SecureRandom::generate_uuid();
    
    LOG_INFO("Listening for peer on port {}", listening_port());
    do_accept();
    
    // Candidates follow the offer, never precede it
    auto candidate = advertise_address_ + ":" + std::to_string(listening_port());
    std::weak_ptr<TcpPeerTransport> weak = weak_from_this();
    boost::asio::post(io_context_, [weak, candidate]() {
        auto self = weak.lock();
        if (!self || self->closed_ || self->channel_) {
            return;
        }
        if (self->handlers_.on_local_candidate) {
            self->handlers_.on_local_candidate(candidate);
        }
    });
    
    return std::string(DESCRIPTION_PREFIX) + " " + token_;
}

std::string TcpPeerTransport::accept_offer(const std::string& offer) {
    if (role_ != Role::NONE) {
        throw ProtocolError("Transport already negotiating");
    }
    
    token_ = parse_description(offer);
    role_ = Role::ANSWERER;
    return std::string(DESCRIPTION_PREFIX) + " " + token_;
}

void TcpPeerTransport::accept_answer(const std::string& answer) {
    if (role_ != Role::OFFERER) {
        throw ProtocolError("No offer outstanding");
    }
    
    if (parse_description(answer) != token_) {
        throw ProtocolError("Answer does not match the offer");
    }
    LOG_DEBUG("Peer accepted offer");
}

void TcpPeerTransport::add_remote_candidate(const std::string& candidate) {
    if (role_ != Role::ANSWERER) {
        LOG_DEBUG("Ignoring candidate {}, this side is listening", candidate);
        return;
    }
    
    auto host_port = core::utils::StringUtils::parse_host_port(candidate);
    if (!host_port) {
        throw ProtocolError("Malformed candidate: " + candidate);
    }
    
    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(host_port->first, ec);
    if (ec) {
        throw ProtocolError("Candidate host is not an address: " + host_port->first);
    }
    
    candidates_.emplace_back(address, host_port->second);
    
    if (!connecting_ && !connection_) {
        try_next_candidate();
    }
}

void TcpPeerTransport::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    
    boost::system::error_code ec;
    acceptor_.close(ec);
    connect_socket_.close(ec);
    candidates_.clear();
    
    auto pending = std::move(pending_);
    pending_.clear();
    for (auto& connection : pending) {
        connection->close();
    }
    
    if (connection_) {
        connection_->close();
        connection_.reset();
    }
    channel_.reset();
}

std::uint16_t TcpPeerTransport::listening_port() const {
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void TcpPeerTransport::do_accept() {
    std::weak_ptr<TcpPeerTransport> weak = weak_from_this();
    acceptor_.async_accept([weak](boost::system::error_code ec, tcp::socket socket) {
        auto self = weak.lock();
        if (!self || self->closed_) {
            return;
        }
        
        if (ec) {
            if (ec != boost::asio::error::operation_aborted) {
                LOG_ERROR("Accept error: {}", ec.message());
                self->fail("Accepting peer connection failed: " + ec.message());
            }
            return;
        }
        
        auto connection = std::make_shared<Connection>(self->io_context_, std::move(socket));
        self->pending_.insert(connection);
        
        std::weak_ptr<Connection> weak_connection = connection;
        connection->set_message_handler([weak, weak_connection](ChannelMessage message) {
            auto transport = weak.lock();
            auto conn = weak_connection.lock();
            if (transport && conn) {
                transport->on_hello(conn, message);
            }
        });
        connection->set_disconnect_handler([weak](std::shared_ptr<Connection> conn) {
            if (auto transport = weak.lock()) {
                transport->pending_.erase(conn);
            }
        });
        connection->start();
        
        self->do_accept();
    });
}

void TcpPeerTransport::on_hello(const std::shared_ptr<Connection>& connection, const ChannelMessage& message) {
    pending_.erase(connection);
    
    std::string token(message.data.begin(), message.data.end());
    if (channel_ || message.kind != ChannelMessageKind::CONTROL || token != token_) {
        LOG_WARN("Rejecting connection from {}", connection->get_remote_endpoint());
        connection->close();
        return;
    }
    
    boost::system::error_code ec;
    acceptor_.close(ec);
    
    open_channel(connection);
}

void TcpPeerTransport::try_next_candidate() {
    if (closed_ || connection_) {
        return;
    }
    
    if (candidates_.empty()) {
        connecting_ = false;
        fail("No reachable candidate");
        return;
    }
    
    auto endpoint = candidates_.front();
    candidates_.pop_front();
    connecting_ = true;
    
    LOG_INFO("Connecting to peer at {}:{}", endpoint.address().to_string(), endpoint.port());
    
    std::weak_ptr<TcpPeerTransport> weak = weak_from_this();
    connect_socket_ = tcp::socket(io_context_);
    connect_socket_.async_connect(endpoint, [weak, endpoint](boost::system::error_code ec) {
        auto self = weak.lock();
        if (!self || self->closed_) {
            return;
        }
        
        if (ec) {
            LOG_WARN("Candidate {}:{} unreachable: {}", endpoint.address().to_string(), endpoint.port(), ec.message());
            self->try_next_candidate();
            return;
        }
        
        self->connecting_ = false;
        auto connection = std::make_shared<Connection>(self->io_context_, std::move(self->connect_socket_));
        self->connect_socket_ = tcp::socket(self->io_context_);
        
        // The offer token has to be the first frame on the wire
        connection->send(ChannelMessageKind::CONTROL,
                         std::vector<std::uint8_t>(self->token_.begin(), self->token_.end()));
        self->open_channel(connection);
    });
}

void TcpPeerTransport::open_channel(std::shared_ptr<Connection> connection) {
    connection_ = connection;
    channel_ = std::make_shared<TcpByteChannel>(connection);
    
    std::weak_ptr<TcpPeerTransport> weak = weak_from_this();
    connection->set_message_handler([weak](ChannelMessage message) {
        auto self = weak.lock();
        if (self && !self->closed_ && self->handlers_.on_channel_message) {
            self->handlers_.on_channel_message(std::move(message));
        }
    });
    connection->set_disconnect_handler([weak](std::shared_ptr<Connection>) {
        auto self = weak.lock();
        if (self && !self->closed_ && self->handlers_.on_channel_closed) {
            self->handlers_.on_channel_closed();
        }
    });
    
    if (role_ == Role::ANSWERER) {
        connection->start();
    }
    
    LOG_INFO("Channel open with {}", connection->get_remote_endpoint());
    if (handlers_.on_channel_open) {
        handlers_.on_channel_open(channel_);
    }
}

void TcpPeerTransport::fail(const std::string& reason) {
    if (closed_) {
        return;
    }
    LOG_ERROR("Transport failed: {}", reason);
    if (handlers_.on_failed) {
        handlers_.on_failed(reason);
    }
}

}
