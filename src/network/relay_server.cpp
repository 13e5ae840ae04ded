#include "peerdrop/network/relay_server.hpp"
#include "peerdrop/core/logger.hpp"

namespace peerdrop::network {

RelayServer::RelayServer(std::uint16_t port, const std::string& address)
    : port_(port)
    , running_(false)
    , io_context_()
    , acceptor_(io_context_, tcp::endpoint(boost::asio::ip::make_address(address), port))
    , next_handle_(1) {
    
    port_ = acceptor_.local_endpoint().port();
    LOG_INFO("Relay initialized on {}:{}", address, port_);
}

RelayServer::~RelayServer() {
    stop();
}

bool RelayServer::start() {
    if (running_) {
        LOG_WARN("Relay already running");
        return false;
    }
    
    try {
        acceptor_.listen();
        running_ = true;
        
        do_accept();
        
        server_thread_ = std::thread([this]() {
            LOG_INFO("Relay listening on port {}", port_);
            
            while (running_) {
                try {
                    io_context_.run();
                    break;
                } catch (const std::exception& e) {
                    LOG_ERROR("IO context error: {}", e.what());
                    if (!running_) break;
                    
                    io_context_.restart();
                }
            }
            
            LOG_INFO("Relay stopped");
        });
        
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start relay: {}", e.what());
        running_ = false;
        return false;
    }
}

void RelayServer::stop() {
    if (!running_) {
        return;
    }
    
    LOG_INFO("Stopping relay on port {}", port_);
    running_ = false;
    
    io_context_.stop();
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    
    // The io thread is gone; connections can be torn down from here
    boost::system::error_code ec;
    acceptor_.close(ec);
    
    std::vector<std::shared_ptr<Connection>> connections;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (auto& [connection, _] : connections_) {
            connections.push_back(connection);
        }
    }
    for (auto& connection : connections) {
        connection->terminate();
    }
    
    std::lock_guard<std::mutex> lock(state_mutex_);
    connections_.clear();
    handles_.clear();
    room_of_.clear();
    rooms_.clear();
}

std::size_t RelayServer::connection_count() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return connections_.size();
}

std::size_t RelayServer::room_size(const std::string& room_id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = rooms_.find(room_id);
    return it == rooms_.end() ? 0 : it->second.size();
}

void RelayServer::do_accept() {
    if (!running_) {
        return;
    }
    
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!ec && running_) {
                auto connection = std::make_shared<Connection>(io_context_, std::move(socket));
                handle_new_connection(connection);
                
                do_accept();
            } else if (ec != boost::asio::error::operation_aborted) {
                LOG_ERROR("Accept error: {}", ec.message());
                
                if (running_) {
                    do_accept();
                }
            }
        });
}

void RelayServer::handle_new_connection(std::shared_ptr<Connection> connection) {
    std::string handle;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        handle = "peer-" + std::to_string(next_handle_++);
        connections_[connection] = handle;
        handles_[handle] = connection;
    }
    
    LOG_INFO("Client {} connected as {}", connection->get_remote_endpoint(), handle);
    
    std::weak_ptr<Connection> weak = connection;
    connection->set_message_handler(
        [this, weak](ChannelMessage message) {
            if (auto conn = weak.lock()) {
                handle_message(conn, std::move(message));
            }
        });
    
    connection->set_disconnect_handler(
        [this](std::shared_ptr<Connection> conn) {
            handle_connection_closed(conn);
        });
    
    connection->start();
    
    SignalingMessage welcome;
    welcome.type = SignalingType::WELCOME;
    welcome.sender = handle;
    connection->send_message(welcome);
}

void RelayServer::handle_message(const std::shared_ptr<Connection>& connection, ChannelMessage message) {
    std::string handle;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = connections_.find(connection);
        if (it == connections_.end()) {
            return;
        }
        handle = it->second;
    }
    
    SignalingMessage signal;
    try {
        signal = SignalingMessage::deserialize(message.data);
    } catch (const ProtocolError& e) {
        LOG_WARN("Malformed signaling message from {}: {}", handle, e.what());
        connection->close();
        return;
    }
    
    switch (signal.type) {
        case SignalingType::JOIN_ROOM:
            join_room(handle, signal.room_id);
            break;
        case SignalingType::LEAVE_ROOM:
            leave_room(handle);
            break;
        case SignalingType::OFFER:
        case SignalingType::ANSWER:
        case SignalingType::ICE_CANDIDATE:
            forward(handle, std::move(signal));
            break;
        default:
            LOG_WARN("Unexpected {} from {}", to_string(signal.type), handle);
            break;
    }
}

void RelayServer::join_room(const std::string& handle, const std::string& room_id) {
    if (room_id.empty()) {
        LOG_WARN("{} tried to join an unnamed room", handle);
        return;
    }
    
    leave_room(handle);
    
    std::vector<std::shared_ptr<Connection>> others;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto& members = rooms_[room_id];
        for (const auto& member : members) {
            auto it = handles_.find(member);
            if (it != handles_.end()) {
                others.push_back(it->second);
            }
        }
        members.insert(handle);
        room_of_[handle] = room_id;
    }
    
    LOG_INFO("{} joined room {} ({} already there)", handle, room_id, others.size());
    
    SignalingMessage joined;
    joined.type = SignalingType::USER_JOINED;
    joined.room_id = room_id;
    joined.sender = handle;
    for (auto& other : others) {
        other->send_message(joined);
    }
}

void RelayServer::leave_room(const std::string& handle) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = room_of_.find(handle);
    if (it == room_of_.end()) {
        return;
    }
    
    auto room = rooms_.find(it->second);
    if (room != rooms_.end()) {
        room->second.erase(handle);
        if (room->second.empty()) {
            rooms_.erase(room);
        }
    }
    LOG_DEBUG("{} left room {}", handle, it->second);
    room_of_.erase(it);
}

void RelayServer::forward(const std::string& handle, SignalingMessage message) {
    std::shared_ptr<Connection> target;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = handles_.find(message.target);
        if (it != handles_.end()) {
            target = it->second;
        }
    }
    
    if (!target) {
        LOG_DEBUG("Dropping {} from {} for unknown target '{}'", to_string(message.type), handle, message.target);
        return;
    }
    
    message.sender = handle;
    target->send_message(message);
}

void RelayServer::handle_connection_closed(const std::shared_ptr<Connection>& connection) {
    std::string handle;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = connections_.find(connection);
        if (it == connections_.end()) {
            return;
        }
        handle = it->second;
        connections_.erase(it);
        handles_.erase(handle);
    }
    
    leave_room(handle);
    LOG_INFO("Client {} disconnected", handle);
}

}
