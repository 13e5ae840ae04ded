#pragma once

#include "peerdrop/network/connection.hpp"
#include "peerdrop/network/protocol.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>

namespace peerdrop::network {

// Signaling relay. Clients join rooms keyed by session id and exchange
// offers, answers and candidates addressed by the handle the relay gave
// them. Payloads are forwarded untouched.
class RelayServer {
public:
    explicit RelayServer(std::uint16_t port, const std::string& address = "0.0.0.0");
    ~RelayServer();
    
    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;
    
    bool start();
    void stop();
    
    bool is_running() const { return running_; }
    
    // Actual bound port, useful when constructed with port 0
    std::uint16_t get_port() const { return port_; }
    
    std::size_t connection_count() const;
    std::size_t room_size(const std::string& room_id) const;
    
private:
    void do_accept();
    void handle_new_connection(std::shared_ptr<Connection> connection);
    void handle_message(const std::shared_ptr<Connection>& connection, ChannelMessage message);
    void handle_connection_closed(const std::shared_ptr<Connection>& connection);
    
    void join_room(const std::string& handle, const std::string& room_id);
    void leave_room(const std::string& handle);
    void forward(const std::string& handle, SignalingMessage message);
    
    std::uint16_t port_;
    std::atomic<bool> running_;
    boost::asio::io_context io_context_;
    tcp::acceptor acceptor_;
    std::thread server_thread_;
    
    mutable std::mutex state_mutex_;
    std::uint64_t next_handle_;
    std::map<std::shared_ptr<Connection>, std::string> connections_;
    std::unordered_map<std::string, std::shared_ptr<Connection>> handles_;
    std::unordered_map<std::string, std::string> room_of_;
    std::unordered_map<std::string, std::set<std::string>> rooms_;
};

}
