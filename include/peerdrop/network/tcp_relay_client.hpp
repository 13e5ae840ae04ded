#pragma once

#include "peerdrop/network/connection.hpp"
#include "peerdrop/network/relay_client.hpp"
#include <boost/asio.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace peerdrop::network {

// RelayClient speaking to a RelayServer over TCP. Messages issued before
// the connection is up are held and flushed in order once it is.
class TcpRelayClient : public RelayClient, public std::enable_shared_from_this<TcpRelayClient> {
public:
    using ErrorHandler = std::function<void(const std::string& reason)>;
    
    TcpRelayClient(boost::asio::io_context& io_context, std::string host, std::uint16_t port);
    ~TcpRelayClient() override;
    
    void connect();
    void close();
    
    void set_event_handler(EventHandler handler) override { event_handler_ = std::move(handler); }
    void set_error_handler(ErrorHandler handler) { error_handler_ = std::move(handler); }
    
    void join_room(const std::string& room_id) override;
    void leave_room() override;
    
    void send_offer(const std::string& target, const std::string& description) override;
    void send_answer(const std::string& target, const std::string& description) override;
    void send_candidate(const std::string& target, const std::string& candidate) override;
    
    bool is_connected() const { return connection_ && connection_->is_connected(); }
    
    // Handle the relay assigned to this client; empty until welcomed
    const std::string& handle() const { return handle_; }
    
private:
    void send(SignalingMessage message);
    void on_connected(tcp::socket socket);
    void on_message(const ChannelMessage& message);
    void report_error(const std::string& reason);
    
    boost::asio::io_context& io_context_;
    std::string host_;
    std::uint16_t port_;
    tcp::resolver resolver_;
    tcp::socket socket_;
    
    std::shared_ptr<Connection> connection_;
    std::vector<SignalingMessage> outbox_;
    std::string room_id_;
    std::string handle_;
    bool closing_;
    
    EventHandler event_handler_;
    ErrorHandler error_handler_;
};

}
