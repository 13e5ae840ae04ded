#pragma once

#include "peerdrop/network/protocol.hpp"
#include <array>
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <queue>
#include <string>

namespace peerdrop::network {

using boost::asio::ip::tcp;

// [kind u8][payload length u32 BE]
constexpr std::size_t FRAME_HEADER_SIZE = 5;

// How long a closing connection waits for the peer's FIN once its own
// queue has been flushed
constexpr std::chrono::milliseconds CLOSE_LINGER{2000};

enum class ConnectionState {
    CONNECTED,
    CLOSING,
    DISCONNECTED
};

// Length-prefixed message framing over a TCP socket. All methods must be
// called on the io_context thread the socket belongs to.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using MessageHandler = std::function<void(ChannelMessage)>;
    using DisconnectHandler = std::function<void(std::shared_ptr<Connection>)>;
    
    Connection(boost::asio::io_context& io_context, tcp::socket socket);
    ~Connection();
    
    void start();
    
    // Stops accepting new frames, flushes the ones already queued, then
    // shuts the socket down. The disconnect handler fires right away.
    void close();
    
    // Drops queued frames and closes the socket now
    void terminate();
    
    // False when the connection is no longer usable or the payload exceeds
    // MAX_FRAME_SIZE
    bool send(ChannelMessageKind kind, std::vector<std::uint8_t> payload);
    
    template<MessagePayload T>
    bool send_message(const T& payload) {
        return send(ChannelMessageKind::CONTROL, payload.serialize());
    }
    
    void set_message_handler(MessageHandler handler) { message_handler_ = std::move(handler); }
    void set_disconnect_handler(DisconnectHandler handler) { disconnect_handler_ = std::move(handler); }
    
    ConnectionState get_state() const { return state_; }
    bool is_connected() const { return state_ == ConnectionState::CONNECTED; }
    const std::string& get_remote_endpoint() const { return remote_endpoint_; }
    
    // Bytes queued for writing, frame headers included
    std::size_t buffered_amount() const { return buffered_bytes_; }
    
private:
    void do_read_header();
    void do_read_payload(ChannelMessageKind kind, std::uint32_t payload_size);
    void do_write();
    void handle_error(const boost::system::error_code& error);
    void finish_close();
    void notify_disconnect();
    
    boost::asio::io_context& io_context_;
    tcp::socket socket_;
    ConnectionState state_;
    std::string remote_endpoint_;
    boost::asio::steady_timer linger_timer_;
    
    MessageHandler message_handler_;
    DisconnectHandler disconnect_handler_;
    
    std::array<std::uint8_t, FRAME_HEADER_SIZE> read_header_buffer_;
    std::vector<std::uint8_t> read_payload_buffer_;
    
    std::queue<std::vector<std::uint8_t>> write_queue_;
    std::size_t buffered_bytes_;
    bool write_in_progress_;
};

}
