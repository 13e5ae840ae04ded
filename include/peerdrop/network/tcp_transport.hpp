#pragma once

#include "peerdrop/core/config.hpp"
#include "peerdrop/network/byte_channel.hpp"
#include "peerdrop/network/connection.hpp"
#include "peerdrop/network/peer_transport.hpp"
#include <boost/asio.hpp>
#include <deque>
#include <memory>
#include <set>
#include <string>

namespace peerdrop::network {

// ByteChannel over one framed TCP connection
class TcpByteChannel : public ByteChannel {
public:
    explicit TcpByteChannel(std::shared_ptr<Connection> connection);
    
    bool is_open() const override;
    core::TransferResult send(ChannelMessage message) override;
    std::size_t buffered_amount() const override;
    void close() override;
    
private:
    std::shared_ptr<Connection> connection_;
};

// Direct TCP stand-in for an ICE/DTLS peer connection.
//
// The offerer listens on an ephemeral port and hands out "host:port"
// candidates; the answerer connects to the candidates it is given, in
// order, and proves it saw the offer by sending the offer token as its
// first frame.
class TcpPeerTransport : public PeerTransport, public std::enable_shared_from_this<TcpPeerTransport> {
public:
    static constexpr const char* DESCRIPTION_PREFIX = "peerdrop-tcp/1";
    
    TcpPeerTransport(boost::asio::io_context& io_context,
                     std::string listen_address = "0.0.0.0",
                     std::string advertise_address = "127.0.0.1");
    ~TcpPeerTransport() override;
    
    static std::shared_ptr<TcpPeerTransport> from_config(boost::asio::io_context& io_context,
                                                         const core::Config& config);
    
    void set_handlers(TransportHandlers handlers) override { handlers_ = std::move(handlers); }
    
    std::string create_offer() override;
    std::string accept_offer(const std::string& offer) override;
    void accept_answer(const std::string& answer) override;
    void add_remote_candidate(const std::string& candidate) override;
    void close() override;
    
    std::uint16_t listening_port() const;
    bool is_channel_open() const { return channel_ && channel_->is_open(); }
    
    static std::string parse_description(const std::string& description);
    
private:
    enum class Role {
        NONE,
        OFFERER,
        ANSWERER
    };
    
    void do_accept();
    void on_hello(const std::shared_ptr<Connection>& connection, const ChannelMessage& message);
    void try_next_candidate();
    void open_channel(std::shared_ptr<Connection> connection);
    void fail(const std::string& reason);
    
    boost::asio::io_context& io_context_;
    std::string listen_address_;
    std::string advertise_address_;
    TransportHandlers handlers_;
    
    tcp::acceptor acceptor_;
    tcp::socket connect_socket_;
    
    Role role_;
    std::string token_;
    std::deque<tcp::endpoint> candidates_;
    bool connecting_;
    bool closed_;
    
    std::set<std::shared_ptr<Connection>> pending_;
    std::shared_ptr<Connection> connection_;
    std::shared_ptr<TcpByteChannel> channel_;
};

}
