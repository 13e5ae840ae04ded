#pragma once

#include "peerdrop/network/byte_channel.hpp"
#include <functional>
#include <memory>
#include <string>

namespace peerdrop::network {

struct TransportHandlers {
    std::function<void(const std::string& candidate)> on_local_candidate;
    std::function<void(std::shared_ptr<ByteChannel> channel)> on_channel_open;
    std::function<void(ChannelMessage message)> on_channel_message;
    std::function<void()> on_channel_closed;
    std::function<void(const std::string& reason)> on_failed;
};

// Negotiates a ByteChannel through an exchange of opaque session
// descriptions and connectivity candidates. Handlers are invoked on the
// executor the transport was created with.
class PeerTransport {
public:
    virtual ~PeerTransport() = default;
    
    virtual void set_handlers(TransportHandlers handlers) = 0;
    
    // Initiator side. Throws ProtocolError or boost::system::system_error
    // when no offer can be produced.
    virtual std::string create_offer() = 0;
    
    // Responder side; returns the answer description
    virtual std::string accept_offer(const std::string& offer) = 0;
    
    virtual void accept_answer(const std::string& answer) = 0;
    virtual void add_remote_candidate(const std::string& candidate) = 0;
    
    virtual void close() = 0;
};

}
