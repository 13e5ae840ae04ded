#pragma once

#include "peerdrop/core/error.hpp"
#include "peerdrop/network/protocol.hpp"
#include <cstddef>

namespace peerdrop::network {

// Established point-to-point channel: ordered, reliable, message oriented
class ByteChannel {
public:
    virtual ~ByteChannel() = default;
    
    virtual bool is_open() const = 0;
    
    // Queues one message. Fails with CHANNEL_UNAVAILABLE once closed.
    virtual core::TransferResult send(ChannelMessage message) = 0;
    
    // Bytes accepted by send() that have not yet left the process
    virtual std::size_t buffered_amount() const = 0;
    
    virtual void close() = 0;
};

}
