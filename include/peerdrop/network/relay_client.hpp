#pragma once

#include "peerdrop/network/protocol.hpp"
#include <functional>
#include <string>

namespace peerdrop::network {

struct RelayEvent {
    SignalingType type;
    std::string sender;
    std::string payload;
};

// Capability for exchanging signaling messages through a relay. A session
// is handed one of these; it never opens relay connections itself.
class RelayClient {
public:
    using EventHandler = std::function<void(const RelayEvent&)>;
    
    virtual ~RelayClient() = default;
    
    virtual void set_event_handler(EventHandler handler) = 0;
    
    virtual void join_room(const std::string& room_id) = 0;
    virtual void leave_room() = 0;
    
    virtual void send_offer(const std::string& target, const std::string& description) = 0;
    virtual void send_answer(const std::string& target, const std::string& description) = 0;
    virtual void send_candidate(const std::string& target, const std::string& candidate) = 0;
};

}
