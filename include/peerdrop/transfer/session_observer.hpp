#pragma once

#include "peerdrop/core/error.hpp"
#include "peerdrop/transfer/file_descriptor.hpp"
#include "peerdrop/transfer/throughput_estimator.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace peerdrop::transfer {

enum class SessionRole {
    INITIATOR,
    RESPONDER
};

enum class SessionState {
    IDLE,
    AWAITING_PEER,
    NEGOTIATING,
    OPEN,
    CLOSED,
    FAILED
};

// Coarse status surfaced to callers
enum class ConnectionStatus {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    FAILED
};

ConnectionStatus to_connection_status(SessionState state);
const char* to_string(SessionRole role);
const char* to_string(SessionState state);
const char* to_string(ConnectionStatus status);

// Caller-facing events of a TransferSession. All callbacks run on the
// session's io_context thread; the defaults ignore the event. A callback may
// close the session.
class SessionObserver {
public:
    virtual ~SessionObserver() = default;
    
    virtual void on_state_changed(ConnectionStatus status, SessionState state) {}
    virtual void on_files_announced(const std::vector<FileDescriptor>& files) {}
    virtual void on_progress(const TransferProgress& progress) {}
    virtual void on_file_received(const FileDescriptor& descriptor, const std::vector<std::uint8_t>& data) {}
    virtual void on_file_sent(const std::string& file_id) {}
    virtual void on_batch_sent(std::size_t sent, std::size_t failed) {}
    
    // Frame-level and per-file problems. file_id is empty when the error
    // cannot be attributed to a file.
    virtual void on_error(const std::string& file_id, const core::TransferResult& error) {}
};

}
