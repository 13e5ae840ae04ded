#pragma once

#include <string>

namespace peerdrop::core {

enum class TransferError {
    SUCCESS = 0,
    MALFORMED_FRAME,
    INVALID_FRAME,
    CHANNEL_UNAVAILABLE,
    READ_ERROR,
    WRITE_ERROR,
    NEGOTIATION_FAILURE,
    STALE_PEER_MESSAGE,
    INVALID_STATE,
    CANCELLED
};

const char* to_string(TransferError error);

struct TransferResult {
    TransferError error;
    std::string message;
    
    TransferResult(TransferError err = TransferError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == TransferError::SUCCESS; }
    operator bool() const { return success(); }
};

}
