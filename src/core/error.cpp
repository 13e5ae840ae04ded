#include "peerdrop/core/error.hpp"

namespace peerdrop::core {

const char* to_string(TransferError error) {
    switch (error) {
        case TransferError::SUCCESS: return "success";
        case TransferError::MALFORMED_FRAME: return "malformed frame";
        case TransferError::INVALID_FRAME: return "invalid frame";
        case TransferError::CHANNEL_UNAVAILABLE: return "channel unavailable";
        case TransferError::READ_ERROR: return "read error";
        case TransferError::WRITE_ERROR: return "write error";
        case TransferError::NEGOTIATION_FAILURE: return "negotiation failure";
        case TransferError::STALE_PEER_MESSAGE: return "stale peer message";
        case TransferError::INVALID_STATE: return "invalid state";
        case TransferError::CANCELLED: return "cancelled";
    }
    return "unknown";
}

}
