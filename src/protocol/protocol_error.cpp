#include "protocol/protocol_error.hpp"

namespace sevault {
namespace protocol {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CONNECTION_UNAVAILABLE: return "ConnectionUnavailable";
        case ErrorKind::INIT_REJECTED:          return "InitRejected";
        case ErrorKind::CHUNK_REJECTED:         return "ChunkRejected";
        case ErrorKind::FINALIZE_FAILED:        return "FinalizeFailed";
        case ErrorKind::MALFORMED_RESPONSE:     return "MalformedResponse";
        case ErrorKind::NO_ACTIVE_OPERATION:    return "NoActiveOperation";
        case ErrorKind::OPERATION_IN_PROGRESS:  return "OperationInProgress";
        case ErrorKind::INVALID_ARGUMENT:       return "InvalidArgument";
        default:                                return "UnknownError";
    }
}

std::ostream& operator<<(std::ostream& os, ErrorKind kind) {
    os << to_string(kind);
    return os;
}

} // namespace protocol
} // namespace sevault
