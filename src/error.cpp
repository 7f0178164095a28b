// ============================================================================
// error.cpp: implementation for clarity/error.hpp
// ============================================================================

#include "clarity/error.hpp"

namespace clarity {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::DeviceNotFound:    return "device_not_found";
        case ErrorCode::TransportOpen:     return "open_failed";
        case ErrorCode::TransportWrite:    return "write_failed";
        case ErrorCode::TransportRead:     return "read_failed";
        case ErrorCode::TransportTimeout:  return "timeout";
        case ErrorCode::MalformedResponse: return "malformed_response";
        case ErrorCode::SessionClosed:     return "session_closed";
    }
    return "unknown";
}

} // namespace clarity
