#pragma once
/**
 * @file error.hpp
 * @brief Failure taxonomy for the Clarity session and codec.
 *
 * Every failure the library raises derives from clarity::Error, which carries an
 * ErrorCode so callers can branch without catching each subtype. The subtypes
 * exist for callers that prefer `catch (const TransportTimeout&)`.
 *
 * Device-reported CMDERROR (0xFF in the echo position) is NOT an error here:
 * it comes back as data. See is_command_error() in protocol.hpp.
 */

#include <stdexcept>
#include <string>
#include <cstdint>

namespace clarity {

enum class ErrorCode : uint8_t {
    DeviceNotFound = 1,   ///< enumeration returned fewer devices than the requested index
    TransportOpen,        ///< provider could not open the enumerated path
    TransportWrite,       ///< write failed or was short
    TransportRead,        ///< hard read failure
    TransportTimeout,     ///< no response within the read bound
    MalformedResponse,    ///< response too short for the field (or invalid BCD)
    SessionClosed         ///< operation after close()
};

/// Short, stable token for logs and CLI output ("timeout", "session_closed", ...).
const char* to_string(ErrorCode code);

class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& what)
    : std::runtime_error(what), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

struct DeviceNotFound : Error {
    explicit DeviceNotFound(const std::string& what) : Error(ErrorCode::DeviceNotFound, what) {}
};

struct TransportOpenError : Error {
    explicit TransportOpenError(const std::string& what) : Error(ErrorCode::TransportOpen, what) {}
};

struct TransportWriteError : Error {
    explicit TransportWriteError(const std::string& what) : Error(ErrorCode::TransportWrite, what) {}
};

struct TransportReadError : Error {
    explicit TransportReadError(const std::string& what) : Error(ErrorCode::TransportRead, what) {}
};

struct TransportTimeout : Error {
    explicit TransportTimeout(const std::string& what) : Error(ErrorCode::TransportTimeout, what) {}
};

struct MalformedResponse : Error {
    explicit MalformedResponse(const std::string& what) : Error(ErrorCode::MalformedResponse, what) {}
};

struct SessionClosed : Error {
    explicit SessionClosed(const std::string& what) : Error(ErrorCode::SessionClosed, what) {}
};

} // namespace clarity
