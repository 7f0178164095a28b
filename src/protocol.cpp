// ============================================================================
// protocol.cpp: implementation for clarity/protocol.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "clarity/protocol.hpp"
#include "clarity/error.hpp"

#include <sstream>        // std::ostringstream for the presentation helpers
#include <iomanip>        // std::setw, std::setfill, std::hex
#include <stdexcept>      // std::invalid_argument for bad frame lengths

namespace clarity {

// ============================================================================
// Local helpers
// ============================================================================

// ---------------------------------------------------------------------------
// Guard every decoder the same way: name the field and the bytes it needed,
// so a short read shows up in logs as "full_status needs 9 bytes, got 1".
// ---------------------------------------------------------------------------
static void require_len(const Frame& f, size_t need, const char* field) {
    if (f.size() >= need) return;
    std::ostringstream os;
    os << field << " needs " << need << " bytes, got " << f.size();
    throw MalformedResponse(os.str());
}

static std::string unknown_byte(uint8_t b) {
    std::ostringstream os;
    os << "unknown(0x" << std::hex << std::setw(2) << std::setfill('0') << unsigned(b) << ")";
    return os.str();
}


// ============================================================================
// Encoding
// ============================================================================

Frame encode_frame(uint8_t command, uint8_t parameter, size_t length) {
    if (length < MIN_RECORD_LEN || length > MAX_RECORD_LEN) {
        throw std::invalid_argument("frame length " + std::to_string(length) +
                                    " outside [" + std::to_string(MIN_RECORD_LEN) + ", " +
                                    std::to_string(MAX_RECORD_LEN) + "]");
    }
    Frame f;
    f.resize(length, 0);      // zero padding, offset 0 stays the report-id placeholder
    f[1] = command;
    f[2] = parameter;
    return f;
}


// ============================================================================
// Decoding
// ============================================================================

uint8_t decode_status_byte(const Frame& response) {
    require_len(response, 2, "status byte");
    return response[1];
}

// ---------------------------------------------------------------------------
// Offsets 1..4 carry two decimal digits each, offset 1 least significant.
// Each pair contributes hi*10 + lo at weight 100^i.
// ---------------------------------------------------------------------------
uint32_t decode_serial(const Frame& response) {
    require_len(response, 5, "serial number");

    uint32_t value  = 0;
    uint32_t weight = 1;
    for (size_t i = 1; i <= 4; ++i) {
        const uint8_t hi = response[i] >> 4;
        const uint8_t lo = response[i] & 0x0F;
        if (hi > 9 || lo > 9) {
            std::ostringstream os;
            os << "serial number byte " << i << " is not BCD: 0x"
               << std::hex << std::setw(2) << std::setfill('0') << unsigned(response[i]);
            throw MalformedResponse(os.str());
        }
        value  += (hi * 10u + lo) * weight;
        weight *= 100u;
    }
    return value;
}

Version decode_version(const Frame& response) {
    require_len(response, 4, "version");
    Version v;
    v.major = response[1];
    v.minor = response[2];
    v.patch = response[3];
    return v;
}

FullStatus decode_full_status(const Frame& response) {
    require_len(response, 9, "full_status");
    FullStatus st;
    st.version.major = response[1];
    st.version.minor = response[2];
    st.version.patch = response[3];
    st.power  = static_cast<Power>(response[4]);
    st.door   = static_cast<Door>(response[5]);
    st.disk   = static_cast<DiskPosition>(response[6]);
    st.filter = static_cast<FilterPosition>(response[7]);
    st.cal    = static_cast<CalLed>(response[8]);
    return st;
}

bool is_command_error(const Frame& response) {
    return response.size() >= 2 && response[1] == CMDERROR;
}

EchoStatus check_echo(uint8_t command, const Frame& response) {
    if (response.size() < 2)       return EchoStatus::Short;
    const uint8_t echo = response[1];
    if (echo == command)           return EchoStatus::Ack;   // checked first: CMDERROR sent as a command echoes 0xFF
    if (echo == SLEEP)             return EchoStatus::Sleep;
    if (echo == CMDERROR)          return EchoStatus::CommandError;
    return EchoStatus::Unexpected;
}


// ============================================================================
// Presentation
// ============================================================================

std::string Version::to_string() const {
    std::ostringstream os;
    os << unsigned(major) << '.' << unsigned(minor) << '.' << unsigned(patch);
    return os.str();
}

std::string to_string(Power v) {
    switch (v) {
        case Power::Run:   return "run";
        case Power::Sleep: return "sleep";
    }
    return unknown_byte(to_wire(v));
}

std::string to_string(Door v) {
    switch (v) {
        case Door::Closed: return "closed";
        case Door::Open:   return "open";
        case Door::Sleep:  return "sleep";
    }
    return unknown_byte(to_wire(v));
}

std::string to_string(DiskPosition v) {
    switch (v) {
        case DiskPosition::Pos0:   return "pos0";
        case DiskPosition::Pos1:   return "pos1";
        case DiskPosition::Pos2:   return "pos2";
        case DiskPosition::Pos3:   return "pos3";
        case DiskPosition::Moving: return "moving";
        case DiskPosition::Sleep:  return "sleep";
        case DiskPosition::Error:  return "error";
    }
    return unknown_byte(to_wire(v));
}

std::string to_string(FilterPosition v) {
    switch (v) {
        case FilterPosition::Pos1:   return "pos1";
        case FilterPosition::Pos2:   return "pos2";
        case FilterPosition::Pos3:   return "pos3";
        case FilterPosition::Pos4:   return "pos4";
        case FilterPosition::Moving: return "moving";
        case FilterPosition::Sleep:  return "sleep";
        case FilterPosition::Error:  return "error";
    }
    return unknown_byte(to_wire(v));
}

std::string to_string(CalLed v) {
    switch (v) {
        case CalLed::On:    return "on";
        case CalLed::Off:   return "off";
        case CalLed::Sleep: return "sleep";
    }
    return unknown_byte(to_wire(v));
}

std::string to_string(EchoStatus v) {
    switch (v) {
        case EchoStatus::Ack:          return "ack";
        case EchoStatus::Sleep:        return "sleep";
        case EchoStatus::CommandError: return "cmd_error";
        case EchoStatus::Unexpected:   return "unexpected";
        case EchoStatus::Short:        return "short";
    }
    return "unknown";
}

std::string format_full_status(const FullStatus& st) {
    std::ostringstream os;
    os << "version=" << st.version.to_string()
       << " power="  << to_string(st.power)
       << " door="   << to_string(st.door)
       << " disk="   << to_string(st.disk)
       << " filter=" << to_string(st.filter)
       << " cal="    << to_string(st.cal);
    return os.str();
}

std::string hex_dump(const uint8_t* data, size_t len) {
    std::ostringstream os;
    os << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        if (i) os << ' ';
        os << std::setw(2) << unsigned(data[i]);
    }
    return os.str();
}

std::string hex_dump(const Frame& f) {
    return hex_dump(f.data(), f.size());
}

} // namespace clarity
