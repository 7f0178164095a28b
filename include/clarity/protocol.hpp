#pragma once
/**
 * @page clarity-protocol Clarity Protocol Codec
 * @file protocol.hpp
 * @brief Wire constants, typed status values, frame builder and response decoders.
 *
 * @details
 * PURPOSE
 * -------
 * This header is the contract between a host and an Aurox Clarity spinning-disk unit.
 * The unit speaks fixed-size HID records: the host writes one record, the unit answers
 * with one record. Everything here is pure and stateless; the session layer
 * (session.hpp) adds the handle, the lock and the timeout.
 *
 * RECORD LAYOUT
 * -------------
 *   offset:  0          1          2          3 .. N-1
 *   out:     0x00       command    parameter  0x00 padding
 *   in:      0x00       echo / status payload ...
 *
 * Byte 0 is the HID report-id placeholder and is always zero on the way out.
 * Run-state records are 16 bytes (RECORD_LEN).
 *
 * COMMAND FAMILIES
 * ----------------
 * - Basic: GETVERSION (3 version bytes back), CMDERROR (the unit's reply to a command
 *   it did not understand).
 * - Run-state status: GETONOFF .. FULLSTAT. A sleeping unit answers SLEEP in place of
 *   the field value (except GETONOFF, where SLEEP is the value).
 * - Run-state action: SETONOFF .. SETCAL. The unit echoes the command, or SLEEP.
 * - Service: SETSVCMODE1 stops the disk for alignment. Declared for completeness and
 *   deliberately not exposed by Session.
 *
 * STATUS VALUES
 * -------------
 * Each field gets its own scoped enum carrying the wire value. Values outside the
 * listed members can still arrive from the unit; they are kept as-is in the enum and
 * render as "unknown(0xNN)" through to_string().
 *
 * EXAMPLE
 * -------
 * @code
 *   auto req = clarity::encode_frame(clarity::GETDISK);   // 16 bytes: 00 14 00 00 ...
 *   // ... write req, read resp ...
 *   auto pos = static_cast<clarity::DiskPosition>(clarity::decode_status_byte(resp));
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <string>

#include "etl/vector.h"

namespace clarity {

// ============================ Device identity ============================

static constexpr uint16_t VENDOR_ID  = 0x1F0A;
static constexpr uint16_t PRODUCT_ID = 0x0088;

// ============================ Record sizes ===============================

static constexpr size_t RECORD_LEN     = 16;  ///< run-state record length
static constexpr size_t MIN_RECORD_LEN = 3;   ///< offsets 0..2 must fit
static constexpr size_t MAX_RECORD_LEN = 64;  ///< full-speed HID report ceiling

/// Outbound frames and inbound responses share one fixed-capacity buffer type.
using Frame = etl::vector<uint8_t, MAX_RECORD_LEN>;

// ============================== Commands =================================
/**
 * @name Command bytes
 * One byte at offset 1 of every outbound record. Values are part of the wire
 * contract and must not change.
 */
enum Command : uint8_t {
    GETVERSION  = 0x00,  /**< no data out; returns version byte1.byte2.byte3 */
    GETONOFF    = 0x12,  /**< returns on/off status */
    GETDOOR     = 0x13,  /**< returns door status, or SLEEP */
    GETDISK     = 0x14,  /**< returns disk-slide status, or SLEEP */
    GETFILT     = 0x15,  /**< returns filter position, or SLEEP */
    GETCAL      = 0x16,  /**< returns calibration LED status, or SLEEP */
    GETSERIAL   = 0x19,  /**< returns 4 byte BCD serial number, little endian */
    FULLSTAT    = 0x1F,  /**< returns VERSION[3],ONOFF,DOOR,DISK,FILT,CAL */
    SETONOFF    = 0x21,  /**< 1 byte out: RUN or SLEEP; echoes command or SLEEP */
    SETDISK     = 0x23,  /**< 1 byte out: disk position; echoes command or SLEEP */
    SETFILT     = 0x24,  /**< 1 byte out: filter position; echoes command or SLEEP */
    SETCAL      = 0x25,  /**< 1 byte out: CALON/CALOFF; echoes command or SLEEP */
    SETSVCMODE1 = 0xE0,  /**< service mode only: SLEEP enters, RUN leaves */
    CMDERROR    = 0xFF   /**< reply to a command the unit did not understand */
};

// ============================ Status values ==============================

/// Raw sentinel shared by every run-state field while the unit sleeps.
static constexpr uint8_t SLEEP = 0x7F;

enum class Power : uint8_t {
    Run   = 0x0F,
    Sleep = 0x7F
};

enum class Door : uint8_t {
    Closed = 0x01,
    Open   = 0x02,
    Sleep  = 0x7F
};

enum class DiskPosition : uint8_t {
    Pos0   = 0x00,  ///< out of beam path, wide field
    Pos1   = 0x01,  ///< low sectioning
    Pos2   = 0x02,  ///< mid sectioning
    Pos3   = 0x03,  ///< high sectioning
    Moving = 0x10,  ///< slide between positions
    Sleep  = 0x7F,
    Error  = 0xFF   ///< end stops not detected
};

enum class FilterPosition : uint8_t {
    Pos1   = 0x01,
    Pos2   = 0x02,
    Pos3   = 0x03,
    Pos4   = 0x04,
    Moving = 0x10,
    Sleep  = 0x7F,
    Error  = 0xFF   ///< drive fault, e.g. filters not present
};

enum class CalLed : uint8_t {
    On    = 0x01,
    Off   = 0x02,
    Sleep = 0x7F
};

/// Wire byte of any status enum.
template <typename E>
constexpr uint8_t to_wire(E v) { return static_cast<uint8_t>(v); }

struct Version {
    uint8_t major = 0;
    uint8_t minor = 0;
    uint8_t patch = 0;

    /// "major.minor.patch" in decimal.
    std::string to_string() const;

    bool operator==(const Version& o) const {
        return major == o.major && minor == o.minor && patch == o.patch;
    }
    bool operator!=(const Version& o) const { return !(*this == o); }
};

/// Decoded FULLSTAT record.
struct FullStatus {
    Version        version;
    Power          power  = Power::Sleep;
    Door           door   = Door::Sleep;
    DiskPosition   disk   = DiskPosition::Sleep;
    FilterPosition filter = FilterPosition::Sleep;
    CalLed         cal    = CalLed::Sleep;

    bool operator==(const FullStatus& o) const {
        return version == o.version && power == o.power && door == o.door &&
               disk == o.disk && filter == o.filter && cal == o.cal;
    }
    bool operator!=(const FullStatus& o) const { return !(*this == o); }
};

// ============================== Encoding =================================

/**
 * @brief Build one outbound record.
 *
 * Zero-filled buffer of @p length bytes with @p command at offset 1 and
 * @p parameter at offset 2. Command legality is not checked; the unit answers
 * CMDERROR for anything it does not know.
 *
 * @throws std::invalid_argument if length is outside [MIN_RECORD_LEN, MAX_RECORD_LEN].
 */
Frame encode_frame(uint8_t command, uint8_t parameter = 0, size_t length = RECORD_LEN);

// ============================== Decoding =================================
// All decoders throw MalformedResponse (error.hpp) when the response is too short
// for the field they read. None of them look at offset 0.

/// response[1]. Needs 2 bytes.
uint8_t decode_status_byte(const Frame& response);

/**
 * @brief Serial number from GETSERIAL.
 *
 * response[1..4] hold packed BCD, least significant pair first:
 *   [_, 0x34, 0x12, 0x00, 0x00] -> 1234
 * Needs 5 bytes. A nibble above 9 is rejected with MalformedResponse.
 */
uint32_t decode_serial(const Frame& response);

/// response[1..3] as (major, minor, patch). Needs 4 bytes.
Version decode_version(const Frame& response);

/// response[1..3] version, response[4..8] on/off, door, disk, filter, cal. Needs 9 bytes.
FullStatus decode_full_status(const Frame& response);

/// True when the echo position carries CMDERROR. Short responses are never an error echo.
bool is_command_error(const Frame& response);

/// How the unit answered a set command.
enum class EchoStatus : uint8_t {
    Ack,           ///< response[1] == the command sent
    Sleep,         ///< unit asleep, request ignored
    CommandError,  ///< CMDERROR
    Unexpected,    ///< some other byte
    Short          ///< fewer than 2 bytes
};

/**
 * @brief Classify the reply to a set command against the command that was sent.
 *
 * Set commands echo themselves on success. Never throws; the raw reply is still
 * the caller's to inspect.
 */
EchoStatus check_echo(uint8_t command, const Frame& response);

// ============================ Presentation ===============================
// Stable lowercase tokens for logs and scripts. Unlisted bytes render as
// "unknown(0xNN)".

std::string to_string(Power v);
std::string to_string(Door v);
std::string to_string(DiskPosition v);
std::string to_string(FilterPosition v);
std::string to_string(CalLed v);
std::string to_string(EchoStatus v);

/// "version=1.2.3 power=run door=closed disk=pos2 filter=pos3 cal=on"
std::string format_full_status(const FullStatus& st);

/// Space separated lowercase hex, e.g. "00 14 00 00".
std::string hex_dump(const uint8_t* data, size_t len);
std::string hex_dump(const Frame& f);

} // namespace clarity
