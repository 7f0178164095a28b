#pragma once
/**
 * @page clarity-session Clarity Device Session
 * @file session.hpp
 * @brief One open Clarity unit: exclusive handle, serialized transactions, typed accessors.
 *
 * @details
 * PURPOSE
 * -------
 * Session owns exactly one HID handle for its lifetime and turns each logical operation
 * (switch on, move the disk, read the serial number, ...) into a single transaction:
 * write one record, read one record, decode.
 *
 * STATES
 * ------
 *   Open   -- close() or destruction -->   Closed (terminal)
 *
 * close() is idempotent. Every call on a Closed session throws SessionClosed before
 * touching the transport.
 *
 * CONCURRENCY
 * -----------
 * Any number of threads may share one Session. A single mutex covers the handle, so at
 * most one write+read pair is in flight; callers block first on the mutex and then on
 * the bounded read. There are no internal threads and no cancellation other than the
 * read timeout.
 *
 * FAILURES
 * --------
 * transact() throws TransportWriteError, TransportTimeout or TransportReadError
 * (error.hpp). The lock is released on every path and the session stays Open, so the
 * caller may simply try again. Decoders throw MalformedResponse for short replies.
 * A CMDERROR echo from the unit is returned as data.
 *
 * SET OPERATIONS
 * --------------
 * switch_on(), set_disk_position() and friends return the unit's raw reply. Byte 1 is
 * normally the echoed command; SLEEP there means the unit ignored the request while
 * asleep, CMDERROR means it did not understand it. The physical move takes time after
 * the call returns; poll the matching getter to confirm.
 *
 * EXAMPLE
 * -------
 * @code
 *   clarity::transport::HidApiProvider hid;
 *   clarity::Session s(hid, 0);
 *   s.switch_on();
 *   s.set_disk_position(clarity::DiskPosition::Pos2);
 *   while (s.get_disk_position() == clarity::DiskPosition::Moving) { ... }
 *   std::cout << clarity::format_full_status(s.get_full_stat()) << "\n";
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <mutex>

#include "clarity/error.hpp"
#include "clarity/protocol.hpp"
#include "clarity/transport/transport_base.hpp"

namespace clarity {

/// Per-session defaults for transact().
struct SessionOptions {
    size_t        record_length = RECORD_LEN;  ///< frame length and read cap
    int           timeout_ms    = 100;         ///< read bound per transaction
    std::ostream* trace         = nullptr;     ///< one "tx=.. rx=.." line per transaction when set
};

class Session {
public:
    /// Adopt an already open handle. A null handle yields a Closed session.
    explicit Session(std::unique_ptr<transport::IHidDevice> device, SessionOptions opts = {});

    /**
     * @brief Open the @p index-th Clarity unit that @p provider enumerates.
     * @throws DeviceNotFound     fewer than index+1 units present.
     * @throws TransportOpenError the provider could not open the path.
     */
    Session(transport::IHidProvider& provider, size_t index = 0, SessionOptions opts = {});

    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // ------------------------------------------------------------------ lifecycle

    /// Release the handle. Waits for an in-flight transaction. Safe to call twice.
    void close();

    bool is_open() const;

    /// Backend name of the owned handle ("hidapi", "hidraw", ...), "closed" after close().
    const char* device_name() const;

    const SessionOptions& options() const { return opts_; }

    // ---------------------------------------------------------------- transaction

    /**
     * @brief Write one record built from (command, parameter), read the reply.
     * Uses options() defaults for length and timeout.
     * @throws std::invalid_argument record_length outside [MIN_RECORD_LEN, MAX_RECORD_LEN]
     *         or a negative timeout_ms. Not a clarity::Error; no I/O happens.
     */
    Frame transact(uint8_t command, uint8_t parameter = 0);

    /**
     * @brief Same with an explicit record length / read cap and timeout.
     * @throws std::invalid_argument max_length outside [MIN_RECORD_LEN, MAX_RECORD_LEN]
     *         or timeout_ms < 0. Not a clarity::Error; no I/O happens.
     */
    Frame transact(uint8_t command, uint8_t parameter, size_t max_length, int timeout_ms);

    // ------------------------------------------------------------------ power

    Frame switch_on();
    Frame switch_off();
    Power get_on_off();

    // ------------------------------------------------------------------ disk

    Frame        set_disk_position(DiskPosition pos);
    DiskPosition get_disk_position();

    // ------------------------------------------------------------------ filter

    Frame          set_filter_position(FilterPosition pos);
    FilterPosition get_filter_position();

    // ------------------------------------------------------------------ calibration LED

    Frame  set_calibration_led(CalLed state);
    CalLed get_calibration_led();

    // ------------------------------------------------------------------ read-only

    Door       get_door();
    uint32_t   get_serial_number();
    FullStatus get_full_stat();
    Version    get_version();

private:
    void trace_line(const Frame& tx, const Frame* rx, const char* error) const;

    mutable std::mutex mtx_;                          // guards device_ and every transaction
    std::unique_ptr<transport::IHidDevice> device_;   // null once Closed
    SessionOptions opts_;
};

} // namespace clarity
