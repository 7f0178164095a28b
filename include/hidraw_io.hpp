/**
 * @page clarity-hidraw-io-hdr Clarity hidraw I/O API (Header)
 * @file hidraw_io.hpp
 * @brief Open a Linux hidraw node and move one HID report at a time.
 *
 * @details
 * PURPOSE
 * -------
 * The smallest surface needed to talk to a HID device through the kernel's
 * /dev/hidrawN interface without any userspace HID library. It backs the
 * HidrawProvider in clarity/transport/transport_hidraw.hpp.
 *
 * ROLE
 * ----
 * - clarity::open_hidraw:  acquire a non-blocking descriptor to a hidraw node.
 * - clarity::write_report: write one whole report (byte 0 = report id) in one call.
 * - clarity::read_report:  poll for one report up to a millisecond timeout.
 * - clarity::close_hidraw: release the descriptor.
 *
 * HOW IT FITS TOGETHER
 * --------------------
 *   scan_hidraw() -> open_hidraw() -> write_report()/read_report() -> close_hidraw()
 *   (device_registry)  \-> hidraw_io.cpp (syscalls)
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Permissions: /dev/hidraw* is root-only by default. Add a udev rule for
 *   1f0a:0088 (e.g. MODE="0660", GROUP="plugdev") for unprivileged use.
 * - Report id: the Clarity unit uses unnumbered reports, so byte 0 of every outbound
 *   record is 0 and the kernel strips it. Inbound reports arrive without a report id.
 * - Timeouts: read_report separates a clean timeout (0) from an error (-1) so the
 *   session can report them differently.
 *
 * LIMITATIONS
 * -----------
 * - Atomic writes: write_report never loops. hidraw accepts a report whole or not at all.
 * - Concurrency: do not share a descriptor between threads without external locking.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace clarity {

/**
 * @brief Open a hidraw node for read/write.
 *
 * Opens with O_RDWR | O_NONBLOCK | O_CLOEXEC. Reads are driven by poll() in
 * read_report(), so the descriptor never blocks on its own.
 *
 * @param dev  Device path, e.g. "/dev/hidraw3".
 * @return     File descriptor (non-negative) on success, -1 on failure (errno preserved).
 */
int open_hidraw(const std::string& dev);


/**
 * @brief Write one report.
 *
 * @param fd    Descriptor from open_hidraw().
 * @param data  Report bytes; data[0] is the report id (0 when unnumbered).
 * @param len   Report length including the report-id byte.
 * @return      true if the kernel accepted all @p len bytes in one write(2).
 */
bool write_report(int fd, const uint8_t* data, size_t len);


/**
 * @brief Read one report, waiting at most @p timeout_ms.
 *
 * EINTR during poll() restarts the wait with the remaining budget.
 *
 * @param fd          Descriptor from open_hidraw().
 * @param out         Destination buffer.
 * @param cap         Capacity of @p out; a longer report is truncated by the kernel.
 * @param timeout_ms  Upper bound on the wait in milliseconds.
 * @return            Bytes read (> 0), 0 on timeout, -1 on error.
 */
int read_report(int fd, uint8_t* out, size_t cap, int timeout_ms);


/**
 * @brief Close a descriptor from open_hidraw(). Negative values are ignored.
 */
void close_hidraw(int fd);

} // namespace clarity
