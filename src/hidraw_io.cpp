// ============================================================================
// hidraw_io.cpp: implementation for hidraw_io.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file hidraw_io.cpp
 */

#include "hidraw_io.hpp"   // declarations for open_hidraw(), write_report(), read_report(), close_hidraw()

// POSIX headers for low-level hidraw handling
#include <fcntl.h>         // ::open flags (O_RDWR, O_NONBLOCK, O_CLOEXEC)
#include <unistd.h>        // ::read, ::write, ::close
#include <poll.h>          // poll(2) for the timeout-bounded read
#include <cerrno>          // EINTR / EAGAIN handling
#include <chrono>          // steady_clock for the remaining poll budget

namespace clarity {

// ---------------------------------------------------------------------------
// open_hidraw()
// -------------
// O_NONBLOCK: read_report() owns all waiting through poll().
// O_CLOEXEC:  the handle is never inherited by child processes.
//
// Returns: file descriptor (>=0) or -1 on failure.
// ---------------------------------------------------------------------------
int open_hidraw(const std::string& dev) {
    if (dev.empty()) return -1;
    return ::open(dev.c_str(), O_RDWR | O_NONBLOCK | O_CLOEXEC);
}


// ---------------------------------------------------------------------------
// write_report()
// --------------
// One write(2) per report. hidraw hands the buffer to the device as a single
// output report, so a short count means the report did not go out.
// ---------------------------------------------------------------------------
bool write_report(int fd, const uint8_t* data, size_t len) {
    if (fd < 0 || !data || len == 0) return false;
    ssize_t w;
    do {
        w = ::write(fd, data, len);
    } while (w < 0 && errno == EINTR);
    return w == static_cast<ssize_t>(len);
}


// ---------------------------------------------------------------------------
// read_report()
// -------------
// Wait for readability, then pull one report.
//
// Returns: >0 bytes read, 0 on timeout, -1 on poll/read error or hangup.
//
// Design:
// - A spurious wakeup (EAGAIN after POLLIN) goes back to polling with whatever
//   is left of the budget rather than reporting a timeout early.
// - POLLHUP/POLLERR without POLLIN means the device went away (unplug).
// ---------------------------------------------------------------------------
int read_report(int fd, uint8_t* out, size_t cap, int timeout_ms) {
    if (fd < 0 || !out || cap == 0) return -1;

    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms < 0 ? 0 : timeout_ms);
    pollfd pfd{fd, POLLIN, 0};

    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
        if (left < 0) left = 0;

        int pr = ::poll(&pfd, 1, static_cast<int>(left));
        if (pr == 0) return 0;                                    // timeout expired
        if (pr < 0) {
            if (errno == EINTR) continue;                         // signal: retry with what is left
            return -1;
        }
        if (pfd.revents & POLLIN) {
            ssize_t n = ::read(fd, out, cap);
            if (n > 0) return static_cast<int>(n);
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
                if (left == 0) return 0;
                continue;
            }
            return -1;                                            // EOF or hard error
        }
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) return -1;
    }
}


// ---------------------------------------------------------------------------
// close_hidraw()
// --------------
// Close a hidraw fd if valid (>=0).
// ---------------------------------------------------------------------------
void close_hidraw(int fd) {
    if (fd >= 0) ::close(fd);
}

} // namespace clarity
