#include <doctest/doctest.h>

#include <chrono>
#include <cstdint>
#include <memory>

#include <sys/socket.h>
#include <unistd.h>

#include "clarity/session.hpp"
#include "clarity/transport/transport_hidraw.hpp"
#include "hidraw_io.hpp"

using namespace clarity;

namespace {

// Datagram-preserving fd pair standing in for a hidraw node: one write is one report.
struct ReportPipe {
    int host{-1};
    int unit{-1};

    ReportPipe() {
        int fds[2];
        REQUIRE(::socketpair(AF_UNIX, SOCK_SEQPACKET | SOCK_NONBLOCK | SOCK_CLOEXEC, 0, fds) == 0);
        host = fds[0];
        unit = fds[1];
    }
    ~ReportPipe() {
        close_hidraw(host);
        close_hidraw(unit);
    }
};

long long elapsed_ms(std::chrono::steady_clock::time_point t0) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
}

} // namespace

TEST_CASE("read_report: nothing pending is a clean timeout (0), not an error") {
    ReportPipe p;
    uint8_t buf[16];
    auto t0 = std::chrono::steady_clock::now();
    CHECK(read_report(p.host, buf, sizeof(buf), 50) == 0);
    CHECK(elapsed_ms(t0) >= 40);
}

TEST_CASE("read_report: a zero or negative timeout polls once") {
    ReportPipe p;
    uint8_t buf[16];
    auto t0 = std::chrono::steady_clock::now();
    CHECK(read_report(p.host, buf, sizeof(buf), 0) == 0);
    CHECK(read_report(p.host, buf, sizeof(buf), -1) == 0);
    CHECK(elapsed_ms(t0) < 1000);
}

TEST_CASE("write_report / read_report move one whole report") {
    ReportPipe p;
    const uint8_t tx[16] = {0x00, 0x1F};
    REQUIRE(write_report(p.host, tx, sizeof(tx)));

    uint8_t rx[16] = {};
    REQUIRE(read_report(p.unit, rx, sizeof(rx), 100) == 16);
    CHECK(rx[0] == 0x00);
    CHECK(rx[1] == 0x1F);
    CHECK(rx[15] == 0x00);
}

TEST_CASE("read_report: a report larger than cap is cut to cap") {
    ReportPipe p;
    uint8_t big[32];
    for (int i = 0; i < 32; ++i) big[i] = static_cast<uint8_t>(i);
    REQUIRE(write_report(p.unit, big, sizeof(big)));

    uint8_t rx[8] = {};
    REQUIRE(read_report(p.host, rx, sizeof(rx), 100) == 8);
    CHECK(rx[7] == 7);
}

TEST_CASE("read_report: a vanished peer is a hard error (-1)") {
    ReportPipe p;
    close_hidraw(p.unit);
    p.unit = -1;

    uint8_t buf[16];
    CHECK(read_report(p.host, buf, sizeof(buf), 100) == -1);
}

TEST_CASE("bad descriptors and arguments are rejected") {
    uint8_t buf[16] = {};
    CHECK(read_report(-1, buf, sizeof(buf), 10) == -1);
    CHECK_FALSE(write_report(-1, buf, sizeof(buf)));

    ReportPipe p;
    CHECK(read_report(p.host, nullptr, sizeof(buf), 10) == -1);
    CHECK(read_report(p.host, buf, 0, 10) == -1);
    CHECK_FALSE(write_report(p.host, buf, 0));
    CHECK(open_hidraw("") == -1);
    CHECK(open_hidraw("/nonexistent/hidraw99") == -1);
}

TEST_CASE("a session over a hidraw device: timeout, then a reply") {
    ReportPipe p;
    clarity::SessionOptions opts;
    opts.timeout_ms = 30;
    clarity::Session s(std::make_unique<clarity::transport::HidrawDevice>(p.host, "pipe"), opts);
    p.host = -1;                                  // owned by the session now

    CHECK_THROWS_AS(s.get_door(), clarity::TransportTimeout);

    uint8_t tx[16];
    REQUIRE(read_report(p.unit, tx, sizeof(tx), 100) == 16);   // the GETDOOR record
    CHECK(tx[1] == clarity::GETDOOR);

    const uint8_t reply[16] = {0x00, 0x01};
    REQUIRE(write_report(p.unit, reply, sizeof(reply)));
    CHECK(s.get_door() == clarity::Door::Closed);
    CHECK(s.is_open());
}
