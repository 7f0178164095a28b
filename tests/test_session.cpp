#include <doctest/doctest.h>

#include <atomic>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

#include "clarity/session.hpp"
#include "fake_transport.hpp"

using namespace clarity;
using clarity::test::FakeHidDevice;
using clarity::test::FakeHidProvider;
using clarity::test::FakeState;

static std::unique_ptr<transport::IHidDevice> fake(const std::shared_ptr<FakeState>& st) {
    return std::make_unique<FakeHidDevice>(st);
}

TEST_CASE("transact writes one full record and returns the reply") {
    auto st = std::make_shared<FakeState>();
    Session s(fake(st));

    Frame r = s.transact(GETDOOR);
    REQUIRE(st->writes.size() == 1);
    CHECK(st->writes[0].size() == RECORD_LEN);
    CHECK(st->writes[0][1] == GETDOOR);
    CHECK(r.size() == RECORD_LEN);
    CHECK(r[1] == GETDOOR);
}

TEST_CASE("typed accessors send the right command and parameter") {
    auto st = std::make_shared<FakeState>();
    st->replies[GETONOFF]   = {0x00, 0x0F};
    st->replies[GETDOOR]    = {0x00, 0x02};
    st->replies[GETDISK]    = {0x00, 0x10};
    st->replies[GETFILT]    = {0x00, 0x04};
    st->replies[GETCAL]     = {0x00, 0x02};
    st->replies[GETSERIAL]  = {0x00, 0x78, 0x56, 0x34, 0x12};
    st->replies[GETVERSION] = {0x00, 1, 4, 2};
    Session s(fake(st));

    s.switch_on();
    s.switch_off();
    s.set_disk_position(DiskPosition::Pos3);
    s.set_filter_position(FilterPosition::Pos2);
    s.set_calibration_led(CalLed::On);

    REQUIRE(st->writes.size() == 5);
    CHECK(st->writes[0][1] == SETONOFF); CHECK(st->writes[0][2] == 0x0F);
    CHECK(st->writes[1][1] == SETONOFF); CHECK(st->writes[1][2] == 0x7F);
    CHECK(st->writes[2][1] == SETDISK);  CHECK(st->writes[2][2] == 0x03);
    CHECK(st->writes[3][1] == SETFILT);  CHECK(st->writes[3][2] == 0x02);
    CHECK(st->writes[4][1] == SETCAL);   CHECK(st->writes[4][2] == 0x01);

    CHECK(s.get_on_off() == Power::Run);
    CHECK(s.get_door() == Door::Open);
    CHECK(s.get_disk_position() == DiskPosition::Moving);
    CHECK(s.get_filter_position() == FilterPosition::Pos4);
    CHECK(s.get_calibration_led() == CalLed::Off);
    CHECK(s.get_serial_number() == 12345678u);
    CHECK(s.get_version() == Version{1, 4, 2});
}

TEST_CASE("set accessors return the raw echo, including SLEEP and CMDERROR") {
    auto st = std::make_shared<FakeState>();
    Session s(fake(st));

    CHECK(check_echo(SETDISK, s.set_disk_position(DiskPosition::Pos1)) == EchoStatus::Ack);

    st->replies[SETDISK] = {0x00, 0x7F};
    CHECK(check_echo(SETDISK, s.set_disk_position(DiskPosition::Pos1)) == EchoStatus::Sleep);

    st->replies[SETFILT] = {0x00, 0xFF};
    Frame r = s.set_filter_position(FilterPosition::Pos1);
    CHECK(is_command_error(r));
    CHECK(s.is_open());
}

TEST_CASE("get_full_stat decodes a full record") {
    auto st = std::make_shared<FakeState>();
    st->replies[FULLSTAT] = {0x00, 1, 2, 3, 0x0F, 0x01, 0x02, 0x03, 0x01, 0, 0, 0, 0, 0, 0, 0};
    Session s(fake(st));

    FullStatus fs = s.get_full_stat();
    CHECK(fs.version == Version{1, 2, 3});
    CHECK(fs.power == Power::Run);
    CHECK(fs.door == Door::Closed);
    CHECK(fs.disk == DiskPosition::Pos2);
    CHECK(fs.filter == FilterPosition::Pos3);
    CHECK(fs.cal == CalLed::On);
}

TEST_CASE("a 1-byte reply to get_full_stat is malformed and leaves the session usable") {
    auto st = std::make_shared<FakeState>();
    st->replies[FULLSTAT] = {0x00};
    Session s(fake(st));

    CHECK_THROWS_AS(s.get_full_stat(), MalformedResponse);
    CHECK(s.is_open());
    CHECK(s.transact(GETDOOR)[1] == GETDOOR);
}

TEST_CASE("replies longer than the read cap are truncated to max_length") {
    auto st = std::make_shared<FakeState>();
    st->replies[GETDOOR] = std::vector<uint8_t>(32, 0x01);
    Session s(fake(st));

    Frame r = s.transact(GETDOOR, 0, 8, 100);
    CHECK(r.size() == 8);
    CHECK(st->writes.back().size() == 8);
}

TEST_CASE("concurrent transactions never interleave") {
    auto st = std::make_shared<FakeState>();
    st->read_delay_ms = 1;
    Session s(fake(st));

    const uint8_t cmds[] = {GETONOFF, GETDOOR, GETDISK, GETFILT};
    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (uint8_t cmd : cmds) {
        threads.emplace_back([&s, &mismatches, cmd] {
            for (int i = 0; i < 25; ++i) {
                Frame r = s.transact(cmd);
                if (r.size() < 2 || r[1] != cmd) mismatches++;
            }
        });
    }
    for (auto& t : threads) t.join();

    CHECK(mismatches.load() == 0);
    REQUIRE(st->events.size() == 200);
    for (size_t i = 0; i < st->events.size(); i += 2) {
        const std::string& w = st->events[i];
        const std::string& r = st->events[i + 1];
        CHECK(w[0] == 'w');
        CHECK(r[0] == 'r');
        CHECK(w.substr(1) == r.substr(1));
    }
}

TEST_CASE("a timeout releases the lock for the next caller") {
    auto st = std::make_shared<FakeState>();
    st->read_delay_ms = 200;
    SessionOptions opts;
    opts.timeout_ms = 20;
    Session s(fake(st), opts);

    CHECK_THROWS_AS(s.get_door(), TransportTimeout);
    CHECK(s.is_open());

    {
        std::lock_guard<std::mutex> lk(st->m);
        st->read_delay_ms = 0;
    }
    st->replies[GETDOOR] = {0x00, 0x01};

    Door door = Door::Sleep;
    std::thread other([&] { door = s.get_door(); });
    other.join();
    CHECK(door == Door::Closed);
}

TEST_CASE("a negative timeout is rejected before any I/O") {
    auto st = std::make_shared<FakeState>();
    Session s(fake(st));

    CHECK_THROWS_AS(s.transact(GETDOOR, 0, RECORD_LEN, -1), std::invalid_argument);
    CHECK(st->io_count() == 0);
    CHECK(s.is_open());

    SessionOptions opts;
    opts.timeout_ms = -5;
    Session bad(fake(st), opts);
    CHECK_THROWS_AS(bad.get_door(), std::invalid_argument);
    CHECK(st->io_count() == 0);

    CHECK(s.transact(GETDOOR, 0, RECORD_LEN, 0)[1] == GETDOOR);
}

TEST_CASE("a record length outside [3, 64] is rejected before any I/O") {
    auto st = std::make_shared<FakeState>();
    Session s(fake(st));
    CHECK_THROWS_AS(s.transact(GETDOOR, 0, 2, 100), std::invalid_argument);
    CHECK_THROWS_AS(s.transact(GETDOOR, 0, MAX_RECORD_LEN + 1, 100), std::invalid_argument);
    CHECK(st->io_count() == 0);
}

TEST_CASE("write and read failures are reported and the session stays open") {
    auto st = std::make_shared<FakeState>();
    Session s(fake(st));

    st->fail_write = true;
    CHECK_THROWS_AS(s.get_door(), TransportWriteError);
    CHECK(st->reads == 0);
    st->fail_write = false;

    st->short_write = true;
    CHECK_THROWS_AS(s.get_door(), TransportWriteError);
    st->short_write = false;

    st->fail_read = true;
    CHECK_THROWS_AS(s.get_door(), TransportReadError);
    st->fail_read = false;

    CHECK(s.is_open());
    CHECK_NOTHROW(s.get_door());
}

TEST_CASE("closed session refuses every operation without I/O") {
    auto st = std::make_shared<FakeState>();
    Session s(fake(st));
    s.close();
    CHECK_FALSE(s.is_open());
    CHECK(std::string(s.device_name()) == "closed");
    CHECK(st->closed);

    CHECK_THROWS_AS(s.transact(GETDOOR), SessionClosed);
    CHECK_THROWS_AS(s.switch_on(), SessionClosed);
    CHECK_THROWS_AS(s.get_full_stat(), SessionClosed);
    CHECK_THROWS_AS(s.get_serial_number(), SessionClosed);
    CHECK(st->io_count() == 0);
}

TEST_CASE("close is idempotent and the destructor closes once") {
    auto st = std::make_shared<FakeState>();
    {
        Session s(fake(st));
        CHECK(std::string(s.device_name()) == "fake");
        s.close();
        s.close();
    }
    CHECK(st->close_calls == 1);

    auto st2 = std::make_shared<FakeState>();
    { Session s(fake(st2)); }
    CHECK(st2->close_calls == 1);
}

TEST_CASE("a null handle yields a closed session") {
    Session s(std::unique_ptr<transport::IHidDevice>{});
    CHECK_FALSE(s.is_open());
    CHECK_THROWS_AS(s.get_version(), SessionClosed);
}

TEST_CASE("opening by index through a provider") {
    FakeHidProvider hid(2);
    Session s(hid, 1);
    REQUIRE(hid.opened.size() == 1);
    CHECK(hid.opened[0] == "fake1");
    CHECK(s.is_open());
}

TEST_CASE("index past the enumerated units is DeviceNotFound") {
    FakeHidProvider none(0);
    CHECK_THROWS_AS(Session(none), DeviceNotFound);

    FakeHidProvider two(2);
    try {
        Session s(two, 2);
        FAIL("expected DeviceNotFound");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::DeviceNotFound);
    }
    CHECK(two.opened.empty());
}

TEST_CASE("units with other ids are not counted") {
    FakeHidProvider hid(1);
    hid.devices[0].product_id = 0x0089;
    CHECK_THROWS_AS(Session(hid, 0), DeviceNotFound);
}

TEST_CASE("provider open failure is TransportOpenError") {
    FakeHidProvider hid(1);
    hid.fail_open = true;
    CHECK_THROWS_AS(Session(hid, 0), TransportOpenError);
}

TEST_CASE("trace stream gets one line per transaction") {
    auto st = std::make_shared<FakeState>();
    st->replies[GETDOOR] = {0x00, 0x01, 0x00};
    std::ostringstream trace;
    SessionOptions opts;
    opts.record_length = 4;
    opts.trace = &trace;
    Session s(fake(st), opts);

    s.get_door();
    CHECK(trace.str() == "tx=00 13 00 00 rx=00 01 00\n");

    trace.str("");
    st->fail_read = true;
    CHECK_THROWS_AS(s.get_door(), TransportReadError);
    CHECK(trace.str() == "tx=00 13 00 00 error=read_failed\n");
}
