#include <doctest/doctest.h>

#include "fakes.hpp"
#include "postura/connection.hpp"
#include "postura/envelope.hpp"

using namespace postura;
using namespace postura::test;

namespace {

const PeerDescriptor SENSOR{"HC-06", "/dev/rfcomm0"};
const PeerDescriptor OTHER {"usb-FTDI_FT232R", "/dev/ttyUSB0"};

struct Rig {
    ManualScheduler      sched;
    FakeLink             link;
    FakePeers            peers;
    ConnectionController ctl;

    explicit Rig(ControllerOptions opt = {}) : ctl(link, peers, sched, std::move(opt)) {
        peers.peers = {OTHER, SENSOR};
    }
};

// Records every state the controller publishes, from any thread.
struct StateLog {
    std::mutex mtx;
    std::vector<ConnectionState> seen;
    Subscription sub;

    explicit StateLog(ConnectionController& ctl) {
        sub = ctl.state().subscribe([this](const ConnectionState& s) {
            std::lock_guard<std::mutex> lk(mtx);
            seen.push_back(s);
        });
    }
    std::vector<ConnectionState> get() {
        std::lock_guard<std::mutex> lk(mtx);
        return seen;
    }
};

} // namespace

TEST_CASE("backoff doubles from 3 s and caps at 30 s") {
    BackoffPolicy p;
    CHECK(p.delay_after(0) == 0);
    CHECK(p.delay_after(1) == 3000);
    CHECK(p.delay_after(2) == 6000);
    CHECK(p.delay_after(3) == 12000);
    CHECK(p.delay_after(4) == 24000);
    CHECK(p.delay_after(5) == 30000);
    CHECK(p.delay_after(40) == 30000);

    BackoffPolicy q(1000, 5000);
    CHECK(q.delay_after(3) == 4000);
    CHECK(q.delay_after(4) == 5000);
}

TEST_CASE("connect goes Connecting then Connected and probes with PING") {
    Rig rig;
    StateLog states(rig.ctl);

    REQUIRE(rig.ctl.connect(SENSOR) == Status::Ok);
    const auto seen = states.get();
    REQUIRE(seen.size() == 3);
    CHECK(seen[0] == ConnectionState::Disconnected);
    CHECK(seen[1] == ConnectionState::Connecting);
    CHECK(seen[2] == ConnectionState::Connected);

    const auto writes = rig.link.writes();
    REQUIRE(writes.size() == 1);
    CHECK(writes[0] == "PING\n");
    CHECK(rig.ctl.last_address() == std::optional<std::string>("/dev/rfcomm0"));
    CHECK_FALSE(rig.ctl.last_error().get().has_value());
    CHECK_FALSE(rig.ctl.manually_disconnected());
}

TEST_CASE("a failed open returns to Disconnected with the reason") {
    Rig rig;
    rig.link.set_open_status(Status::PermissionDenied);

    CHECK(rig.ctl.connect(SENSOR) == Status::PermissionDenied);
    CHECK(rig.ctl.state().get() == ConnectionState::Disconnected);
    CHECK(rig.ctl.last_error().get() == std::optional<std::string>("connect failed: permission_denied"));
    CHECK(rig.link.writes().empty());
}

TEST_CASE("status lines become readings stamped with the receive time") {
    Rig rig;
    REQUIRE(rig.ctl.connect(SENSOR) == Status::Ok);
    rig.sched.advance(1234);

    rig.link.push_line("DIST:150,SENT:1,BAD:0,ALR:0,GREEN:80,RED:120,PAUS:0\r");
    REQUIRE(rig.link.wait_drained());

    const auto latest = rig.ctl.latest().get();
    REQUIRE(latest.has_value());
    CHECK(latest->distance_mm() == 150);
    CHECK(latest->seated());
    CHECK(latest->timestamp_ms() == 1234);
    CHECK(rig.ctl.last_reading_at().get() == std::optional<uint64_t>(1234));
}

TEST_CASE("readings are published in arrival order") {
    Rig rig;
    std::mutex mtx;
    std::vector<int> dists;
    Subscription sub = rig.ctl.latest().subscribe([&](const std::optional<Reading>& r) {
        if (!r) return;
        std::lock_guard<std::mutex> lk(mtx);
        dists.push_back(r->distance_mm());
    });

    REQUIRE(rig.ctl.connect(SENSOR) == Status::Ok);
    for (int d : {100, 110, 120, 130}) rig.link.push_line("DIST:" + std::to_string(d) + ",SENT:1");
    REQUIRE(rig.link.wait_drained());

    std::lock_guard<std::mutex> lk(mtx);
    CHECK(dists == std::vector<int>{100, 110, 120, 130});
}

TEST_CASE("damaged and unparseable lines are dropped without ending the connection") {
    ControllerOptions opt;
    opt.envelope.integrity = true;
    Rig rig(opt);
    REQUIRE(rig.ctl.connect(SENSOR) == Status::Ok);

    rig.link.push_line("DIST:150,SENT:1");                      // no checksum
    rig.link.push_line("DIST:150,SENT:1,CRC:0000");             // wrong checksum
    rig.link.push_line(envelope::wrap("DIST:150,SENT"));        // parse error
    REQUIRE(rig.link.wait_drained());
    CHECK_FALSE(rig.ctl.latest().get().has_value());
    CHECK(rig.ctl.state().get() == ConnectionState::Connected);

    rig.link.push_line(envelope::wrap("DIST:90,SENT:1"));
    REQUIRE(rig.link.wait_drained());
    REQUIRE(rig.ctl.latest().get().has_value());
    CHECK(rig.ctl.latest().get()->distance_mm() == 90);
}

TEST_CASE("control replies are published, other lines are ignored") {
    Rig rig;
    std::mutex mtx;
    std::vector<ControlReply> replies;
    Subscription sub = rig.ctl.replies().subscribe([&](const ControlReply& r) {
        std::lock_guard<std::mutex> lk(mtx);
        replies.push_back(r);
    });

    REQUIRE(rig.ctl.connect(SENSOR) == Status::Ok);
    rig.link.push_line("PONG");
    rig.link.push_line("BOOT v1.2");
    rig.link.push_line("OK SET GREEN 90");
    rig.link.push_line("ERR RANGE");
    REQUIRE(rig.link.wait_drained());

    std::lock_guard<std::mutex> lk(mtx);
    REQUIRE(replies.size() == 3);
    CHECK(replies[0].kind == LineKind::Pong);
    CHECK(replies[1].kind == LineKind::Ack);
    CHECK(replies[1].text == "OK SET GREEN 90");
    CHECK(replies[2].kind == LineKind::Nack);
}

TEST_CASE("a read failure ends the connection as connection lost") {
    Rig rig;
    REQUIRE(rig.ctl.connect(SENSOR) == Status::Ok);
    rig.link.push_line("DIST:100,SENT:1");
    REQUIRE(rig.link.wait_drained());

    rig.link.fail_read(Status::StreamClosed);
    REQUIRE(wait_until([&] { return rig.ctl.state().get() == ConnectionState::Disconnected; }));
    CHECK(rig.ctl.last_error().get() == std::optional<std::string>("connection lost"));
    CHECK_FALSE(rig.ctl.latest().get().has_value());
    CHECK_FALSE(rig.ctl.last_reading_at().get().has_value());
    CHECK_FALSE(rig.ctl.manually_disconnected());
    CHECK_FALSE(rig.link.is_open());
}

TEST_CASE("commands need a connection and are range checked locally") {
    Rig rig;
    CHECK(rig.ctl.send_command("PING") == Status::NotConnected);
    CHECK(rig.ctl.set_green(90) == Status::NotConnected);

    REQUIRE(rig.ctl.connect(SENSOR) == Status::Ok);
    rig.link.clear_writes();

    CHECK(rig.ctl.set_green(59) == Status::OutOfRange);
    CHECK(rig.ctl.set_green(201) == Status::OutOfRange);
    CHECK(rig.ctl.set_red(79) == Status::OutOfRange);
    CHECK(rig.ctl.set_red(401) == Status::OutOfRange);
    CHECK(rig.ctl.set_alert_time(4999) == Status::OutOfRange);
    CHECK(rig.ctl.set_alert_time(300001) == Status::OutOfRange);
    CHECK(rig.link.writes().empty());

    CHECK(rig.ctl.set_green(60) == Status::Ok);
    CHECK(rig.ctl.set_red(400) == Status::Ok);
    CHECK(rig.ctl.set_alert_time(5000) == Status::Ok);
    CHECK(rig.ctl.set_alarm(false) == Status::Ok);
    CHECK(rig.ctl.set_pause(PauseCommand::On) == Status::Ok);
    CHECK(rig.ctl.set_pause(PauseCommand::Toggle) == Status::Ok);
    CHECK(rig.ctl.ping() == Status::Ok);

    const std::vector<std::string> expected = {
        "SET GREEN 60\n", "SET RED 400\n", "SET TIME 5000\n", "ALARM OFF\n",
        "PAUSE ON\n", "PAUSE TOGGLE\n", "PING\n"};
    CHECK(rig.link.writes() == expected);
}

TEST_CASE("outgoing commands carry the envelope when enabled") {
    ControllerOptions opt;
    opt.envelope.integrity = true;
    Rig rig(opt);
    REQUIRE(rig.ctl.connect(SENSOR) == Status::Ok);
    REQUIRE(rig.link.writes().size() == 1);
    CHECK(rig.link.writes()[0] == envelope::wrap("PING") + "\n");

    rig.ctl.set_envelope_options(envelope::EnvelopeOptions{});
    REQUIRE(rig.ctl.ping() == Status::Ok);
    CHECK(rig.link.writes()[1] == "PING\n");
}

TEST_CASE("a write failure drops the connection") {
    Rig rig;
    REQUIRE(rig.ctl.connect(SENSOR) == Status::Ok);
    rig.link.set_write_status(Status::WriteFailed);

    CHECK(rig.ctl.send_command("ALARM ON") == Status::WriteFailed);
    CHECK(rig.ctl.state().get() == ConnectionState::Disconnected);
    CHECK(rig.ctl.last_error().get() == std::optional<std::string>("connection lost"));
    CHECK_FALSE(rig.link.is_open());
}

TEST_CASE("disconnect is manual and closes the link") {
    Rig rig;
    REQUIRE(rig.ctl.connect(SENSOR) == Status::Ok);
    rig.ctl.disconnect();
    CHECK(rig.ctl.state().get() == ConnectionState::Disconnected);
    CHECK(rig.ctl.manually_disconnected());
    CHECK_FALSE(rig.link.is_open());
    CHECK_FALSE(rig.ctl.last_error().get().has_value());

    // drop() after a disconnect does nothing
    rig.ctl.drop("no data");
    CHECK_FALSE(rig.ctl.last_error().get().has_value());
}

TEST_CASE("connecting to another peer ends the previous connection first") {
    Rig rig;
    REQUIRE(rig.ctl.connect(SENSOR) == Status::Ok);
    StateLog states(rig.ctl);
    REQUIRE(rig.ctl.connect(OTHER) == Status::Ok);

    const auto seen = states.get();
    REQUIRE(seen.size() == 4);
    CHECK(seen[0] == ConnectionState::Connected);
    CHECK(seen[1] == ConnectionState::Disconnected);
    CHECK(seen[2] == ConnectionState::Connecting);
    CHECK(seen[3] == ConnectionState::Connected);
    CHECK(rig.link.closes() == 1);
    CHECK(rig.ctl.last_address() == std::optional<std::string>("/dev/ttyUSB0"));
    CHECK_FALSE(rig.ctl.manually_disconnected());
}

TEST_CASE("find_default_peer uses the allow-list") {
    Rig rig;
    const auto p = rig.ctl.find_default_peer();
    REQUIRE(p.has_value());
    CHECK(*p == SENSOR);

    rig.peers.peers = {OTHER};
    CHECK_FALSE(rig.ctl.find_default_peer().has_value());
}

TEST_CASE("reconnect prefers the last address, then the default peer") {
    Rig rig;
    REQUIRE(rig.ctl.connect(OTHER) == Status::Ok);
    rig.ctl.drop("test");
    REQUIRE(rig.ctl.reconnect() == Status::Ok);
    CHECK(rig.link.opened().back() == "/dev/ttyUSB0");

    rig.ctl.drop("test");
    rig.peers.peers = {SENSOR};
    REQUIRE(rig.ctl.reconnect() == Status::Ok);
    CHECK(rig.link.opened().back() == "/dev/rfcomm0");

    rig.ctl.drop("test");
    rig.peers.peers.clear();
    CHECK(rig.ctl.reconnect() == Status::PeerNotFound);
    CHECK(rig.ctl.last_error().get() == std::optional<std::string>("no paired sensor found"));
}

TEST_CASE("auto-reconnect backs off 3 s, 6 s, 12 s and stops on success") {
    Rig rig;
    rig.link.set_open_status(Status::ConnectFailed);

    rig.ctl.start_auto_reconnect();
    CHECK(rig.ctl.reconnecting().get());
    rig.ctl.start_auto_reconnect();             // already running
    CHECK(rig.sched.pending() == 1);

    rig.sched.advance(0);
    CHECK(rig.link.opened().size() == 1);
    rig.sched.advance(2999);
    CHECK(rig.link.opened().size() == 1);
    rig.sched.advance(1);
    CHECK(rig.link.opened().size() == 2);
    rig.sched.advance(6000);
    CHECK(rig.link.opened().size() == 3);

    rig.link.set_open_status(Status::Ok);
    rig.sched.advance(11999);
    CHECK(rig.link.opened().size() == 3);
    rig.sched.advance(1);
    CHECK(rig.link.opened().size() == 4);
    CHECK(rig.ctl.state().get() == ConnectionState::Connected);
    CHECK_FALSE(rig.ctl.reconnecting().get());
    CHECK(rig.sched.pending() == 0);
}

TEST_CASE("a manual disconnect cancels auto-reconnect") {
    Rig rig;
    rig.link.set_open_status(Status::ConnectFailed);
    rig.ctl.start_auto_reconnect();
    rig.sched.advance(0);
    REQUIRE(rig.link.opened().size() == 1);

    rig.ctl.disconnect();
    CHECK_FALSE(rig.ctl.reconnecting().get());
    rig.sched.advance(120000);
    CHECK(rig.link.opened().size() == 1);

    // and keeps it from starting until the next connect()
    rig.ctl.start_auto_reconnect();
    CHECK_FALSE(rig.ctl.reconnecting().get());
}

TEST_CASE("a disconnect during a reconnect scan keeps the link closed") {
    Rig rig;
    rig.link.set_open_status(Status::ConnectFailed);
    rig.ctl.start_auto_reconnect();
    rig.sched.advance(0);
    REQUIRE(rig.link.opened().size() == 1);

    rig.link.set_open_status(Status::Ok);
    int scans = 0;
    rig.peers.on_scan = [&] {
        if (++scans == 1) rig.ctl.disconnect();
    };
    rig.sched.advance(3000);

    CHECK(scans == 1);
    CHECK(rig.link.opened().size() == 1);
    CHECK(rig.ctl.state().get() == ConnectionState::Disconnected);
    CHECK(rig.ctl.manually_disconnected());
    CHECK_FALSE(rig.ctl.reconnecting().get());
    CHECK(rig.sched.pending() == 0);
}

TEST_CASE("a user reconnect after a manual disconnect opens the link") {
    Rig rig;
    REQUIRE(rig.ctl.connect(OTHER) == Status::Ok);
    rig.ctl.disconnect();
    REQUIRE(rig.ctl.manually_disconnected());

    CHECK(rig.ctl.reconnect() == Status::Ok);
    CHECK(rig.ctl.state().get() == ConnectionState::Connected);
    CHECK_FALSE(rig.ctl.manually_disconnected());
    rig.ctl.disconnect();
}
