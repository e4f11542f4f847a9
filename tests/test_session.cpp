#include <doctest/doctest.h>

#include "fakes.hpp"
#include "postura/session.hpp"

using namespace postura;
using namespace postura::test;

namespace {

Reading good()        { return Reading(60, true, false, false, 80, 120, false, 0); }
Reading bad()         { return Reading(200, true, true, false, 80, 120, false, 0); }
Reading paused_good() { return Reading(60, true, false, false, 80, 120, true, 0); }
Reading paused_bad()  { return Reading(200, true, true, false, 80, 120, true, 0); }

struct Rig {
    ManualScheduler sched;
    CaptureSink     sink;
    CaptureNotifier notifier;
    SessionEngine   engine;

    explicit Rig(SessionOptions opt = {}) : engine(sched, sink, notifier, opt) {}

    void connect() { engine.on_connection_state(ConnectionState::Connected, false); }
};

} // namespace

TEST_CASE("first Connected starts a running session") {
    Rig rig;
    CHECK(rig.engine.state() == SessionState::Inactive);
    rig.connect();
    CHECK(rig.engine.state() == SessionState::Running);
    rig.sched.advance(1500);
    CHECK(rig.engine.effective_duration() == 1500);
}

TEST_CASE("paused time is excluded exactly") {
    Rig rig;
    rig.connect();
    rig.sched.advance(3000);

    auto p = rig.engine.toggle_pause();
    REQUIRE(p.has_value());
    CHECK(*p == true);
    rig.sched.advance(5000);
    CHECK(rig.engine.effective_duration() == 3000);

    p = rig.engine.toggle_pause();
    REQUIRE(p.has_value());
    CHECK(*p == false);
    rig.sched.advance(2000);
    CHECK(rig.engine.effective_duration() == 5000);
}

TEST_CASE("repeated pause requests change nothing") {
    Rig rig;
    rig.connect();
    rig.sched.advance(1000);
    rig.engine.on_connection_lost();
    rig.sched.advance(500);
    rig.engine.on_connection_lost();
    rig.engine.on_reading(paused_good());
    rig.sched.advance(500);
    CHECK(rig.engine.state() == SessionState::Paused);
    CHECK(rig.engine.effective_duration() == 1000);
}

TEST_CASE("toggle_pause without a session reports nothing to toggle") {
    Rig rig;
    CHECK_FALSE(rig.engine.toggle_pause().has_value());
}

TEST_CASE("device pause flag pauses and resumes") {
    Rig rig;
    rig.connect();
    rig.sched.advance(1000);
    rig.engine.on_reading(paused_good());
    CHECK(rig.engine.state() == SessionState::Paused);
    rig.sched.advance(4000);
    rig.engine.on_reading(good());
    CHECK(rig.engine.state() == SessionState::Running);
    rig.sched.advance(1000);
    CHECK(rig.engine.effective_duration() == 2000);
}

TEST_CASE("a loss pause is never lifted by a device payload") {
    Rig rig;
    rig.connect();
    rig.sched.advance(2000);
    rig.engine.on_connection_lost();
    CHECK(rig.engine.snapshot().loss_paused);

    rig.engine.on_reading(good());
    CHECK(rig.engine.state() == SessionState::Paused);

    rig.connect();
    CHECK(rig.notifier.has("Reconnected. Session still paused"));
    rig.engine.on_reply(ControlReply{LineKind::Pong, "PONG"});
    CHECK(rig.engine.state() == SessionState::Paused);

    // Only the user resumes it.
    auto p = rig.engine.toggle_pause();
    REQUIRE(p.has_value());
    CHECK(*p == false);
    CHECK(rig.engine.state() == SessionState::Running);
    CHECK_FALSE(rig.engine.snapshot().loss_paused);
}

TEST_CASE("resume_on_reconnect_ack resumes on the PONG after reconnecting") {
    SessionOptions opt;
    opt.resume_on_reconnect_ack = true;
    Rig rig(opt);
    rig.connect();
    rig.sched.advance(1000);
    rig.engine.on_connection_lost();

    // A PONG without a reconnect in between is not an acknowledgement.
    rig.engine.on_reply(ControlReply{LineKind::Pong, "PONG"});
    CHECK(rig.engine.state() == SessionState::Paused);

    rig.connect();
    CHECK_FALSE(rig.notifier.has("Reconnected. Session still paused"));
    rig.engine.on_reply(ControlReply{LineKind::Ack, "OK PING"});
    CHECK(rig.engine.state() == SessionState::Paused);
    rig.engine.on_reply(ControlReply{LineKind::Pong, "PONG"});
    CHECK(rig.engine.state() == SessionState::Running);
    CHECK(rig.notifier.has("Reconnected. Session resumed"));
}

TEST_CASE("non-manual disconnect pauses, manual disconnect ends and saves") {
    Rig rig;
    rig.connect();
    rig.sched.advance(4000);
    rig.engine.on_connection_state(ConnectionState::Disconnected, false);
    CHECK(rig.engine.state() == SessionState::Paused);
    CHECK(rig.sink.saved.empty());

    rig.engine.on_connection_state(ConnectionState::Disconnected, true);
    CHECK(rig.engine.state() == SessionState::Inactive);
    REQUIRE(rig.sink.saved.size() == 1);
    CHECK(rig.sink.saved[0].duration_ms == 4000);
}

// ---------------------------------------------------------------------------
// posture alert
// ---------------------------------------------------------------------------

TEST_CASE("sustained bad posture alerts once per episode") {
    Rig rig;
    rig.connect();
    rig.engine.on_reading(bad());
    rig.sched.advance(4999);
    CHECK(rig.engine.alert_count() == 0);
    rig.sched.advance(1);
    CHECK(rig.engine.alert_count() == 1);
    CHECK(rig.notifier.alarms() == 1);
    CHECK(rig.notifier.count("Correct your posture!") == 1);

    rig.engine.on_reading(bad());
    rig.sched.advance(20000);
    CHECK(rig.engine.alert_count() == 1);

    rig.engine.on_reading(good());
    rig.engine.on_reading(bad());
    rig.sched.advance(5000);
    CHECK(rig.engine.alert_count() == 2);
}

TEST_CASE("correcting posture before the delay cancels the alert") {
    Rig rig;
    rig.connect();
    rig.engine.on_reading(bad());
    rig.sched.advance(3000);
    rig.engine.on_reading(good());
    rig.sched.advance(10000);
    CHECK(rig.engine.alert_count() == 0);
    CHECK(rig.notifier.alarms() == 0);
}

TEST_CASE("pausing cancels a pending alert") {
    Rig rig;
    rig.connect();
    rig.engine.on_reading(bad());
    rig.sched.advance(2000);
    rig.engine.on_reading(paused_bad());
    rig.sched.advance(10000);
    CHECK(rig.engine.alert_count() == 0);
    CHECK_FALSE(rig.engine.snapshot().bad_posture);
}

TEST_CASE("no alert timer while the alarm is disabled") {
    SessionOptions opt;
    opt.alarm_enabled = false;
    Rig rig(opt);
    rig.connect();
    rig.engine.on_reading(bad());
    rig.sched.advance(10000);
    CHECK(rig.engine.alert_count() == 0);
    CHECK(rig.sched.pending() == 0);
}

TEST_CASE("alert delay follows the options") {
    SessionOptions opt;
    opt.alert_delay_ms = 8000;
    Rig rig(opt);
    rig.connect();
    rig.engine.on_reading(bad());
    rig.sched.advance(7999);
    CHECK(rig.engine.alert_count() == 0);
    rig.sched.advance(1);
    CHECK(rig.engine.alert_count() == 1);
}

// ---------------------------------------------------------------------------
// break reminder
// ---------------------------------------------------------------------------

TEST_CASE("break reminder fires once when the effective hour is reached") {
    Rig rig;
    rig.connect();
    rig.sched.advance(3599000);
    rig.engine.tick();
    CHECK_FALSE(rig.notifier.has("Time for a break! Session has reached 1h 0m 0s"));

    rig.sched.advance(1000);
    rig.engine.tick();
    CHECK(rig.notifier.count("Time for a break! Session has reached 1h 0m 0s") == 1);
    CHECK(rig.notifier.alarms() == 1);
    CHECK(rig.engine.snapshot().break_reminder_shown);

    rig.sched.advance(60000);
    rig.engine.tick();
    CHECK(rig.notifier.count("Time for a break! Session has reached 1h 0m 0s") == 1);
}

TEST_CASE("paused time does not count toward the break reminder") {
    SessionOptions opt;
    opt.break_after_ms = 10000;
    Rig rig(opt);
    rig.connect();
    rig.sched.advance(6000);
    rig.engine.toggle_pause();
    rig.sched.advance(60000);
    rig.engine.tick();
    CHECK_FALSE(rig.engine.snapshot().break_reminder_shown);
}

TEST_CASE("tick publishes the effective duration") {
    Rig rig;
    uint64_t seen = 0;
    Subscription sub = rig.engine.elapsed().subscribe([&](const uint64_t& v) { seen = v; });
    rig.connect();
    rig.sched.advance(2000);
    rig.engine.tick();
    CHECK(seen == 2000);
    CHECK(rig.engine.snapshot().clock == "00:00:02");
}

// ---------------------------------------------------------------------------
// finalize / restart / reset
// ---------------------------------------------------------------------------

TEST_CASE("finalize persists the record and ends the session") {
    Rig rig;
    rig.sched.advance(500);
    rig.connect();
    rig.engine.on_reading(Reading(200, true, true, false, 70, 150, false, 0));
    rig.sched.advance(10000);

    REQUIRE(rig.engine.finalize() == Status::Ok);
    REQUIRE(rig.sink.saved.size() == 1);
    const SessionRecord& rec = rig.sink.saved[0];
    CHECK(rec.id == "rec1");
    CHECK(rec.duration_ms == 10000);
    CHECK(rec.alert_count == 1);
    CHECK(rec.start_ms == ManualScheduler::WALL_BASE + 500);
    CHECK(rec.end_ms == ManualScheduler::WALL_BASE + 10500);
    CHECK(rec.green_mm == 70);
    CHECK(rec.red_mm == 150);

    CHECK(rig.engine.state() == SessionState::Inactive);
    CHECK(rig.engine.alert_count() == 0);
    CHECK(rig.notifier.has("Session finished: 10s | 1 alerts"));
}

TEST_CASE("a failed save keeps the session active") {
    Rig rig;
    rig.connect();
    rig.sched.advance(7000);
    rig.sink.fail = true;

    CHECK(rig.engine.finalize() == Status::RemoteWriteFailed);
    CHECK(rig.engine.state() == SessionState::Running);
    CHECK(rig.notifier.has("Error saving session"));
    rig.sched.advance(1000);
    CHECK(rig.engine.effective_duration() == 8000);
}

TEST_CASE("finalize without a session") {
    Rig rig;
    CHECK(rig.engine.finalize() == Status::NotFound);
    CHECK(rig.notifier.has("No active session"));
    CHECK(rig.sink.saved.empty());
}

TEST_CASE("restart saves only sessions longer than five seconds") {
    Rig rig;
    rig.connect();
    rig.sched.advance(5000);
    CHECK(rig.engine.restart() == Status::Ok);
    CHECK(rig.sink.saved.empty());
    CHECK(rig.notifier.has("Session restarted"));
    CHECK(rig.engine.effective_duration() == 0);

    rig.sched.advance(5001);
    CHECK(rig.engine.restart() == Status::Ok);
    REQUIRE(rig.sink.saved.size() == 1);
    CHECK(rig.sink.saved[0].duration_ms == 5001);
    CHECK(rig.notifier.has("Session saved and restarted"));
    CHECK(rig.engine.state() == SessionState::Running);
}

TEST_CASE("restart always starts fresh, even when the save fails") {
    Rig rig;
    rig.connect();
    rig.sched.advance(9000);
    rig.sink.fail = true;
    CHECK(rig.engine.restart() == Status::RemoteWriteFailed);
    CHECK(rig.notifier.has("Error saving session"));
    CHECK(rig.engine.state() == SessionState::Running);
    CHECK(rig.engine.effective_duration() == 0);
}

TEST_CASE("reset_timer zeroes the clock without saving") {
    Rig rig;
    rig.connect();
    rig.sched.advance(12000);
    rig.engine.toggle_pause();
    rig.engine.reset_timer();
    CHECK(rig.sink.saved.empty());
    CHECK(rig.engine.state() == SessionState::Running);
    CHECK(rig.engine.effective_duration() == 0);
    CHECK(rig.notifier.has("Session timer reset"));
}

TEST_CASE("finalize cancels a pending alert timer") {
    Rig rig;
    rig.connect();
    rig.engine.on_reading(bad());
    rig.sched.advance(1000);
    REQUIRE(rig.engine.finalize() == Status::Ok);
    rig.sched.advance(10000);
    CHECK(rig.notifier.alarms() == 0);
}

// ---------------------------------------------------------------------------
// records
// ---------------------------------------------------------------------------

TEST_CASE("format_duration and format_clock") {
    SessionRecord r;
    r.duration_ms = 42000;
    CHECK(r.format_duration() == "42s");
    r.duration_ms = 35 * 60000 + 42000;
    CHECK(r.format_duration() == "35m 42s");
    r.duration_ms = 2 * 3600000 + 35 * 60000 + 42000;
    CHECK(r.format_duration() == "2h 35m 42s");

    CHECK(format_clock(0) == "00:00:00");
    CHECK(format_clock(3723000) == "01:02:03");
    CHECK(format_clock(25ull * 3600000) == "25:00:00");
}

TEST_CASE("summarize totals and averages") {
    std::vector<SessionRecord> v(2);
    v[0].duration_ms = 60000;  v[0].alert_count = 1;
    v[1].duration_ms = 120000; v[1].alert_count = 4;
    const SessionStats s = summarize(v);
    CHECK(s.total_sessions == 2);
    CHECK(s.total_duration_ms == 180000);
    CHECK(s.total_alerts == 5);
    CHECK(s.average_duration_ms == 90000);
    CHECK(s.average_alerts == doctest::Approx(2.5));

    CHECK(summarize({}).total_sessions == 0);
}

TEST_CASE("session record JSON keeps the stored field names") {
    SessionRecord r;
    r.id = "abc";
    r.start_ms = 1;
    r.end_ms = 2;
    r.duration_ms = 3;
    r.alert_count = 4;
    r.break_reminder_shown = true;
    r.owner = "maria";
    const nlohmann::json j = r;
    CHECK(j.at("sessionId") == "abc");
    CHECK(j.at("durationMs") == 3);
    CHECK(j.at("badPostureAlerts") == 4);
    CHECK(j.at("breakAlertShown") == true);
    CHECK(j.at("userId") == "maria");

    const SessionRecord back = j.get<SessionRecord>();
    CHECK(back.id == "abc");
    CHECK(back.alert_count == 4);
    CHECK(back.green_mm == GREEN_DEFAULT_MM);
}
