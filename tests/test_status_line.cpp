#include <doctest/doctest.h>
#include <nlohmann/json.hpp>

#include "postura/reading.hpp"
#include "postura/status_line.hpp"

using namespace postura;

TEST_CASE("full status line parses every field") {
    Reading r;
    REQUIRE(parse_status_line("DIST:150,SENT:1,BAD:0,ALR:0,GREEN:80,RED:120,PAUS:0", 42, r) == Status::Ok);
    CHECK(r.distance_mm() == 150);
    CHECK(r.distance_cm() == 15);
    CHECK(r.seated());
    CHECK_FALSE(r.bad_posture());
    CHECK_FALSE(r.alert_active());
    CHECK(r.green_mm() == 80);
    CHECK(r.red_mm() == 120);
    CHECK_FALSE(r.paused());
    CHECK(r.timestamp_ms() == 42);
}

TEST_CASE("missing keys take defaults and unknown keys are ignored") {
    Reading r;
    REQUIRE(parse_status_line("DIST:95,FOO:bar", 0, r) == Status::Ok);
    CHECK(r.distance_mm() == 95);
    CHECK_FALSE(r.seated());
    CHECK(r.green_mm() == GREEN_DEFAULT_MM);
    CHECK(r.red_mm() == RED_DEFAULT_MM);
}

TEST_CASE("order does not matter and whitespace is trimmed") {
    Reading a, b;
    REQUIRE(parse_status_line("DIST:100,SENT:1,GREEN:70,RED:150", 0, a) == Status::Ok);
    REQUIRE(parse_status_line(" RED : 150 , GREEN:70,SENT: 1,DIST:100", 0, b) == Status::Ok);
    CHECK(a == b);
}

TEST_CASE("flags are true only for the exact value 1") {
    Reading r;
    REQUIRE(parse_status_line("DIST:10,SENT:true,BAD:2,ALR:01,PAUS:1", 0, r) == Status::Ok);
    CHECK_FALSE(r.seated());
    CHECK_FALSE(r.bad_posture());
    CHECK_FALSE(r.alert_active());
    CHECK(r.paused());
}

TEST_CASE("non-numeric numbers fall back to their defaults") {
    Reading r;
    REQUIRE(parse_status_line("DIST:abc,GREEN:,RED:12x", 0, r) == Status::Ok);
    CHECK(r.distance_mm() == 0);
    CHECK(r.green_mm() == GREEN_DEFAULT_MM);
    CHECK(r.red_mm() == RED_DEFAULT_MM);
}

TEST_CASE("a token without ':' or an empty line is a parse error") {
    Reading r;
    CHECK(parse_status_line("", 0, r) == Status::ParseError);
    CHECK(parse_status_line("DIST:10,SENT", 0, r) == Status::ParseError);
    CHECK(parse_status_line("DIST:10,", 0, r) == Status::ParseError);
}

TEST_CASE("too many fields is a parse error") {
    std::string line = "DIST:1";
    for (size_t i = 0; i < MAX_FIELDS; ++i) line += ",X" + std::to_string(i) + ":0";
    Reading r;
    CHECK(parse_status_line(line, 0, r) == Status::ParseError);
}

TEST_CASE("classify_line separates reports from control replies") {
    CHECK(classify_line("DIST:1,SENT:0") == LineKind::StatusReport);
    CHECK(classify_line("PONG") == LineKind::Pong);
    CHECK(classify_line("OK SET GREEN 90") == LineKind::Ack);
    CHECK(classify_line("ERR RANGE") == LineKind::Nack);
    CHECK(classify_line("HELLO") == LineKind::Unknown);
    CHECK(classify_line("") == LineKind::Unknown);
}

TEST_CASE("trim strips spaces, tabs and line endings") {
    CHECK(trim("  DIST:1\r\n") == "DIST:1");
    CHECK(trim("\t\t") == "");
    CHECK(trim("PONG") == "PONG");
}

// ---------------------------------------------------------------------------
// PostureState
// ---------------------------------------------------------------------------

static Reading make(int dist, bool seated, bool bad = false, bool alert = false, bool paused = false) {
    return Reading(dist, seated, bad, alert, 80, 120, paused, 0);
}

TEST_CASE("posture precedence: paused, alert, bad, then zones") {
    CHECK(make(300, true, true, true, true).posture() == PostureState::Correct);
    CHECK(make(300, true, true, true).posture() == PostureState::Alert);
    CHECK(make(50, true, true).posture() == PostureState::Bad);
    CHECK(make(0, true, true).posture() == PostureState::Bad);
    CHECK(make(100, false).posture() == PostureState::Correct);
    CHECK(make(0, true).posture() == PostureState::Correct);
}

TEST_CASE("warning band is green < distance <= red") {
    CHECK(make(80, true).posture() == PostureState::Correct);
    CHECK(make(81, true).posture() == PostureState::Warning);
    CHECK(make(120, true).posture() == PostureState::Warning);
    CHECK(make(121, true).posture() == PostureState::Correct);
}

TEST_CASE("is_bad covers Bad and Alert only") {
    CHECK(is_bad(PostureState::Bad));
    CHECK(is_bad(PostureState::Alert));
    CHECK_FALSE(is_bad(PostureState::Warning));
    CHECK_FALSE(is_bad(PostureState::Correct));
}

TEST_CASE("reading JSON uses the stored field names and defaults") {
    const Reading r(150, true, false, true, 70, 130, false, 1234);
    const nlohmann::json j = r;
    CHECK(j.at("distancia") == 150);
    CHECK(j.at("sentado") == true);
    CHECK(j.at("alertaActiva") == true);
    CHECK(j.at("umbralVerde") == 70);
    CHECK(j.at("umbralRojo") == 130);
    CHECK(j.at("timestamp") == 1234);
    CHECK(j.get<Reading>() == r);

    const Reading d = nlohmann::json{{"distancia", 90}}.get<Reading>();
    CHECK(d.distance_mm() == 90);
    CHECK(d.green_mm() == GREEN_DEFAULT_MM);
    CHECK(d.red_mm() == RED_DEFAULT_MM);
    CHECK_FALSE(d.seated());
}
