#include <doctest/doctest.h>
#include "postura/envelope.hpp"

using namespace postura;
using namespace postura::envelope;

TEST_CASE("checksum is CRC-16/CCITT-FALSE") {
    CHECK(checksum("123456789") == 0x29B1);
    CHECK(checksum("") == 0xFFFF);
    CHECK(checksum_hex("123456789") == "29B1");
    CHECK(checksum_hex("").size() == 4);
}

TEST_CASE("checksum_hex is four uppercase zero-padded digits") {
    for (const char* body : {"A", "PING", "DIST:0,SENT:0", "OK SET GREEN 90"}) {
        const std::string hex = checksum_hex(body);
        REQUIRE(hex.size() == 4);
        for (char c : hex) {
            const bool upper_hex = (c >= '0' && c <= '9') || (c >= 'A' && c <= 'F');
            CHECK(upper_hex);
        }
    }
}

TEST_CASE("wrap appends ,CRC: and verify strips it") {
    const std::string body = "DIST:150,SENT:1,BAD:0,ALR:0,GREEN:80,RED:120,PAUS:0";
    const std::string msg = wrap(body);
    CHECK(msg == body + ",CRC:" + checksum_hex(body));

    std::string out;
    REQUIRE(verify(msg, out) == Status::Ok);
    CHECK(out == body);
}

TEST_CASE("unwrap splits on the last delimiter") {
    std::string body, claimed;
    REQUIRE(unwrap("A,CRC:1111,CRC:2222", body, claimed) == Status::Ok);
    CHECK(body == "A,CRC:1111");
    CHECK(claimed == "2222");

    CHECK(unwrap("DIST:1,SENT:1", body, claimed) == Status::MalformedEnvelope);
}

TEST_CASE("verify accepts lowercase and padded checksums") {
    const std::string body = "PONG";
    std::string lower = checksum_hex(body);
    for (char& c : lower) if (c >= 'A' && c <= 'F') c = char(c - 'A' + 'a');

    std::string out;
    CHECK(verify(body + ",CRC:" + lower, out) == Status::Ok);
    CHECK(verify(body + ",CRC: " + checksum_hex(body) + " ", out) == Status::Ok);
}

TEST_CASE("verify rejects a damaged body or checksum") {
    const std::string msg = wrap("DIST:150,SENT:1");
    std::string damaged = msg;
    damaged[5] = '9';

    std::string out = "untouched";
    CHECK(verify(damaged, out) == Status::IntegrityMismatch);
    CHECK(out == "untouched");
    CHECK(verify("DIST:150,CRC:ZZZZ", out) == Status::IntegrityMismatch);
    CHECK(verify("DIST:150", out) == Status::MalformedEnvelope);
}

TEST_CASE("changing any single character of a wrapped message fails verify") {
    const std::string msg = wrap("DIST:150,SENT:1,BAD:0,ALR:0,GREEN:80,RED:120,PAUS:0");
    for (size_t i = 0; i < msg.size(); ++i) {
        std::string damaged = msg;
        // Neither hex nor a case variant of the original.
        damaged[i] = (msg[i] == 'Z' || msg[i] == 'z') ? '#' : 'Z';
        std::string out;
        CAPTURE(i);
        CHECK(verify(damaged, out) != Status::Ok);
    }
}

TEST_CASE("base64 uses the standard padded alphabet") {
    CHECK(base64_encode("Man") == "TWFu");
    CHECK(base64_encode("Ma") == "TWE=");
    CHECK(base64_encode("M") == "TQ==");
    CHECK(base64_encode("") == "");

    std::string raw;
    REQUIRE(base64_decode("TWE=", raw) == Status::Ok);
    CHECK(raw == "Ma");
    CHECK(base64_decode("TWE", raw) == Status::DecodeError);
    CHECK(base64_decode("T=Fu", raw) == Status::DecodeError);
    CHECK(base64_decode("TW!u", raw) == Status::DecodeError);
}

TEST_CASE("encrypt output is printable and decrypts back") {
    const std::string body = "SET GREEN 90";
    const std::string enc = encrypt(body);
    CHECK(enc != body);
    CHECK(enc.find('\n') == std::string::npos);

    std::string dec;
    REQUIRE(decrypt(enc, dec) == Status::Ok);
    CHECK(dec == body);
    CHECK(decrypt("not base64!", dec) == Status::DecodeError);
}

TEST_CASE("process_incoming with both protections off is the identity") {
    std::string body;
    REQUIRE(process_incoming("DIST:1,SENT:1", EnvelopeOptions{}, body) == Status::Ok);
    CHECK(body == "DIST:1,SENT:1");
    CHECK(prepare_outgoing("PING", EnvelopeOptions{}) == "PING");
}

TEST_CASE("integrity on rejects lines without a checksum") {
    EnvelopeOptions opt;
    opt.integrity = true;
    std::string body;
    CHECK(process_incoming("DIST:1,SENT:1", opt, body) == Status::MalformedEnvelope);
    REQUIRE(process_incoming(prepare_outgoing("PONG", opt), opt, body) == Status::Ok);
    CHECK(body == "PONG");
}

TEST_CASE("both protections compose in the documented order") {
    EnvelopeOptions opt{true, true};
    const std::string wire = prepare_outgoing("PAUSE ON", opt);
    CHECK(wire == encrypt(wrap("PAUSE ON")));

    std::string body;
    REQUIRE(process_incoming(wire, opt, body) == Status::Ok);
    CHECK(body == "PAUSE ON");

    // Damage after encryption surfaces as a decode or integrity failure, never a parse error.
    std::string bad = wire;
    bad[0] = (bad[0] == 'A') ? 'B' : 'A';
    const Status st = process_incoming(bad, opt, body);
    CHECK((st == Status::IntegrityMismatch || st == Status::MalformedEnvelope || st == Status::DecodeError));
}
