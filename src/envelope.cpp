// ============================================================================
// envelope.cpp: implementation for envelope.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "postura/envelope.hpp"

#include <cctype>
#include <cstring>
#include <utility>

namespace postura {
namespace envelope {

// ---------------------------------------------------------------------------
// checksum()
// ----------
// CRC-16/CCITT-FALSE, bitwise. Lines are < 100 bytes at 2 Hz, so a lookup
// table buys nothing here.
// ---------------------------------------------------------------------------
uint16_t checksum(const std::string& body) {
  uint16_t crc = 0xFFFF;
  for (unsigned char b : body) {
    crc ^= static_cast<uint16_t>(b) << 8;
    for (int i = 0; i < 8; ++i) {
      if (crc & 0x8000) crc = static_cast<uint16_t>((crc << 1) ^ 0x1021);
      else              crc = static_cast<uint16_t>(crc << 1);
    }
  }
  return crc;
}

std::string checksum_hex(const std::string& body) {
  static const char* HEX = "0123456789ABCDEF";
  const uint16_t crc = checksum(body);
  std::string out(4, '0');
  out[0] = HEX[(crc >> 12) & 0xF];
  out[1] = HEX[(crc >> 8)  & 0xF];
  out[2] = HEX[(crc >> 4)  & 0xF];
  out[3] = HEX[ crc        & 0xF];
  return out;
}

std::string wrap(const std::string& body) {
  return body + CRC_DELIMITER + checksum_hex(body);
}

Status unwrap(const std::string& message, std::string& body, std::string& claimed) {
  const size_t pos = message.rfind(CRC_DELIMITER);
  if (pos == std::string::npos) return Status::MalformedEnvelope;
  body    = message.substr(0, pos);
  claimed = message.substr(pos + std::strlen(CRC_DELIMITER));
  return Status::Ok;
}

// Trim surrounding whitespace and compare hex digits case-insensitively.
static bool same_hex(const std::string& expected, const std::string& claimed) {
  size_t a = 0, b = claimed.size();
  while (a < b && std::isspace(static_cast<unsigned char>(claimed[a]))) ++a;
  while (b > a && std::isspace(static_cast<unsigned char>(claimed[b - 1]))) --b;
  if (b - a != expected.size()) return false;
  for (size_t i = 0; i < expected.size(); ++i) {
    const int c = std::toupper(static_cast<unsigned char>(claimed[a + i]));
    if (c != expected[i]) return false;
  }
  return true;
}

Status verify(const std::string& message, std::string& body) {
  std::string candidate, claimed;
  Status st = unwrap(message, candidate, claimed);
  if (!ok(st)) return st;
  if (!same_hex(checksum_hex(candidate), claimed)) return Status::IntegrityMismatch;
  body = std::move(candidate);
  return Status::Ok;
}

// ---------------------------------------------------------------------------
// XOR with the repeating shared key. Self-inverse; used by both directions.
// ---------------------------------------------------------------------------
static std::string xor_with_key(const std::string& in) {
  const size_t klen = std::strlen(SHARED_KEY);
  std::string out(in.size(), '\0');
  for (size_t i = 0; i < in.size(); ++i)
    out[i] = static_cast<char>(in[i] ^ SHARED_KEY[i % klen]);
  return out;
}

// ---------------------------------------------------------------------------
// base64 (RFC 4648, standard alphabet, padded, no wrapping)
// ---------------------------------------------------------------------------
static const char B64[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static int b64_value(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+') return 62;
  if (c == '/') return 63;
  return -1;
}

std::string base64_encode(const std::string& raw) {
  std::string out;
  out.reserve(((raw.size() + 2) / 3) * 4);
  size_t i = 0;
  while (i + 3 <= raw.size()) {
    const uint32_t n = (uint32_t(uint8_t(raw[i])) << 16) |
                       (uint32_t(uint8_t(raw[i + 1])) << 8) |
                        uint32_t(uint8_t(raw[i + 2]));
    out += B64[(n >> 18) & 63];
    out += B64[(n >> 12) & 63];
    out += B64[(n >> 6) & 63];
    out += B64[n & 63];
    i += 3;
  }
  const size_t rest = raw.size() - i;
  if (rest == 1) {
    const uint32_t n = uint32_t(uint8_t(raw[i])) << 16;
    out += B64[(n >> 18) & 63];
    out += B64[(n >> 12) & 63];
    out += "==";
  } else if (rest == 2) {
    const uint32_t n = (uint32_t(uint8_t(raw[i])) << 16) |
                       (uint32_t(uint8_t(raw[i + 1])) << 8);
    out += B64[(n >> 18) & 63];
    out += B64[(n >> 12) & 63];
    out += B64[(n >> 6) & 63];
    out += '=';
  }
  return out;
}

Status base64_decode(const std::string& text, std::string& raw) {
  if (text.size() % 4 != 0) return Status::DecodeError;
  std::string out;
  out.reserve(text.size() / 4 * 3);

  for (size_t i = 0; i < text.size(); i += 4) {
    const bool last = (i + 4 == text.size());
    int v[4];
    int pad = 0;
    for (int k = 0; k < 4; ++k) {
      const char c = text[i + k];
      if (c == '=') {
        // padding only in the final quad, only in the last two slots
        if (!last || k < 2) return Status::DecodeError;
        v[k] = 0;
        ++pad;
      } else {
        if (pad) return Status::DecodeError;  // data after padding
        v[k] = b64_value(c);
        if (v[k] < 0) return Status::DecodeError;
      }
    }
    const uint32_t n = (uint32_t(v[0]) << 18) | (uint32_t(v[1]) << 12) |
                       (uint32_t(v[2]) << 6) | uint32_t(v[3]);
    out += static_cast<char>((n >> 16) & 0xFF);
    if (pad < 2) out += static_cast<char>((n >> 8) & 0xFF);
    if (pad < 1) out += static_cast<char>(n & 0xFF);
  }
  raw = std::move(out);
  return Status::Ok;
}

std::string encrypt(const std::string& body) {
  return base64_encode(xor_with_key(body));
}

Status decrypt(const std::string& encoded, std::string& body) {
  std::string raw;
  Status st = base64_decode(encoded, raw);
  if (!ok(st)) return st;
  body = xor_with_key(raw);
  return Status::Ok;
}

Status process_incoming(const std::string& message, const EnvelopeOptions& opt, std::string& body) {
  std::string work = message;
  if (opt.encryption) {
    Status st = decrypt(message, work);
    if (!ok(st)) return st;
  }
  if (opt.integrity) {
    return verify(work, body);
  }
  body = std::move(work);
  return Status::Ok;
}

std::string prepare_outgoing(const std::string& message, const EnvelopeOptions& opt) {
  std::string out = opt.integrity ? wrap(message) : message;
  if (opt.encryption) out = encrypt(out);
  return out;
}

} // namespace envelope
} // namespace postura
