#pragma once
/**
 * @page pl-envelope Postura Envelope Codec
 * @file envelope.hpp
 * @brief CRC-16 integrity suffix and XOR/base64 obfuscation for protocol lines.
 *
 * @details
 * PURPOSE
 * -------
 * Every line between host and sensor may carry an integrity suffix:
 * @code
 *   DIST:150,SENT:1,BAD:0,ALR:0,GREEN:80,RED:120,PAUS:0,CRC:3A9F
 * @endcode
 * and may additionally be XOR-scrambled with a key shared with the firmware
 * and base64-encoded so the result stays printable ASCII on the link.
 *
 * The two protections are independent switches (`EnvelopeOptions`). The
 * firmware shipped today sends neither, so both default to off; the switches
 * stay so a firmware that turns them on needs no host rebuild.
 *
 * CHECKSUM
 * --------
 * CRC-16/CCITT-FALSE: register starts at 0xFFFF, polynomial 0x1021. Each byte
 * is XORed into the high byte of the register, followed by 8 shift steps; when
 * the top bit was set before the shift the polynomial is XORed in. Rendered as
 * 4 uppercase hex digits, zero padded.
 *
 * ORDER OF OPERATIONS
 * -------------------
 *   outgoing:  body -> wrap (",CRC:XXXX") -> [encrypt]        -> wire
 *   incoming:  wire -> [decrypt]          -> verify -> strip   -> body
 *
 * FAILURES
 * --------
 * All functions return a Status and never throw:
 *  - MalformedEnvelope  no ",CRC:" delimiter in the message.
 *  - IntegrityMismatch  checksum does not match the body.
 *  - DecodeError        encrypted input is not valid base64.
 * These are deliberately distinct from ParseError so the read loop can tell
 * "line was damaged" apart from "line was something we do not understand".
 *
 * NOTES
 * -----
 * The XOR scheme keeps casual sniffers out of the radio link; it is not
 * cryptography and must not be treated as such.
 */

#include <cstdint>
#include <string>

#include "postura/status.hpp"

namespace postura {
namespace envelope {

/// Literal that separates the body from its checksum.
static constexpr const char* CRC_DELIMITER = ",CRC:";

/// Key shared with the firmware. Both peers must agree on it byte for byte.
static constexpr const char* SHARED_KEY = "ESP4LD4APP2024K3Y";

/// Independent switches for the two protections.
struct EnvelopeOptions {
  bool integrity{false};   ///< append / require ",CRC:XXXX"
  bool encryption{false};  ///< XOR with SHARED_KEY, then base64
};

/// CRC-16/CCITT-FALSE over the raw bytes of @p body.
uint16_t checksum(const std::string& body);

/// checksum() rendered as 4 uppercase hex digits.
std::string checksum_hex(const std::string& body);

/// body + ",CRC:" + checksum_hex(body)
std::string wrap(const std::string& body);

/**
 * @brief Split a message on the LAST occurrence of ",CRC:".
 * @param message  Wrapped message.
 * @param body     Receives everything before the delimiter.
 * @param claimed  Receives everything after it, untouched.
 * @return Ok, or MalformedEnvelope when the delimiter is absent.
 */
Status unwrap(const std::string& message, std::string& body, std::string& claimed);

/**
 * @brief Unwrap and check the checksum (hex comparison is case-insensitive).
 * @return Ok with @p body set, MalformedEnvelope, or IntegrityMismatch.
 */
Status verify(const std::string& message, std::string& body);

/// XOR with SHARED_KEY (repeating), then base64. Length-preserving before base64.
std::string encrypt(const std::string& body);

/// Inverse of encrypt(). DecodeError on invalid base64.
Status decrypt(const std::string& encoded, std::string& body);

/// Standard base64 alphabet with '=' padding, no line wrapping.
std::string base64_encode(const std::string& raw);
Status base64_decode(const std::string& text, std::string& raw);

/**
 * @brief Turn a received line into a plaintext body.
 *
 * decrypt (if enabled) -> verify + strip (if integrity enabled).
 * With both switches off the line is returned unchanged.
 */
Status process_incoming(const std::string& message, const EnvelopeOptions& opt, std::string& body);

/**
 * @brief Turn a body into wire text (no line terminator; the link adds '\n').
 *
 * wrap (if integrity enabled) -> encrypt (if enabled).
 */
std::string prepare_outgoing(const std::string& message, const EnvelopeOptions& opt);

} // namespace envelope
} // namespace postura
