#pragma once
/**
 * @file status_line.hpp
 * @brief Decoder for the sensor's KEY:VALUE status line and its control replies.
 *
 * @details
 * GRAMMAR
 * -------
 *   line   := field ("," field)*
 *   field  := KEY ":" VALUE          (whitespace around KEY and VALUE is trimmed)
 *
 * Keys are order-insensitive; unknown keys are ignored so newer firmware can
 * add fields without breaking older hosts. Missing keys take defaults:
 *
 *   DIST  -> 0          SENT/BAD/ALR/PAUS -> false unless exactly "1"
 *   GREEN -> 80         RED               -> 120
 *
 * A non-numeric DIST/GREEN/RED value also falls back to its default.
 * A field without ':' (including an empty field from ",,") rejects the whole
 * line with ParseError. The caller logs and drops it; one bad line never
 * stops the stream.
 *
 * CONTROL LINES
 * -------------
 * The firmware also answers commands:
 *   PONG          liveness reply to PING
 *   OK <ECHO>     command accepted
 *   ERR <REASON>  command rejected, e.g. "ERR GREEN RANGE 60-200", "ERR CMD"
 * `classify_line()` sorts a line into one of these before parsing so control
 * replies never reach the status decoder.
 *
 * MEMORY
 * ------
 * Tokenizing uses a fixed-capacity `etl::vector` of `etl::string_view`s
 * pointing into the caller's buffer. No copies are made until a value is
 * converted. Lines with more than MAX_FIELDS fields are rejected.
 */

#include <cstdint>
#include <string>

#include "postura/reading.hpp"
#include "postura/status.hpp"

namespace postura {

/// Upper bound on fields per status line (firmware sends 7, 8 with CRC).
static constexpr size_t MAX_FIELDS = 16;

enum class LineKind : uint8_t {
  StatusReport,  ///< starts with "DIST:"
  Pong,          ///< "PONG"
  Ack,           ///< "OK ..."
  Nack,          ///< "ERR ..."
  Unknown,
};

const char* to_string(LineKind k);

/// A control reply as surfaced to observers (the raw text is kept for logs/CLI).
struct ControlReply {
  LineKind    kind{LineKind::Unknown};
  std::string text;
};

/// Strip leading/trailing whitespace (spaces, tabs, CR, LF).
std::string trim(const std::string& s);

/// Decide what kind of line this is. Expects a trimmed line.
LineKind classify_line(const std::string& line);

/**
 * @brief Decode one status line into a Reading.
 * @param line          Trimmed line, envelope already removed.
 * @param timestamp_ms  Capture time to stamp on the Reading.
 * @param out           Receives the Reading on success.
 * @return Ok or ParseError.
 */
Status parse_status_line(const std::string& line, uint64_t timestamp_ms, Reading& out);

} // namespace postura
