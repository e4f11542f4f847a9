#pragma once
/**
 * @file log.hpp
 * @brief Line-oriented key=value logging to stderr.
 *
 * @details
 * Every record is one line:
 * @code
 *   level=warn event=line_rejected reason=integrity_mismatch line="DIST:1,CRC:0000"
 * @endcode
 * Records are grep-able and survive being piped through `journalctl` or a
 * serial console untouched. The reader thread and the scheduler thread both
 * log, so writes go through one mutex.
 *
 * The sink can be replaced (tests capture records into a vector). The level
 * threshold is process-wide and set once by the CLI (`--verbose`, `--quiet`).
 */

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <string>
#include <utility>

namespace postura {
namespace log {

enum class Level : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

/// One `key=value` pair. Values with spaces are quoted on output.
using Field = std::pair<const char*, std::string>;

/// Receives fully formatted records (no trailing newline).
using Sink = std::function<void(Level, const std::string&)>;

void set_level(Level lvl);
Level level();

/// Replace the output sink. Passing an empty function restores stderr.
void set_sink(Sink sink);

/// Format and emit one record if @p lvl passes the threshold.
void write(Level lvl, const char* event, std::initializer_list<Field> fields = {});

const char* to_string(Level lvl);

inline void debug(const char* event, std::initializer_list<Field> f = {}) { write(Level::Debug, event, f); }
inline void info (const char* event, std::initializer_list<Field> f = {}) { write(Level::Info,  event, f); }
inline void warn (const char* event, std::initializer_list<Field> f = {}) { write(Level::Warn,  event, f); }
inline void error(const char* event, std::initializer_list<Field> f = {}) { write(Level::Error, event, f); }

} // namespace log
} // namespace postura
