// ============================================================================
// log.cpp: implementation for log.hpp
// ============================================================================

#include "postura/log.hpp"
#include "postura/status.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace postura {

// Status names live here: they are only ever needed when something is logged.
const char* to_string(Status s) {
  switch (s) {
    case Status::Ok:                return "ok";
    case Status::ConnectFailed:     return "connect_failed";
    case Status::PermissionDenied:  return "permission_denied";
    case Status::StreamClosed:      return "stream_closed";
    case Status::WriteFailed:       return "write_failed";
    case Status::MalformedEnvelope: return "malformed_envelope";
    case Status::IntegrityMismatch: return "integrity_mismatch";
    case Status::DecodeError:       return "decode_error";
    case Status::ParseError:        return "parse_error";
    case Status::NotConnected:      return "not_connected";
    case Status::PeerNotFound:      return "peer_not_found";
    case Status::OutOfRange:        return "out_of_range";
    case Status::Interrupted:       return "interrupted";
    case Status::RemoteWriteFailed: return "remote_write_failed";
    case Status::NotFound:          return "not_found";
  }
  return "unknown";
}

namespace log {

namespace {

std::atomic<Level> g_level{Level::Info};
std::mutex         g_mtx;     // guards g_sink and serializes output
Sink               g_sink;    // empty => stderr

// Quote values that would break the key=value grammar.
void append_value(std::string& out, const std::string& v) {
  bool needs_quotes = v.empty();
  for (char c : v) {
    if (c == ' ' || c == '=' || c == '"' || c == '\t') { needs_quotes = true; break; }
  }
  if (!needs_quotes) { out += v; return; }
  out += '"';
  for (char c : v) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  out += '"';
}

} // namespace

const char* to_string(Level lvl) {
  switch (lvl) {
    case Level::Debug: return "debug";
    case Level::Info:  return "info";
    case Level::Warn:  return "warn";
    case Level::Error: return "error";
    case Level::Off:   return "off";
  }
  return "info";
}

void set_level(Level lvl) { g_level.store(lvl); }
Level level() { return g_level.load(); }

void set_sink(Sink sink) {
  std::lock_guard<std::mutex> lk(g_mtx);
  g_sink = std::move(sink);
}

void write(Level lvl, const char* event, std::initializer_list<Field> fields) {
  if (lvl == Level::Off || lvl < g_level.load()) return;

  std::string line;
  line.reserve(96);
  line += "level=";
  line += to_string(lvl);
  line += " event=";
  line += event;
  for (const auto& f : fields) {
    line += ' ';
    line += f.first;
    line += '=';
    append_value(line, f.second);
  }

  std::lock_guard<std::mutex> lk(g_mtx);
  if (g_sink) {
    g_sink(lvl, line);
  } else {
    std::cerr << line << "\n";
  }
}

} // namespace log
} // namespace postura
