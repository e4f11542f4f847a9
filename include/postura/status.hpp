#pragma once
/**
 * @file status.hpp
 * @brief Result codes shared by every Postura module.
 *
 * @details
 * Postura does not throw across module boundaries. Each fallible operation
 * returns a `Status` and writes its product through an out-parameter, the
 * same shape as the transport result enums it grew from. Callers branch on
 * the code; logs print `to_string()` so a field log reads
 * `status=error reason=integrity_mismatch`.
 *
 * Groups:
 *  - transport:  ConnectFailed, PermissionDenied, StreamClosed, WriteFailed
 *  - codec:      MalformedEnvelope, IntegrityMismatch, DecodeError
 *  - parser:     ParseError (line is logged and discarded, never fatal)
 *  - lifecycle:  NotConnected, PeerNotFound, OutOfRange, Interrupted
 *  - sync/store: RemoteWriteFailed, NotFound
 */

#include <cstdint>

namespace postura {

enum class Status : uint8_t {
  Ok = 0,
  // transport
  ConnectFailed,
  PermissionDenied,
  StreamClosed,
  WriteFailed,
  // codec
  MalformedEnvelope,
  IntegrityMismatch,
  DecodeError,
  // parser
  ParseError,
  // lifecycle
  NotConnected,
  PeerNotFound,
  OutOfRange,
  Interrupted,
  // sync / store
  RemoteWriteFailed,
  NotFound,
};

/// snake_case name used in log lines and CLI output.
const char* to_string(Status s);

inline bool ok(Status s) { return s == Status::Ok; }

} // namespace postura
