#pragma once
/**
 * @file link_base.hpp
 * @brief Line-oriented, blocking link interface the connection controller drives.
 *
 * Contract:
 *  - open(address) blocks until the link is usable or fails. Any previous
 *    handle is closed first, including one left half-open by a failure.
 *  - read_line(out) blocks until a full '\n'-terminated line arrives (CR is
 *    dropped, the newline is not included), the stream ends (StreamClosed),
 *    or interrupt() is called (Interrupted).
 *  - write(bytes) sends everything or returns WriteFailed.
 *  - interrupt() may be called from any thread; it wakes a pending read_line.
 *  - close() is idempotent and never fails.
 *
 * One reader thread and one writer thread may use a link concurrently.
 * close() must not race read_line(); the owner joins the reader first.
 */

#include <string>

#include "postura/status.hpp"

namespace postura {
namespace transport {

class ILink {
public:
  virtual ~ILink() = default;
  virtual Status      open(const std::string& address) = 0;
  virtual Status      read_line(std::string& out) = 0;
  virtual Status      write(const std::string& bytes) = 0;
  virtual void        interrupt() = 0;
  virtual void        close() = 0;
  virtual bool        is_open() const = 0;
  virtual const char* name() const = 0;
};

} // namespace transport
} // namespace postura
