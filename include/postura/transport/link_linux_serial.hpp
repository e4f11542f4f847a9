#pragma once
/**
 * @file link_linux_serial.hpp
 * @brief Linux tty link (termios raw 8N1, poll-driven) for HC-05/HC-06 style radios.
 *
 * @details
 * The radio module shows up as a tty: `/dev/rfcomm0` after binding an SPP
 * channel, or `/dev/ttyUSB*` / `/dev/ttyACM*` behind a USB bridge. Either way
 * it is a byte stream carrying newline-terminated text.
 *
 * DESCRIPTORS
 * -----------
 *   fd_       device handle (owns the termios settings)
 *   in_fd_    dup of fd_, used only by read_line()
 *   out_fd_   dup of fd_, used only by write()
 *   wake_[2]  self-pipe; interrupt() writes one byte to unblock poll()
 *
 * close() releases them in the order: wake pipe, input, output, device.
 * Each step is independent; a failure in one does not skip the rest.
 *
 * BAUD
 * ----
 * 9600, 19200, 38400, 57600, 115200, 230400. Anything else is rejected at
 * open() with ConnectFailed. HC-0x modules ship at 9600.
 */

#if !defined(__linux__)
#  error "link_linux_serial.hpp is Linux-only."
#endif

#include <atomic>
#include <string>

#include "postura/transport/link_base.hpp"

namespace postura {
namespace transport {

class LinuxSerialLink : public ILink {
public:
  /// Longest line kept while waiting for '\n'; longer input is discarded.
  static constexpr size_t MAX_LINE = 1024;

  explicit LinuxSerialLink(int baud = 9600, int settle_ms = 0)
  : baud_(baud), settle_ms_(settle_ms) {}
  ~LinuxSerialLink() override { close(); }

  LinuxSerialLink(const LinuxSerialLink&) = delete;
  LinuxSerialLink& operator=(const LinuxSerialLink&) = delete;

  Status      open(const std::string& address) override;
  Status      read_line(std::string& out) override;
  Status      write(const std::string& bytes) override;
  void        interrupt() override;
  void        close() override;
  bool        is_open() const override { return open_.load(); }
  const char* name() const override { return "linux-serial"; }

  int baud() const { return baud_; }

private:
  int fd_{-1};
  int in_fd_{-1};
  int out_fd_{-1};
  int wake_[2]{-1, -1};
  int baud_;
  int settle_ms_;
  std::string pending_;
  std::atomic<bool> open_{false};
};

/// True if @p baud is one of the supported rates.
bool is_supported_baud(int baud);

} // namespace transport
} // namespace postura
