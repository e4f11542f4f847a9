// ============================================================================
// link_linux_serial.cpp: implementation for link_linux_serial.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "postura/transport/link_linux_serial.hpp"
#include "postura/log.hpp"

#include <fcntl.h>         // ::open flags (O_RDWR, O_NOCTTY, ...)
#include <unistd.h>        // ::read, ::write, ::close, ::dup, ::pipe2, usleep
#include <termios.h>       // termios struct + raw mode helpers
#include <poll.h>          // poll(2) for the read loop and write backpressure
#include <cerrno>
#include <cstring>         // strerror

namespace postura {
namespace transport {

namespace {

// Bound on how long write() waits for the driver to drain before giving up.
constexpr int WRITE_POLL_MS = 2000;

bool to_speed(int baud, speed_t& out) {
  switch (baud) {
    case 9600:   out = B9600;   return true;
    case 19200:  out = B19200;  return true;
    case 38400:  out = B38400;  return true;
    case 57600:  out = B57600;  return true;
    case 115200: out = B115200; return true;
#ifdef B230400
    case 230400: out = B230400; return true;
#endif
    default: return false;
  }
}

// ---------------------------------------------------------------------------
// set_raw()
// ---------
// Raw 8N1 at the given speed. VMIN/VTIME are zero; poll() does the waiting.
// No hardware flow control: HC-0x modules only wire TX/RX.
// ---------------------------------------------------------------------------
bool set_raw(int fd, speed_t speed) {
  termios tio{};
  if (::tcgetattr(fd, &tio) != 0) return false;

  ::cfmakeraw(&tio);
  ::cfsetispeed(&tio, speed);
  ::cfsetospeed(&tio, speed);

  tio.c_cflag |= (CLOCAL | CREAD);
  tio.c_cflag &= ~CRTSCTS;
  tio.c_cc[VMIN]  = 0;
  tio.c_cc[VTIME] = 0;

  if (::tcsetattr(fd, TCSANOW, &tio) != 0) return false;
  ::tcflush(fd, TCIOFLUSH);
  return true;
}

void close_fd(int& fd) {
  if (fd >= 0) {
    ::close(fd);  // EINTR/EIO on close are not actionable here
    fd = -1;
  }
}

Status fail_open(const char* step, const std::string& address) {
  const int err = errno;
  log::warn("link_open_failed", {{"dev", address}, {"step", step}, {"errno", std::strerror(err)}});
  return (err == EACCES || err == EPERM) ? Status::PermissionDenied : Status::ConnectFailed;
}

} // namespace

bool is_supported_baud(int baud) {
  speed_t unused;
  return to_speed(baud, unused);
}

// ---------------------------------------------------------------------------
// open()
// ------
// 1) close anything left over
// 2) open the device non-blocking, apply raw mode
// 3) create the wake pipe and the dup'd read/write descriptors
// 4) optional settle delay, then flush boot chatter
// Any failure closes what was acquired so far.
// ---------------------------------------------------------------------------
Status LinuxSerialLink::open(const std::string& address) {
  close();

  speed_t speed;
  if (!to_speed(baud_, speed)) {
    log::warn("link_open_failed", {{"dev", address}, {"reason", "unsupported_baud"},
                                   {"baud", std::to_string(baud_)}});
    return Status::ConnectFailed;
  }

  fd_ = ::open(address.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
  if (fd_ < 0) return fail_open("open", address);

  Status st = Status::Ok;
  if (!set_raw(fd_, speed)) {
    st = fail_open("termios", address);
  } else if (::pipe2(wake_, O_NONBLOCK | O_CLOEXEC) != 0) {
    st = fail_open("pipe", address);
  } else if ((in_fd_ = ::dup(fd_)) < 0) {
    st = fail_open("dup_in", address);
  } else if ((out_fd_ = ::dup(fd_)) < 0) {
    st = fail_open("dup_out", address);
  }
  if (!ok(st)) {
    close();
    return st;
  }

  if (settle_ms_ > 0) {
    ::usleep(static_cast<useconds_t>(settle_ms_) * 1000);
    ::tcflush(fd_, TCIOFLUSH);
  }

  pending_.clear();
  open_.store(true);
  log::info("link_open", {{"dev", address}, {"baud", std::to_string(baud_)}});
  return Status::Ok;
}

// ---------------------------------------------------------------------------
// read_line()
// -----------
// Serve from the pending buffer first; otherwise poll the input and the wake
// pipe together. CR bytes are dropped so "\r\n" and "\n" both terminate.
// ---------------------------------------------------------------------------
Status LinuxSerialLink::read_line(std::string& out) {
  if (in_fd_ < 0) return Status::StreamClosed;

  char buf[256];
  for (;;) {
    const size_t nl = pending_.find('\n');
    if (nl != std::string::npos) {
      out.clear();
      for (size_t i = 0; i < nl; ++i) {
        if (pending_[i] != '\r') out += pending_[i];
      }
      pending_.erase(0, nl + 1);
      return Status::Ok;
    }
    if (pending_.size() > MAX_LINE) {
      log::warn("link_line_overflow", {{"bytes", std::to_string(pending_.size())}});
      pending_.clear();
    }

    pollfd pfd[2] = {{in_fd_, POLLIN, 0}, {wake_[0], POLLIN, 0}};
    const int pr = ::poll(pfd, 2, -1);
    if (pr < 0) {
      if (errno == EINTR) continue;
      return Status::StreamClosed;
    }

    if (pfd[1].revents & POLLIN) {
      char drain[16];
      while (::read(wake_[0], drain, sizeof(drain)) > 0) {}
      return Status::Interrupted;
    }

    if (pfd[0].revents & POLLIN) {
      const ssize_t n = ::read(in_fd_, buf, sizeof(buf));
      if (n > 0) {
        pending_.append(buf, static_cast<size_t>(n));
        continue;
      }
      if (n == 0) return Status::StreamClosed;
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
      return Status::StreamClosed;
    }

    if (pfd[0].revents & (POLLERR | POLLHUP | POLLNVAL)) return Status::StreamClosed;
  }
}

// ---------------------------------------------------------------------------
// write()
// -------
// Loop until every byte is accepted. EAGAIN waits for POLLOUT (bounded);
// anything else, including a hang-up, is WriteFailed.
// ---------------------------------------------------------------------------
Status LinuxSerialLink::write(const std::string& bytes) {
  if (out_fd_ < 0) return Status::WriteFailed;

  size_t done = 0;
  while (done < bytes.size()) {
    const ssize_t w = ::write(out_fd_, bytes.data() + done, bytes.size() - done);
    if (w > 0) {
      done += static_cast<size_t>(w);
      continue;
    }
    if (w < 0 && errno == EINTR) continue;
    if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{out_fd_, POLLOUT, 0};
      const int pr = ::poll(&pfd, 1, WRITE_POLL_MS);
      if (pr > 0 && (pfd.revents & POLLOUT)) continue;
      log::warn("link_write_stalled", {{"sent", std::to_string(done)}});
      return Status::WriteFailed;
    }
    log::warn("link_write_failed", {{"errno", std::strerror(errno)}});
    return Status::WriteFailed;
  }
  return Status::Ok;
}

void LinuxSerialLink::interrupt() {
  const int fd = wake_[1];
  if (fd < 0) return;
  const char b = 1;
  // A full pipe already has a wake-up queued.
  if (::write(fd, &b, 1) < 0 && errno != EAGAIN) {
    log::debug("link_interrupt_failed", {{"errno", std::strerror(errno)}});
  }
}

void LinuxSerialLink::close() {
  const bool was_open = open_.exchange(false);
  close_fd(wake_[1]);
  close_fd(wake_[0]);
  close_fd(in_fd_);
  close_fd(out_fd_);
  close_fd(fd_);
  pending_.clear();
  if (was_open) log::info("link_closed");
}

} // namespace transport
} // namespace postura
