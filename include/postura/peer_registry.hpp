#pragma once
/**
 * @file peer_registry.hpp
 * @brief Discovery of paired sensor peers and selection of the default one.
 *
 * @details
 * PURPOSE
 * -------
 * Before the controller can connect it needs an address. On Linux a paired
 * HC-05/HC-06 module appears as a tty once its SPP channel is bound
 * (`rfcomm bind 0 <MAC>`), or as a USB-serial device when wired directly.
 * This header lists those candidates and picks the one that looks like our
 * sensor.
 *
 * SCAN ORDER
 * ----------
 *   1. /dev/serial/by-id/*  (stable names; the name carries the adapter id)
 *   2. /dev/rfcomm*
 *   3. /dev/ttyUSB*
 *   4. /dev/ttyACM*
 * Entries resolving to the same device are listed once, first name wins.
 *
 * DEFAULT PEER
 * ------------
 * `find_default_peer()` returns the first peer whose name contains one of the
 * allow-listed patterns, case-insensitively. The stock list is {"HC-06",
 * "HC-05"}; the config file may replace it. When nothing matches the result
 * is empty. There is no "first device" fallback, so an unrelated tty is never
 * opened by accident.
 *
 * EXAMPLE
 * -------
 * @code
 *   postura::SerialPeerDirectory dir;
 *   auto peers = dir.list_paired();
 *   if (auto p = postura::find_default_peer(peers, postura::default_peer_patterns())) {
 *     controller.connect(*p);
 *   }
 * @endcode
 */

#include <optional>
#include <utility>
#include <string>
#include <vector>

namespace postura {

struct PeerDescriptor {
  std::string name;     ///< human label, e.g. "usb-HC-06_0001-if00-port0" or "rfcomm0"
  std::string address;  ///< path handed to ILink::open()

  bool operator==(const PeerDescriptor& o) const { return name == o.name && address == o.address; }
};

class IPeerDirectory {
public:
  virtual ~IPeerDirectory() = default;
  virtual std::vector<PeerDescriptor> list_paired() const = 0;
};

/// Filesystem scan of the Linux device nodes listed above.
class SerialPeerDirectory : public IPeerDirectory {
public:
  /// @param dev_root  Root prefix for tests; "/dev" in production.
  explicit SerialPeerDirectory(std::string dev_root = "/dev") : dev_root_(std::move(dev_root)) {}

  std::vector<PeerDescriptor> list_paired() const override;

private:
  std::string dev_root_;
};

const std::vector<std::string>& default_peer_patterns();

std::optional<PeerDescriptor> find_default_peer(const std::vector<PeerDescriptor>& peers,
                                                const std::vector<std::string>& patterns);

} // namespace postura
