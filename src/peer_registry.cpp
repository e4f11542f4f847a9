// ============================================================================
// peer_registry.cpp: implementation for peer_registry.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "postura/peer_registry.hpp"
#include "postura/log.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>
#include <system_error>
#include <glob.h>          // glob(3) for the tty name patterns

namespace fs = std::filesystem;
namespace postura {

namespace {

/*
 * append_glob()
 * -------------
 * Append the matches of a glob() pattern, sorted (glob sorts by default).
 * glob() allocates; always globfree().
 */
void append_glob(std::vector<std::string>& out, const std::string& pattern) {
  glob_t g{};
  if (::glob(pattern.c_str(), 0, nullptr, &g) == 0) {
    for (size_t i = 0; i < g.gl_pathc; ++i) out.emplace_back(g.gl_pathv[i]);
  }
  ::globfree(&g);
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// Canonical target for de-duplication; the path itself if it does not resolve.
std::string resolve(const fs::path& p) {
  std::error_code ec;
  auto canon = fs::canonical(p, ec);
  return ec ? p.string() : canon.string();
}

} // namespace

/*
 * list_paired()
 * -------------
 * by-id links first (their names identify the adapter), then the classic
 * node names. Never throws; an unreadable directory just yields fewer peers.
 */
std::vector<PeerDescriptor> SerialPeerDirectory::list_paired() const {
  std::vector<PeerDescriptor> result;
  std::set<std::string> seen;

  auto add = [&](const fs::path& path) {
    const std::string target = resolve(path);
    if (!seen.insert(target).second) return;
    result.push_back({path.filename().string(), path.string()});
  };

  const fs::path by_id = fs::path(dev_root_) / "serial" / "by-id";
  std::error_code ec;
  if (fs::is_directory(by_id, ec)) {
    std::vector<fs::path> links;
    for (fs::directory_iterator it(by_id, ec), end; !ec && it != end; it.increment(ec)) {
      links.push_back(it->path());
    }
    std::sort(links.begin(), links.end());
    for (const auto& l : links) add(l);
  }

  std::vector<std::string> ttys;
  append_glob(ttys, dev_root_ + "/rfcomm*");
  append_glob(ttys, dev_root_ + "/ttyUSB*");
  append_glob(ttys, dev_root_ + "/ttyACM*");
  for (const auto& t : ttys) add(fs::path(t));

  log::debug("peer_scan", {{"root", dev_root_}, {"found", std::to_string(result.size())}});
  return result;
}

const std::vector<std::string>& default_peer_patterns() {
  static const std::vector<std::string> patterns{"HC-06", "HC-05"};
  return patterns;
}

std::optional<PeerDescriptor> find_default_peer(const std::vector<PeerDescriptor>& peers,
                                                const std::vector<std::string>& patterns) {
  std::vector<std::string> needles;
  needles.reserve(patterns.size());
  for (const auto& p : patterns) {
    if (!p.empty()) needles.push_back(lower(p));
  }

  for (const auto& peer : peers) {
    const std::string name = lower(peer.name);
    for (const auto& n : needles) {
      if (name.find(n) != std::string::npos) return peer;
    }
  }
  return std::nullopt;
}

} // namespace postura
