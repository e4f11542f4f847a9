// ============================================================================
// json_file.cpp: implementation for json_file.hpp
// ============================================================================

#include "postura/json_file.hpp"

#include <fstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;
namespace postura {

bool read_json_file(const fs::path& p, nlohmann::json& out, std::string& err) {
  err.clear();
  std::error_code ec;
  if (!fs::exists(p, ec)) return false;

  std::ifstream in(p);
  if (!in) {
    err = "cannot open " + p.string();
    return false;
  }
  // allow_exceptions=false: a parse failure yields a discarded value
  nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
  if (j.is_discarded()) {
    err = "invalid json in " + p.string();
    return false;
  }
  out = std::move(j);
  return true;
}

bool atomic_write_json(const fs::path& p, const nlohmann::json& j, std::string& err) {
  err.clear();
  std::error_code ec;
  if (p.has_parent_path()) {
    fs::create_directories(p.parent_path(), ec);
    if (ec) {
      err = "mkdir " + p.parent_path().string() + ": " + ec.message();
      return false;
    }
  }

  fs::path tmp = p;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      err = "cannot open " + tmp.string();
      return false;
    }
    out << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    out.flush();
    if (!out) {
      err = "write failed " + tmp.string();
      return false;
    }
  }

  fs::rename(tmp, p, ec);
  if (ec) {
    err = "rename " + tmp.string() + ": " + ec.message();
    fs::remove(tmp, ec);
    return false;
  }
  return true;
}

} // namespace postura
