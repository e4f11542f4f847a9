#pragma once
/**
 * @file json_file.hpp
 * @brief Small JSON file helpers shared by the store, offline buffer and config.
 *
 * Writes go to "<path>.tmp" and are renamed over the target, so a crash
 * mid-write leaves either the old file or the new one, never half of each.
 */

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace postura {

/// Read @p p into @p out. A missing file returns false with @p err left empty.
/// Unreadable or invalid JSON -> false with a reason in @p err.
bool read_json_file(const std::filesystem::path& p, nlohmann::json& out, std::string& err);

/// Write @p j to @p p atomically, creating parent directories.
bool atomic_write_json(const std::filesystem::path& p, const nlohmann::json& j, std::string& err);

/// Decode one stored record. An entry that is not an object, or has a field
/// of the wrong type, returns false with the reason in @p err.
template <typename T>
bool decode_entry(const nlohmann::json& j, T& out, std::string& err) {
  if (!j.is_object()) {
    err = "entry is not an object";
    return false;
  }
  try {
    out = j.get<T>();
  } catch (const nlohmann::json::exception& e) {
    err = e.what();
    return false;
  }
  return true;
}

/// String member @p key of @p j, or empty when absent or not a string.
inline std::string string_member(const nlohmann::json& j, const char* key) {
  if (!j.is_object()) return std::string();
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) return std::string();
  return it->get<std::string>();
}

} // namespace postura
