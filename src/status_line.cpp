// -----------------------------------------------------------------------------
// Implementation for status_line.hpp
//
// - Tokenizer: split on ',' then on the first ':' of each field.
// - Conversion: strict decimal for numbers, exact "1" for booleans.
// - No exceptions; every failure is a Status.
// -----------------------------------------------------------------------------

#include "postura/status_line.hpp"

#include "etl/string_view.h"
#include "etl/vector.h"

#include <cctype>
#include <climits>

namespace postura {

namespace {

struct Field {
  etl::string_view key;
  etl::string_view value;
};

using FieldList = etl::vector<Field, MAX_FIELDS>;

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

etl::string_view trim_view(const char* p, size_t n) {
  size_t a = 0, b = n;
  while (a < b && is_space(p[a])) ++a;
  while (b > a && is_space(p[b - 1])) --b;
  return etl::string_view(p + a, b - a);
}

bool equals(etl::string_view v, const char* lit) {
  size_t i = 0;
  for (; lit[i] != '\0'; ++i) {
    if (i >= v.size() || v[i] != lit[i]) return false;
  }
  return i == v.size();
}

bool starts_with(const std::string& s, const char* prefix) {
  return s.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

// Optional sign followed by at least one digit, nothing else.
bool parse_int(etl::string_view v, int& out) {
  if (v.empty()) return false;
  size_t i = 0;
  bool neg = false;
  if (v[0] == '-' || v[0] == '+') { neg = (v[0] == '-'); i = 1; }
  if (i >= v.size()) return false;
  long long acc = 0;
  for (; i < v.size(); ++i) {
    const char c = v[i];
    if (c < '0' || c > '9') return false;
    acc = acc * 10 + (c - '0');
    if (acc > INT_MAX) return false;
  }
  out = static_cast<int>(neg ? -acc : acc);
  return true;
}

int int_or(const Field* f, int fallback) {
  int v = 0;
  return (f && parse_int(f->value, v)) ? v : fallback;
}

bool flag(const Field* f) {
  return f && equals(f->value, "1");
}

// Split the line into fields. Fails on a field without ':' or on overflow.
Status tokenize(const std::string& line, FieldList& out) {
  if (line.empty()) return Status::ParseError;

  const char* p = line.data();
  const size_t n = line.size();
  size_t start = 0;

  while (start <= n) {
    size_t end = line.find(',', start);
    if (end == std::string::npos) end = n;

    const etl::string_view part = trim_view(p + start, end - start);
    size_t colon = etl::string_view::npos;
    for (size_t i = 0; i < part.size(); ++i) {
      if (part[i] == ':') { colon = i; break; }
    }
    if (colon == etl::string_view::npos) return Status::ParseError;
    if (out.full()) return Status::ParseError;

    Field f;
    f.key   = trim_view(part.data(), colon);
    f.value = trim_view(part.data() + colon + 1, part.size() - colon - 1);
    out.push_back(f);

    start = end + 1;
  }
  return Status::Ok;
}

// Last occurrence wins, matching a map built left to right.
const Field* find(const FieldList& fields, const char* key) {
  const Field* hit = nullptr;
  for (const auto& f : fields) {
    if (equals(f.key, key)) hit = &f;
  }
  return hit;
}

} // namespace

const char* to_string(LineKind k) {
  switch (k) {
    case LineKind::StatusReport: return "status";
    case LineKind::Pong:         return "pong";
    case LineKind::Ack:          return "ok";
    case LineKind::Nack:         return "err";
    case LineKind::Unknown:      return "unknown";
  }
  return "unknown";
}

std::string trim(const std::string& s) {
  const etl::string_view v = trim_view(s.data(), s.size());
  return std::string(v.data(), v.size());
}

LineKind classify_line(const std::string& line) {
  if (starts_with(line, "DIST:")) return LineKind::StatusReport;
  if (starts_with(line, "PONG"))  return LineKind::Pong;
  if (starts_with(line, "OK"))    return LineKind::Ack;
  if (starts_with(line, "ERR"))   return LineKind::Nack;
  return LineKind::Unknown;
}

Status parse_status_line(const std::string& line, uint64_t timestamp_ms, Reading& out) {
  FieldList fields;
  const Status st = tokenize(line, fields);
  if (!ok(st)) return st;

  out = Reading(int_or(find(fields, "DIST"), 0),
                flag(find(fields, "SENT")),
                flag(find(fields, "BAD")),
                flag(find(fields, "ALR")),
                int_or(find(fields, "GREEN"), GREEN_DEFAULT_MM),
                int_or(find(fields, "RED"), RED_DEFAULT_MM),
                flag(find(fields, "PAUS")),
                timestamp_ms);
  return Status::Ok;
}

} // namespace postura
