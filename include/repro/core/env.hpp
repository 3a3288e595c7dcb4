#pragma once
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace repro::env {

inline bool get_bool(const char* name, bool def = false) {
  if (const char* s = std::getenv(name)) {
    if (!std::strcmp(s,"1") || !std::strcmp(s,"true") || !std::strcmp(s,"TRUE")) return true;
    if (!std::strcmp(s,"0") || !std::strcmp(s,"false")|| !std::strcmp(s,"FALSE")) return false;
  }
  return def;
}

// Unsigned count knob; anything that is not a plain decimal, or overflows, falls back to def.
inline std::size_t get_size(const char* name, std::size_t def = 0) {
  const char* env = std::getenv(name);
  if (!env || !*env) return def;
  std::size_t v = 0;
  for (const char* p = env; *p; ++p) {
    if (*p < '0' || *p > '9') return def;
    const std::size_t digit = std::size_t(*p - '0');
    if (v > (std::numeric_limits<std::size_t>::max() - digit) / 10) return def;
    v = v * 10 + digit;
  }
  return v;
}

// Optional signed 64-bit seed. Unset, empty or "none" -> nullopt.
// Malformed values are configuration errors and throw.
inline std::optional<std::int64_t> get_seed(const char* name) {
  const char* s = std::getenv(name);
  if (!s || !*s || !std::strcmp(s, "none") || !std::strcmp(s, "None")) return std::nullopt;
  errno = 0;
  char* end = nullptr;
  const long long v = std::strtoll(s, &end, 10);
  if (errno == ERANGE || end == s || *end != '\0') {
    throw std::invalid_argument(std::string(name) + ": not a 64-bit integer seed: '" + s + "'");
  }
  return static_cast<std::int64_t>(v);
}

} // namespace repro::env
