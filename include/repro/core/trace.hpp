#pragma once
#include <atomic>
#include <cstdarg>
#include <cstdio>

#include "repro/core/env.hpp"

namespace repro {

// REPRO_TRACE=1 turns on tracing of context transitions. Read once.
inline bool trace_enabled_once() {
#if defined(REPRO_FORCE_TRACE) && REPRO_FORCE_TRACE
  return true;
#else
  static std::atomic<int> cached{-1};
  int v = cached.load(std::memory_order_relaxed);
  if (v < 0) {
    v = env::get_bool("REPRO_TRACE", false) ? 1 : 0;
    cached.store(v, std::memory_order_relaxed);
  }
  return v == 1;
#endif
}

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 1, 2)))
#endif
inline void trace(const char* fmt, ...) {
  if (!trace_enabled_once()) return;
  std::fputs("[REPRO_TRACE] ", stderr);
  va_list args;
  va_start(args, fmt);
  std::vfprintf(stderr, fmt, args);
  va_end(args);
  std::fputc('\n', stderr);
  std::fflush(stderr);
}

} // namespace repro
