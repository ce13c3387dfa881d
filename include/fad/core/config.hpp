#pragma once
#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <cstring>

namespace fad { namespace config {

// ---------- env parsing ----------
inline bool _env_bool(const char* name, bool def = false) {
  if (const char* s = std::getenv(name)) {
    if (!std::strcmp(s,"1") || !std::strcmp(s,"true") || !std::strcmp(s,"TRUE")) return true;
    if (!std::strcmp(s,"0") || !std::strcmp(s,"false")|| !std::strcmp(s,"FALSE")) return false;
  }
  return def;
}

inline int _env_int(const char* name, int def) {
  const char* s = std::getenv(name);
  if (!s || !*s) return def;
  int v = 0;
  for (const char* p = s; *p; ++p) {
    if (*p < '0' || *p > '9') return def;
    v = v * 10 + int(*p - '0');
    if (v > 1000) return def;
  }
  return v;
}

// ---------- tracing (FAD_TRACE) ----------
inline std::atomic<bool>& _trace_flag() {
  static std::atomic<bool> v{ _env_bool("FAD_TRACE", false) };
  return v;
}
inline void set_trace_enabled(bool on) {
  _trace_flag().store(on, std::memory_order_relaxed);
}
inline bool trace_enabled() {
  return _trace_flag().load(std::memory_order_relaxed);
}

// ---------- print precision (FAD_PRECISION) ----------
// Significant digits used by operator<< and report(); clamped to [1, 17].
inline constexpr int kDefaultPrecision = 10;
inline constexpr int kMaxPrecision = 17;

inline int _clamp_precision(int p) { return std::clamp(p, 1, kMaxPrecision); }

inline std::atomic<int>& _precision() {
  static std::atomic<int> p{ _clamp_precision(_env_int("FAD_PRECISION", kDefaultPrecision)) };
  return p;
}
inline void set_print_precision(int digits) {
  _precision().store(_clamp_precision(digits), std::memory_order_relaxed);
}
inline int print_precision() {
  return _precision().load(std::memory_order_relaxed);
}

// Restores the previous trace setting on scope exit (tests, drivers).
struct ScopedTrace {
  explicit ScopedTrace(bool on) : prev(trace_enabled()) { set_trace_enabled(on); }
  ~ScopedTrace() { set_trace_enabled(prev); }
  ScopedTrace(const ScopedTrace&) = delete;
  ScopedTrace& operator=(const ScopedTrace&) = delete;
private:
  bool prev;
};

}} // namespace fad::config
