#include "fad/core/trace.hpp"

#include <atomic>
#include <cstdio>

namespace fad { namespace trace {

namespace {
std::atomic<std::FILE*> _sink{nullptr};

void put(std::FILE* f, const Dual& x, int prec) {
  std::fprintf(f, "(%.*g, %.*g)", prec, x.value(), prec, x.derivative());
}
} // anon

void set_sink(std::FILE* f) { _sink.store(f, std::memory_order_relaxed); }

std::FILE* sink() {
  std::FILE* f = _sink.load(std::memory_order_relaxed);
  return f ? f : stderr;
}

void emit(const char* op, const Dual& x, const Dual& out) {
  std::FILE* f = sink();
  const int prec = config::print_precision();
  std::fprintf(f, "[FAD_TRACE] %s | ", op ? op : "(unnamed)");
  put(f, x, prec);
  std::fprintf(f, " -> ");
  put(f, out, prec);
  std::fprintf(f, "\n");
  std::fflush(f);
}

void emit(const char* op, const Dual& a, const Dual& b, const Dual& out) {
  std::FILE* f = sink();
  const int prec = config::print_precision();
  std::fprintf(f, "[FAD_TRACE] %s | ", op ? op : "(unnamed)");
  put(f, a, prec);
  std::fprintf(f, " ");
  put(f, b, prec);
  std::fprintf(f, " -> ");
  put(f, out, prec);
  std::fprintf(f, "\n");
  std::fflush(f);
}

}} // namespace fad::trace
