#pragma once
#include <cstdio>

#include "fad/core/config.hpp"
#include "fad/core/dual.hpp"

namespace fad { namespace trace {

// One stderr line per propagated operation:
//   [FAD_TRACE] mul | (3, 1) (3, 1) -> (9, 6)
void emit(const char* op, const Dual& x, const Dual& out);
void emit(const char* op, const Dual& a, const Dual& b, const Dual& out);

// Destination of trace lines; stderr unless redirected. nullptr resets.
void set_sink(std::FILE* f);
std::FILE* sink();

}} // namespace fad::trace

#define FAD_TRACE_OP(...) \
  do { if (::fad::config::trace_enabled()) ::fad::trace::emit(__VA_ARGS__); } while (0)
