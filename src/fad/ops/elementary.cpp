#include "fad/ops/elementary.hpp"
#include "fad/core/errors.hpp"
#include "fad/core/trace.hpp"

#include <cmath>
#include <sstream>

namespace fad {

namespace {

std::string num(double v) {
  std::ostringstream oss;
  oss << v;
  return oss.str();
}

Dual traced(const char* op, const Dual& x, const Dual& out) {
  FAD_TRACE_OP(op, x, out);
  return out;
}

template <class DualFn>
Operand unary(const Operand& x, DualFn dual) {
  return x.visit([&](const auto& v) { return Operand(dual(v)); });
}

} // anon

// ---------- Dual ----------

Dual sin(const Dual& x) {
  return traced("sin", x, Dual(std::sin(x.value()), std::cos(x.value()) * x.derivative()));
}

Dual cos(const Dual& x) {
  return traced("cos", x, Dual(std::cos(x.value()), -std::sin(x.value()) * x.derivative()));
}

Dual tan(const Dual& x) {
  const double t = std::tan(x.value());
  return traced("tan", x, Dual(t, (1.0 + t * t) * x.derivative()));
}

Dual exp(const Dual& x) {
  const double e = std::exp(x.value());
  return traced("exp", x, Dual(e, e * x.derivative()));
}

Dual log(const Dual& x) {
  if (x.value() <= 0.0) throw DomainError("log: argument must be positive, got " + num(x.value()));
  return traced("log", x, Dual(std::log(x.value()), x.derivative() / x.value()));
}

Dual sqrt(const Dual& x) {
  if (x.value() < 0.0) throw DomainError("sqrt: argument must be non-negative, got " + num(x.value()));
  const double r = std::sqrt(x.value());
  const double d = x.derivative() == 0.0 ? 0.0 : x.derivative() / (2.0 * r);
  return traced("sqrt", x, Dual(r, d));
}

Dual abs(const Dual& x) {
  if (x.value() < 0.0) return traced("abs", x, Dual(-x.value(), -x.derivative()));
  return traced("abs", x, x);
}

// ---------- plain ----------

double sin(double x)  { return std::sin(x); }
double cos(double x)  { return std::cos(x); }
double tan(double x)  { return std::tan(x); }
double exp(double x)  { return std::exp(x); }
double log(double x)  { return std::log(x); }
double sqrt(double x) { return std::sqrt(x); }
double abs(double x)  { return std::fabs(x); }

// ---------- Operand: overload resolution on the held kind ----------

Operand sin(const Operand& x)  { return unary(x, [](const auto& v) { return fad::sin(v); }); }
Operand cos(const Operand& x)  { return unary(x, [](const auto& v) { return fad::cos(v); }); }
Operand tan(const Operand& x)  { return unary(x, [](const auto& v) { return fad::tan(v); }); }
Operand exp(const Operand& x)  { return unary(x, [](const auto& v) { return fad::exp(v); }); }
Operand log(const Operand& x)  { return unary(x, [](const auto& v) { return fad::log(v); }); }
Operand sqrt(const Operand& x) { return unary(x, [](const auto& v) { return fad::sqrt(v); }); }
Operand abs(const Operand& x)  { return unary(x, [](const auto& v) { return fad::abs(v); }); }

} // namespace fad
