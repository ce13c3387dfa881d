#include "fad/ops/arithmetic.hpp"
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

// ---------- chain-rule kernels (both operands already normalized) ----------

Dual add_k(const Dual& a, const Dual& b) {
  Dual out(a.value() + b.value(), a.derivative() + b.derivative());
  FAD_TRACE_OP("add", a, b, out);
  return out;
}

Dual sub_k(const Dual& a, const Dual& b) {
  Dual out(a.value() - b.value(), a.derivative() - b.derivative());
  FAD_TRACE_OP("sub", a, b, out);
  return out;
}

Dual mul_k(const Dual& a, const Dual& b) {
  // product rule
  Dual out(a.value() * b.value(),
           a.derivative() * b.value() + a.value() * b.derivative());
  FAD_TRACE_OP("mul", a, b, out);
  return out;
}

Dual div_k(const Dual& a, const Dual& b) {
  const double vb = b.value();
  if (vb == 0.0) throw DivisionByZero("div");
  // quotient rule
  Dual out(a.value() / vb,
           (a.derivative() * vb - a.value() * b.derivative()) / (vb * vb));
  FAD_TRACE_OP("div", a, b, out);
  return out;
}

Dual neg_k(const Dual& x) {
  Dual out(-x.value(), -x.derivative());
  FAD_TRACE_OP("neg", x, out);
  return out;
}

bool is_integer(double p) { return std::isfinite(p) && std::floor(p) == p; }

double pow_value(double base, double p) {
  // 0^p with p < 0 is 1 / 0^|p|
  if (base == 0.0 && p < 0.0) throw DivisionByZero("pow");
  if (base < 0.0 && !is_integer(p))
    throw DomainError("pow: negative base " + num(base) + " with non-integer exponent " + num(p));
  return std::pow(base, p);
}

// d(a^p) = p * a^(p-1) * da for constant p
Dual pow_const_k(const Dual& a, double p) {
  const double y = pow_value(a.value(), p);
  const double da = a.derivative();
  const double dy = (da == 0.0 || p == 0.0) ? 0.0 : p * std::pow(a.value(), p - 1.0) * da;
  Dual out(y, dy);
  FAD_TRACE_OP("pow", a, Dual(p, 0.0), out);
  return out;
}

// a^b = exp(b ln a)
Dual pow_general_k(const Dual& a, const Dual& b) {
  const double va = a.value();
  if (va <= 0.0)
    throw DomainError("pow: base must be positive for a differentiable exponent, got " + num(va));
  const double y = std::pow(va, b.value());
  Dual out(y, y * (b.derivative() * std::log(va) + b.value() * a.derivative() / va));
  FAD_TRACE_OP("pow", a, b, out);
  return out;
}

Dual pow_k(const Dual& a, const Dual& b) {
  if (b.derivative() == 0.0) return pow_const_k(a, b.value());
  return pow_general_k(a, b);
}

// ---------- dispatch over operand kinds ----------

template <class PlainFn, class DualFn>
Operand binary(const Operand& a, const Operand& b, PlainFn plain, DualFn dual) {
  if (a.is_plain() && b.is_plain()) return Operand(plain(a.value(), b.value()));
  return Operand(dual(a.as_dual(), b.as_dual()));
}

} // anon

Operand add(const Operand& a, const Operand& b) {
  return binary(a, b, [](double x, double y) { return x + y; }, add_k);
}

Operand sub(const Operand& a, const Operand& b) {
  return binary(a, b, [](double x, double y) { return x - y; }, sub_k);
}

Operand mul(const Operand& a, const Operand& b) {
  return binary(a, b, [](double x, double y) { return x * y; }, mul_k);
}

Operand div(const Operand& a, const Operand& b) {
  return binary(a, b,
                [](double x, double y) {
                  if (y == 0.0) throw DivisionByZero("div");
                  return x / y;
                },
                div_k);
}

Operand neg(const Operand& x) {
  if (x.is_plain()) return Operand(-x.value());
  return Operand(neg_k(x.as_dual()));
}

Operand pow(const Operand& base, const Operand& exponent) {
  return binary(base, exponent, pow_value, pow_k);
}

// ---------- operators ----------

Dual operator+(const Dual& a, const Dual& b) { return add_k(a, b); }
Dual operator+(const Dual& a, double b)      { return add_k(a, Dual(b)); }
Dual operator+(double a, const Dual& b)      { return add_k(Dual(a), b); }

Dual operator-(const Dual& a, const Dual& b) { return sub_k(a, b); }
Dual operator-(const Dual& a, double b)      { return sub_k(a, Dual(b)); }
Dual operator-(double a, const Dual& b)      { return sub_k(Dual(a), b); }

Dual operator*(const Dual& a, const Dual& b) { return mul_k(a, b); }
Dual operator*(const Dual& a, double b)      { return mul_k(a, Dual(b)); }
Dual operator*(double a, const Dual& b)      { return mul_k(Dual(a), b); }

Dual operator/(const Dual& a, const Dual& b) { return div_k(a, b); }
Dual operator/(const Dual& a, double b)      { return div_k(a, Dual(b)); }
Dual operator/(double a, const Dual& b)      { return div_k(Dual(a), b); }

Dual operator-(const Dual& x) { return neg_k(x); }
Dual operator+(const Dual& x) { return x; }

Dual pow(const Dual& base, const Dual& exponent) { return pow_k(base, exponent); }
Dual pow(const Dual& base, double exponent)      { return pow_const_k(base, exponent); }

Dual pow(double base, const Dual& exponent) {
  // n^b: derivative n^b * ln(n) * db; ln only needed when db != 0
  const double db = exponent.derivative();
  if (db == 0.0) {
    Dual out(pow_value(base, exponent.value()), 0.0);
    FAD_TRACE_OP("pow", Dual(base, 0.0), exponent, out);
    return out;
  }
  if (base <= 0.0)
    throw DomainError("pow: base must be positive for a differentiable exponent, got " + num(base));
  const double y = std::pow(base, exponent.value());
  Dual out(y, y * std::log(base) * db);
  FAD_TRACE_OP("pow", Dual(base, 0.0), exponent, out);
  return out;
}

} // namespace fad
