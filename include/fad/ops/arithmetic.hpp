#pragma once
#include "fad/core/dual.hpp"
#include "fad/core/operand.hpp"

namespace fad {

// Named operations over any operand-kind pair. Plain (x) Plain stays plain;
// every other combination normalizes plain numbers to (n, 0) and applies the
// chain rule. div throws DivisionByZero on a zero divisor value.
Operand add(const Operand& a, const Operand& b);
Operand sub(const Operand& a, const Operand& b);
Operand mul(const Operand& a, const Operand& b);
Operand div(const Operand& a, const Operand& b);
Operand neg(const Operand& x);

// a^b. Exponents that are plain, or Duals with zero derivative, take the
// constant-exponent rule p*a^(p-1)*da. Otherwise a^b*(db*ln a + b*da/a),
// which throws DomainError for a <= 0.
Operand pow(const Operand& base, const Operand& exponent);

// Native operators: Dual (x) Dual, Dual (x) plain, plain (x) Dual.
Dual operator+(const Dual& a, const Dual& b);
Dual operator+(const Dual& a, double b);
Dual operator+(double a, const Dual& b);

Dual operator-(const Dual& a, const Dual& b);
Dual operator-(const Dual& a, double b);
Dual operator-(double a, const Dual& b);

Dual operator*(const Dual& a, const Dual& b);
Dual operator*(const Dual& a, double b);
Dual operator*(double a, const Dual& b);

Dual operator/(const Dual& a, const Dual& b);
Dual operator/(const Dual& a, double b);
Dual operator/(double a, const Dual& b);

Dual operator-(const Dual& x);
Dual operator+(const Dual& x);

Dual pow(const Dual& base, const Dual& exponent);
Dual pow(const Dual& base, double exponent);
Dual pow(double base, const Dual& exponent);

} // namespace fad
