#pragma once
#include <iosfwd>
#include <string>

namespace fad {

// -----------------------------
// Dual (user-facing value type)
// -----------------------------
// A primal value paired with its derivative along the direction of every
// active seed. Never mutated after construction: operations return new Duals.
class Dual {
public:
  Dual() = default;
  Dual(double value, double derivative = 0.0) : v_(value), d_(derivative) {}

  double value() const { return v_; }
  double derivative() const { return d_; }

  // True when the derivative slot carries a seed or a propagated sensitivity.
  bool is_active() const { return d_ != 0.0; }

  // Compound forms rebind *this to the result of the binary operator.
  Dual& operator+=(const Dual& o);
  Dual& operator-=(const Dual& o);
  Dual& operator*=(const Dual& o);
  Dual& operator/=(const Dual& o);

private:
  double v_ = 0.0;
  double d_ = 0.0;
};

// -----------------------------
// Factory helpers
// -----------------------------
// Active independent variable: derivative seeded with 1.
Dual variable(double v);
// Inactive input: behaves exactly like the plain number v.
Dual constant(double v);

// Dual(value=<v>, derivative=<d>) with config::print_precision() digits.
std::ostream& operator<<(std::ostream& os, const Dual& x);

// Two-line report: "<f> = <v>" then "d<f>/d<wrt> = <d>".
void report(std::ostream& os, const Dual& x,
            const std::string& f = "f", const std::string& wrt = "x");

std::string to_string(const Dual& x);

} // namespace fad
