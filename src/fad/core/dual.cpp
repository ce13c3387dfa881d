#include "fad/core/dual.hpp"
#include "fad/core/config.hpp"
#include "fad/ops/arithmetic.hpp"

#include <ios>
#include <ostream>
#include <sstream>

namespace fad {

Dual& Dual::operator+=(const Dual& o) { return *this = *this + o; }
Dual& Dual::operator-=(const Dual& o) { return *this = *this - o; }
Dual& Dual::operator*=(const Dual& o) { return *this = *this * o; }
Dual& Dual::operator/=(const Dual& o) { return *this = *this / o; }

Dual variable(double v) { return Dual(v, 1.0); }
Dual constant(double v) { return Dual(v, 0.0); }

std::ostream& operator<<(std::ostream& os, const Dual& x) {
  const auto old_prec = os.precision(config::print_precision());
  os << "Dual(value=" << x.value() << ", derivative=" << x.derivative() << ")";
  os.precision(old_prec);
  return os;
}

void report(std::ostream& os, const Dual& x, const std::string& f, const std::string& wrt) {
  const auto old_prec = os.precision(config::print_precision());
  os << f << " = " << x.value() << "\n"
     << "d" << f << "/d" << wrt << " = " << x.derivative() << "\n";
  os.precision(old_prec);
}

std::string to_string(const Dual& x) {
  std::ostringstream oss;
  oss << x;
  return oss.str();
}

} // namespace fad
