#include "fad/core/operand.hpp"
#include "fad/core/config.hpp"
#include "fad/core/errors.hpp"

#include <sstream>

namespace fad {

const char* kind_name(OperandKind k) {
  switch (k) {
    case OperandKind::Dual:  return "Dual";
    case OperandKind::Plain: return "plain";
  }
  return "unknown";
}

double Operand::value() const {
  if (const Dual* d = std::get_if<Dual>(&v_)) return d->value();
  return std::get<double>(v_);
}

double Operand::derivative() const {
  if (const Dual* d = std::get_if<Dual>(&v_)) return d->derivative();
  return 0.0;
}

Dual Operand::as_dual() const {
  if (const Dual* d = std::get_if<Dual>(&v_)) return *d;
  return Dual(std::get<double>(v_), 0.0);
}

std::string to_string(const Operand& x) {
  if (x.is_dual()) return to_string(x.as_dual());
  std::ostringstream oss;
  oss.precision(config::print_precision());
  oss << x.value();
  return oss.str();
}

Operand resolve_operand(const std::optional<Dual>& dual, const std::optional<double>& number,
                        const std::string& type_name) {
  if (dual) return Operand(*dual);
  if (number) return Operand(*number);
  throw UnsupportedOperand(type_name);
}

} // namespace fad
