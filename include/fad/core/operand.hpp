#pragma once
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "fad/core/dual.hpp"

namespace fad {

enum class OperandKind { Dual, Plain };

const char* kind_name(OperandKind k);

// Tagged sum {Dual, plain number}. Any C++ arithmetic type converts to the
// plain alternative; anything else is rejected at compile time.
class Operand {
public:
  Operand(const Dual& d) : v_(d) {}
  template <class T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
  Operand(T n) : v_(static_cast<double>(n)) {}

  OperandKind kind() const {
    return std::holds_alternative<Dual>(v_) ? OperandKind::Dual : OperandKind::Plain;
  }
  bool is_dual() const { return kind() == OperandKind::Dual; }
  bool is_plain() const { return kind() == OperandKind::Plain; }

  // Primal value for either kind.
  double value() const;
  // 0 for plain numbers.
  double derivative() const;
  // Plain n is normalized to (n, 0).
  Dual as_dual() const;

  // Pattern-match on the held alternative: fn(const Dual&) or fn(double).
  template <class Fn>
  decltype(auto) visit(Fn&& fn) const { return std::visit(std::forward<Fn>(fn), v_); }

private:
  std::variant<Dual, double> v_;
};

std::string to_string(const Operand& x);

// Kind resolution for front ends that only know operand types at run time.
// The caller extracts whichever alternative the object converts to; with
// neither present, throws UnsupportedOperand naming type_name.
Operand resolve_operand(const std::optional<Dual>& dual, const std::optional<double>& number,
                        const std::string& type_name);

} // namespace fad
