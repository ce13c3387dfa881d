#pragma once
#include <stdexcept>
#include <string>

namespace fad {

// Base for every failure raised while propagating a value/derivative pair.
class Error : public std::runtime_error {
public:
  explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// Divisor value is exactly zero.
class DivisionByZero : public Error {
public:
  explicit DivisionByZero(const std::string& op)
    : Error(op + ": division by zero") {}
};

// Argument outside the real domain of the operation (log of x <= 0, ...).
class DomainError : public Error {
public:
  explicit DomainError(const std::string& msg) : Error(msg) {}
};

// Operand is neither a Dual nor a plain number. Only reachable where kinds
// are resolved at run time (Python module); C++ callers get a compile error.
class UnsupportedOperand : public Error {
public:
  explicit UnsupportedOperand(const std::string& kind)
    : Error("unsupported operand kind: " + kind) {}
};

} // namespace fad
