#pragma once
#include "fad/core/dual.hpp"
#include "fad/core/operand.hpp"

namespace fad {

// Each function comes in three shapes: Dual in -> Dual out (chain rule with
// the classical derivative at value()), plain in -> plain out (std:: result),
// and Operand in -> Operand of the same kind.
Dual sin(const Dual& x);
Dual cos(const Dual& x);
Dual tan(const Dual& x);
Dual exp(const Dual& x);
Dual log(const Dual& x);   // DomainError for value() <= 0
Dual sqrt(const Dual& x);  // DomainError for value() < 0
Dual abs(const Dual& x);

double sin(double x);
double cos(double x);
double tan(double x);
double exp(double x);
double log(double x);
double sqrt(double x);
double abs(double x);

Operand sin(const Operand& x);
Operand cos(const Operand& x);
Operand tan(const Operand& x);
Operand exp(const Operand& x);
Operand log(const Operand& x);
Operand sqrt(const Operand& x);
Operand abs(const Operand& x);

} // namespace fad
