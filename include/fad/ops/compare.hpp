#pragma once
#include "fad/core/dual.hpp"

namespace fad {

// Relational operators look at value() only; derivatives never take part.
// Plain numbers compare directly against value().
bool operator< (const Dual& a, const Dual& b);
bool operator< (const Dual& a, double b);
bool operator< (double a, const Dual& b);

bool operator<=(const Dual& a, const Dual& b);
bool operator<=(const Dual& a, double b);
bool operator<=(double a, const Dual& b);

bool operator> (const Dual& a, const Dual& b);
bool operator> (const Dual& a, double b);
bool operator> (double a, const Dual& b);

bool operator>=(const Dual& a, const Dual& b);
bool operator>=(const Dual& a, double b);
bool operator>=(double a, const Dual& b);

bool operator==(const Dual& a, const Dual& b);
bool operator==(const Dual& a, double b);
bool operator==(double a, const Dual& b);

bool operator!=(const Dual& a, const Dual& b);
bool operator!=(const Dual& a, double b);
bool operator!=(double a, const Dual& b);

} // namespace fad
