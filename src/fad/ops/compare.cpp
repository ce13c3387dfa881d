#include "fad/ops/compare.hpp"

namespace fad {

#define FAD_GEN_CMP(OP) \
bool operator OP(const Dual& a, const Dual& b) { return a.value() OP b.value(); } \
bool operator OP(const Dual& a, double b)      { return a.value() OP b; } \
bool operator OP(double a, const Dual& b)      { return a OP b.value(); }

FAD_GEN_CMP(<)
FAD_GEN_CMP(<=)
FAD_GEN_CMP(>)
FAD_GEN_CMP(>=)
FAD_GEN_CMP(==)
FAD_GEN_CMP(!=)
#undef FAD_GEN_CMP

} // namespace fad
