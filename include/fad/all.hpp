#pragma once
// Umbrella header for callers (tests, examples, bindings).

// Core
#include "fad/core/config.hpp"
#include "fad/core/dual.hpp"
#include "fad/core/errors.hpp"
#include "fad/core/operand.hpp"

// Ops
#include "fad/ops/arithmetic.hpp"
#include "fad/ops/compare.hpp"
#include "fad/ops/elementary.hpp"

// End of umbrella
