#pragma once

#include "../op/op.hpp"

namespace pn {

/*
 * Least-squares magnitude fit on the held-out measurements. With b = (1 - I) ⊙ b0 and a = |(1 - I) ⊙ Ax|, returns the
 * s minimizing |s a - b|, i.e. s = aᵀb / aᵀa. Throws DegenerateScaleError if aᵀa is numerically zero or
 * every held-out measurement is zero.
 */
auto RescaleFactor(Ops::Op::Ptr A, ReVector const &I, ReVector const &b0, CxVector const &x) -> float;

} // namespace pn
