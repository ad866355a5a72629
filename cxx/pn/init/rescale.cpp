#include "rescale.hpp"

#include "../log/log.hpp"

#include <limits>

namespace pn {

auto RescaleFactor(Ops::Op::Ptr A, ReVector const &I, ReVector const &b0, CxVector const &x) -> float
{
  if (I.rows() != A->rows() || b0.rows() != A->rows()) {
    throw Log::DimensionMismatchError("Scale", "Mask {} and measurements {} must match operator rows {}", I.rows(), b0.rows(),
                                      A->rows());
  }
  ReVector const held = 1.f - I;
  ReVector const b = held * b0;
  ReVector const Ax = (held * A->forward(x).array().abs()).eval();

  // Accumulate in double, the denominator is a sum of squares that can underflow in float
  double const num = (Ax.cast<double>() * b.cast<double>()).sum();
  double const den = Ax.cast<double>().square().sum();
  if (!(den > std::numeric_limits<float>::min()) || !std::isfinite(den)) {
    throw Log::DegenerateScaleError("Scale", "Model magnitudes on the held-out measurements are zero (|Ax|² = {}), cannot fit scale",
                                    den);
  }
  if (!(b.maxCoeff() > 0.f)) {
    throw Log::DegenerateScaleError("Scale", "Held-out measurements are all zero, the scale of the estimate is undetermined");
  }
  float const s = num / den;
  Log::Debug("Scale", "Held-out {} measurements aᵀb {} aᵀa {} scale {}", (held > 0.f).count(), num, den, s);
  return s;
}

} // namespace pn
