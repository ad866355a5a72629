#include "mask.hpp"

#include "../log/log.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

namespace pn {

auto SmallMask(ReVector const &b0, float const γ) -> ReVector
{
  if (!(γ > 0.f && γ < 1.f)) { throw Log::InvalidInputError("Mask", "Fraction of large measurements γ {} must be in (0, 1)", γ); }
  Index const m = b0.rows();
  if (m < 1) { throw Log::InvalidInputError("Mask", "No measurements supplied"); }
  if (!b0.allFinite()) { throw Log::InvalidInputError("Mask", "Measurements contain non-finite values"); }
  if ((b0 < 0.f).any()) { throw Log::InvalidInputError("Mask", "Measurements must be non-negative, minimum was {}", b0.minCoeff()); }

  std::vector<Index> idx(m);
  std::iota(idx.begin(), idx.end(), 0);
  std::stable_sort(idx.begin(), idx.end(), [&b0](Index const a, Index const b) { return b0[a] > b0[b]; });

  Index const nLarge = std::lround(static_cast<double>(m) * γ);
  ReVector    I = ReVector::Zero(m);
  for (Index ii = nLarge; ii < m; ii++) {
    I[idx[ii]] = 1.f;
  }
  Log::Debug("Mask", "Kept {} of {} measurements, largest kept magnitude {}", m - nLarge, m,
             nLarge < m ? b0[idx[nLarge]] : 0.f);
  return I;
}

} // namespace pn
