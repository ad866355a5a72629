#pragma once

#include "../types.hpp"

namespace pn {

/*
 * Select the measurements believed to be nearly orthogonal to the signal. The round(m * γ) largest magnitudes are
 * marked 0, the remaining m - round(m * γ) are marked 1. Ties are broken by a stable descending sort, so among equal
 * magnitudes the earlier index counts as larger.
 */
auto SmallMask(ReVector const &b0, float const γ = 0.5f) -> ReVector;

} // namespace pn
