#pragma once

#include "op.hpp"

#include <vector>

namespace pn::Ops {

//! Extracts the entries where keep > 0, so Mask' * Mask = diag(keep)
struct Mask final : Op
{
  OP_INHERIT
  Mask(ReVector const &keep);
  static auto Make(ReVector const &keep) -> Ptr;
  void        forward(CMap x, Map y) const;
  void        adjoint(CMap y, Map x) const;

private:
  std::vector<Index> kept;
  Index              n;
};

} // namespace pn::Ops
