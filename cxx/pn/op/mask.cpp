#include "mask.hpp"

namespace pn::Ops {

Mask::Mask(ReVector const &keep)
  : Op("Mask")
  , n{keep.rows()}
{
  for (Index ii = 0; ii < n; ii++) {
    if (keep[ii] > 0.f) { kept.push_back(ii); }
  }
  Log::Debug(name, "Keeping {} of {} entries", kept.size(), n);
}

auto Mask::Make(ReVector const &keep) -> Ptr { return std::make_shared<Mask>(keep); }
auto Mask::rows() const -> Index { return static_cast<Index>(kept.size()); }
auto Mask::cols() const -> Index { return n; }

void Mask::forward(CMap x, Map y) const
{
  auto const t = begin("Forward", x, cols(), y, rows());
  for (size_t ii = 0; ii < kept.size(); ii++) {
    y[ii] = x[kept[ii]];
  }
  end("Forward", y, t);
}

void Mask::adjoint(CMap y, Map x) const
{
  auto const t = begin("Adjoint", y, rows(), x, cols());
  x.setZero();
  for (size_t ii = 0; ii < kept.size(); ii++) {
    x[kept[ii]] = y[ii];
  }
  end("Adjoint", x, t);
}

} // namespace pn::Ops
