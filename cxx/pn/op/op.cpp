#include "op.hpp"

#include "../algo/common.hpp"

namespace pn::Ops {

Op::Op(std::string const &n)
  : name{n}
{
}

void Op::forward(Vector const &x, Vector &y) const
{
  if (y.rows() != rows()) { throw Log::DimensionMismatchError(name, "Forward output had {} rows, expected {}", y.rows(), rows()); }
  forward(CMap(x.data(), x.rows()), Map(y.data(), y.rows()));
}

void Op::adjoint(Vector const &y, Vector &x) const
{
  if (x.rows() != cols()) { throw Log::DimensionMismatchError(name, "Adjoint output had {} rows, expected {}", x.rows(), cols()); }
  adjoint(CMap(y.data(), y.rows()), Map(x.data(), x.rows()));
}

auto Op::forward(Vector const &x) const -> Vector
{
  Vector y = Vector::Zero(rows());
  forward(x, y);
  return y;
}

auto Op::adjoint(Vector const &y) const -> Vector
{
  Vector x = Vector::Zero(cols());
  adjoint(y, x);
  return x;
}

auto Op::begin(char const *dir, CMap in, Index const inSz, Map const &out, Index const outSz) const -> Log::Time
{
  if (in.rows() != inSz || out.rows() != outSz) {
    throw Log::DimensionMismatchError(name, "{} [{},{}] applied to {} values into {}", dir, rows(), cols(), in.rows(), out.rows());
  }
  if (Log::IsHigh()) { Log::Debug(name, "{} [{},{}] |in| {}", dir, rows(), cols(), ParallelNorm(in)); }
  return Log::Now();
}

void Op::end(char const *dir, Map const &out, Log::Time const start) const
{
  if (Log::IsHigh()) { Log::Debug(name, "{} finished in {} |out| {}", dir, Log::ToNow(start), ParallelNorm(out)); }
}

} // namespace pn::Ops
