#include "ops.hpp"

namespace pn::Ops {

MatMul::MatMul(CxMatrix const &m)
  : Op("MatMul")
  , mat{m}
{
}

auto MatMul::Make(CxMatrix const &m) -> Ptr { return std::make_shared<MatMul>(m); }
auto MatMul::rows() const -> Index { return mat.rows(); }
auto MatMul::cols() const -> Index { return mat.cols(); }

void MatMul::forward(CMap x, Map y) const
{
  auto const t = begin("Forward", x, cols(), y, rows());
  y.noalias() = mat * x;
  end("Forward", y, t);
}

void MatMul::adjoint(CMap y, Map x) const
{
  auto const t = begin("Adjoint", y, rows(), x, cols());
  x.noalias() = mat.adjoint() * y;
  end("Adjoint", x, t);
}

Functor::Functor(Func f, Func a, Index const rr, Index const cc)
  : Op("Functor")
  , fwd{std::move(f)}
  , adj{std::move(a)}
  , r{rr}
  , c{cc}
{
  if (!fwd) { throw Log::InvalidInputError(name, "A forward function is required"); }
  if (!adj) { throw Log::InvalidInputError(name, "An adjoint function is required when the operator is not a matrix"); }
  if (r < 1 || c < 1) { throw Log::InvalidInputError(name, "Sizes must be given explicitly, had rows {} cols {}", r, c); }
}

auto Functor::Make(Func f, Func a, Index const rr, Index const cc) -> Ptr { return std::make_shared<Functor>(f, a, rr, cc); }
auto Functor::rows() const -> Index { return r; }
auto Functor::cols() const -> Index { return c; }

void Functor::forward(CMap x, Map y) const
{
  auto const   t = begin("Forward", x, c, y, r);
  Vector const result = fwd(Vector(x));
  if (result.rows() != r) { throw Log::DimensionMismatchError(name, "Forward function returned {} values, expected {}", result.rows(), r); }
  y = result;
  end("Forward", y, t);
}

void Functor::adjoint(CMap y, Map x) const
{
  auto const   t = begin("Adjoint", y, r, x, c);
  Vector const result = adj(Vector(y));
  if (result.rows() != c) { throw Log::DimensionMismatchError(name, "Adjoint function returned {} values, expected {}", result.rows(), c); }
  x = result;
  end("Adjoint", x, t);
}

Multiply::Multiply(Ptr AA, Ptr BB)
  : Op("Multiply")
  , A{AA}
  , B{BB}
{
  if (A->cols() != B->rows()) {
    throw Log::DimensionMismatchError(name, "Cannot compose [{},{}] with [{},{}]", A->rows(), A->cols(), B->rows(), B->cols());
  }
  temp.resize(B->rows());
}

auto Multiply::rows() const -> Index { return A->rows(); }
auto Multiply::cols() const -> Index { return B->cols(); }

void Multiply::forward(CMap x, Map y) const
{
  B->forward(x, Map(temp.data(), temp.rows()));
  A->forward(CMap(temp.data(), temp.rows()), y);
}

void Multiply::adjoint(CMap y, Map x) const
{
  A->adjoint(y, Map(temp.data(), temp.rows()));
  B->adjoint(CMap(temp.data(), temp.rows()), x);
}

auto Mul(Op::Ptr a, Op::Ptr b) -> Op::Ptr { return std::make_shared<Multiply>(a, b); }

Adjoint::Adjoint(Ptr o)
  : Op("Adjoint")
  , op{o}
{
}

auto Adjoint::Make(Ptr o) -> Ptr { return std::make_shared<Adjoint>(o); }
auto Adjoint::rows() const -> Index { return op->cols(); }
auto Adjoint::cols() const -> Index { return op->rows(); }

void Adjoint::forward(CMap x, Map y) const { op->adjoint(x, y); }
void Adjoint::adjoint(CMap y, Map x) const { op->forward(y, x); }

auto Gram(Op::Ptr a) -> Op::Ptr { return Mul(Adjoint::Make(a), a); }

} // namespace pn::Ops
