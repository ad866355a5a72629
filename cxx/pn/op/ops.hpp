#pragma once

#include "op.hpp"

#include <functional>

namespace pn::Ops {

//! Dense sensing matrix, adjoint is the conjugate transpose
struct MatMul final : Op
{
  OP_INHERIT
  MatMul(CxMatrix const &m);
  static auto Make(CxMatrix const &m) -> Ptr;
  void        forward(CMap x, Map y) const;
  void        adjoint(CMap y, Map x) const;

private:
  CxMatrix mat;
};

/*
 * Wraps a pair of caller-supplied callables. The sizes cannot be inferred, so they must be given. Each result is
 * checked against the declared size.
 */
struct Functor final : Op
{
  OP_INHERIT
  using Func = std::function<Vector(Vector const &)>;
  Functor(Func fwd, Func adj, Index const rows, Index const cols);
  static auto Make(Func fwd, Func adj, Index const rows, Index const cols) -> Ptr;
  void        forward(CMap x, Map y) const;
  void        adjoint(CMap y, Map x) const;

private:
  Func  fwd, adj;
  Index r, c;
};

//! y = A * B * x
struct Multiply final : Op
{
  OP_INHERIT
  Multiply(Ptr A, Ptr B);
  void forward(CMap x, Map y) const;
  void adjoint(CMap y, Map x) const;

private:
  Ptr            A, B;
  Vector mutable temp; // Not safe to apply from two threads at once
};

auto Mul(Op::Ptr a, Op::Ptr b) -> Op::Ptr;

//! Swaps forward and adjoint of another operator
struct Adjoint final : Op
{
  OP_INHERIT
  Adjoint(Ptr op);
  static auto Make(Ptr op) -> Ptr;
  void        forward(CMap x, Map y) const;
  void        adjoint(CMap y, Map x) const;

private:
  Ptr op;
};

// A' * A, self-adjoint and positive semi-definite
auto Gram(Op::Ptr a) -> Op::Ptr;

} // namespace pn::Ops
