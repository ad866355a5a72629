#pragma once

#include "../op/ops.hpp"

namespace pn {

struct LanczosReturn
{
  float            val;
  Eigen::VectorXcf vec;
  float            residual;
  Index            applications;
};

/*
 * Restarted Lanczos with full re-orthogonalization for the smallest eigenpair of a self-adjoint operator.
 * Each cycle builds a Krylov basis of at most kmax vectors from the current estimate, then restarts from the
 * Ritz vector of the smallest Ritz value. Converged when |Av - θv| <= tol * |A|, with |A| estimated by the
 * largest Ritz value seen so far.
 */
struct Lanczos
{
  using Op = Ops::Op;
  using Vector = typename Op::Vector;

  struct Opts
  {
    Index kmax = 32;
    Index restarts = 16;
    float tol = 1.e-5f;
  };

  Op::Ptr A;
  Opts    opts;

  auto run() const -> LanczosReturn;
  auto run(Vector const &v0) const -> LanczosReturn;
};

} // namespace pn
