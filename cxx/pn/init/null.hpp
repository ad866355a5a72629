#pragma once

#include "../algo/lanczos.hpp"
#include "../op/ops.hpp"

namespace pn {

/*
 * Null initializer for phase retrieval (Chen, Fannjiang & Liu, Algorithm 1, https://arxiv.org/abs/1510.07379)
 *
 * The measurement vectors belonging to the smallest magnitudes are nearly orthogonal to the signal, so the signal is
 * estimated as the eigenvector of the smallest eigenvalue of Y = A' diag(I) A. The result is then scaled to match
 * the measurements that were left out of Y.
 */
struct NullInit
{
  using Op = Ops::Op;
  using Vector = typename Op::Vector;

  struct Opts
  {
    float          γ = 0.5f;     // Fraction of measurements treated as large and left out of Y
    bool           scale = true; // Fit the magnitude of the estimate to the held-out measurements
    bool           verbose = true;
    Lanczos::Opts  lanczos;
  };

  Op::Ptr A;
  Opts    opts;

  auto run(ReVector const &b0) const -> Vector;
};

auto NullInitialize(Ops::Op::Ptr A, ReVector const &b0, NullInit::Opts const &opts = NullInit::Opts()) -> CxVector;
auto NullInitialize(CxMatrix const &A, ReVector const &b0, NullInit::Opts const &opts = NullInit::Opts()) -> CxVector;
auto NullInitialize(ReMatrix const &A, ReVector const &b0, NullInit::Opts const &opts = NullInit::Opts()) -> CxVector;
auto NullInitialize(Ops::Functor::Func fwd,
                    Ops::Functor::Func adj,
                    ReVector const    &b0,
                    Index const        n,
                    NullInit::Opts const &opts = NullInit::Opts()) -> CxVector;

} // namespace pn
