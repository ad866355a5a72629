#include "null.hpp"

#include "../algo/common.hpp"
#include "../log/log.hpp"
#include "../op/mask.hpp"
#include "mask.hpp"
#include "rescale.hpp"

namespace pn {

namespace {
// Rotate the global phase so the largest coefficient is real and positive. |Ax| and x'Yx are unchanged.
void AlignPhase(CxVector &x)
{
  Index       imax = 0;
  float const amax = x.cwiseAbs().maxCoeff(&imax);
  if (amax > 0.f) { x *= std::conj(x[imax]) / amax; }
}
} // namespace

auto NullInit::run(ReVector const &b0) const -> Vector
{
  Index const m = b0.rows();
  Index const n = A->cols();
  if (m != A->rows()) {
    throw Log::DimensionMismatchError("Null", "Operator has {} rows but {} measurements were supplied", A->rows(), m);
  }
  if (opts.verbose) { Log::Print("Null", "Estimating signal of length {} using a null initializer with {} measurements", n, m); }
  auto const t0 = Log::Now();

  ReVector const I = SmallMask(b0, opts.γ);
  Index const    kept = (I > 0.f).count();
  if (kept < n) { Log::Warn("Null", "Only {} measurements kept for {} unknowns, the estimate is not unique", kept, n); }
  auto const     Y = Ops::Gram(Ops::Mul(Ops::Mask::Make(I), A));
  Lanczos const  lanczos{Y, opts.lanczos};
  auto const     eig = lanczos.run();
  Vector         x0 = eig.vec;
  AlignPhase(x0);
  if (opts.verbose) { Log::Print("Null", "Smallest eigenvalue {:4.3E} residual {:4.3E}", eig.val, eig.residual); }

  if (opts.scale) {
    float const s = RescaleFactor(A, I, b0, x0);
    x0 *= s;
    if (opts.verbose) { Log::Print("Null", "Scale {:4.3E} |x0| {:4.3E}", s, ParallelNorm(x0)); }
  }
  if (opts.verbose) { Log::Print("Null", "Initialization finished in {}", Log::ToNow(t0)); }
  return x0;
}

auto NullInitialize(Ops::Op::Ptr A, ReVector const &b0, NullInit::Opts const &opts) -> CxVector
{
  if (!A) { throw Log::InvalidInputError("Null", "No sensing operator supplied"); }
  NullInit const init{A, opts};
  return init.run(b0);
}

auto NullInitialize(CxMatrix const &A, ReVector const &b0, NullInit::Opts const &opts) -> CxVector
{
  if (A.rows() < 1 || A.cols() < 1) { throw Log::InvalidInputError("Null", "Sensing matrix was empty [{},{}]", A.rows(), A.cols()); }
  return NullInitialize(Ops::MatMul::Make(A), b0, opts);
}

auto NullInitialize(ReMatrix const &A, ReVector const &b0, NullInit::Opts const &opts) -> CxVector
{
  return NullInitialize(CxMatrix(A.cast<Cx>()), b0, opts);
}

auto NullInitialize(Ops::Functor::Func fwd, Ops::Functor::Func adj, ReVector const &b0, Index const n, NullInit::Opts const &opts)
  -> CxVector
{
  return NullInitialize(Ops::Functor::Make(fwd, adj, b0.rows(), n), b0, opts);
}

} // namespace pn
