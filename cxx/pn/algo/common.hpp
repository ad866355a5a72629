#pragma once

#include "../log/log.hpp"
#include "../sys/threads.hpp"
#include "../types.hpp"

#include <algorithm>

namespace pn {

/*
 * Splits [0, sz) into nC contiguous chunks and calls f(chunk, start, size) for each on the global pool. A single chunk
 * runs on the calling thread. f must not throw.
 */
template <typename F> void ForChunks(Index const sz, Index const nC, F &&f)
{
  if (nC < 2) {
    f(Index(0), Index(0), sz);
    return;
  }
  Index const    den = sz / nC;
  Index const    rem = sz % nC;
  Eigen::Barrier barrier(static_cast<unsigned int>(nC));
  for (Index ic = 0; ic < nC; ic++) {
    Index const st = ic * den + std::min(ic, rem);
    Index const n = den + (ic < rem ? 1 : 0);
    Threads::GlobalPool()->Schedule([&f, &barrier, ic, st, n] {
      f(ic, st, n);
      barrier.Notify();
    });
  }
  barrier.Wait();
}

// Signals are short, only split long vectors
inline auto ReductionChunks(Index const sz) -> Index { return std::clamp<Index>(sz / 4096, 1, Threads::GlobalThreadCount()); }

// Pairwise summation keeps the rounding error of long dot products at O(log n)
template <typename Derived>
auto PairwiseDot(Eigen::MatrixBase<Derived> const &x1, Eigen::MatrixBase<Derived> const &x2, Index const st, Index const sz) ->
  typename Derived::Scalar
{
  if (sz < 128) { return x1.segment(st, sz).dot(x2.segment(st, sz)); }
  Index const half = sz / 2;
  return PairwiseDot(x1, x2, st, half) + PairwiseDot(x1, x2, st + half, sz - half);
}

/*
 * Conjugates the first argument, as Eigen does
 */
template <typename Derived>
auto ParallelDot(Eigen::MatrixBase<Derived> const &x1, Eigen::MatrixBase<Derived> const &x2) -> typename Derived::Scalar
{
  if (x1.size() != x2.size()) {
    throw Log::DimensionMismatchError("Algo", "Dot product vectors had size {} and {}", x1.size(), x2.size());
  }
  Index const                                             nC = ReductionChunks(x1.size());
  Eigen::Matrix<typename Derived::Scalar, Eigen::Dynamic, 1> partial(nC);
  ForChunks(x1.size(), nC, [&](Index const ic, Index const st, Index const n) { partial[ic] = PairwiseDot(x1, x2, st, n); });
  return partial.sum();
}

template <typename Derived> auto ParallelNorm(Eigen::MatrixBase<Derived> const &x) -> typename Derived::RealScalar
{
  Index const                                                 nC = ReductionChunks(x.size());
  Eigen::Matrix<typename Derived::RealScalar, Eigen::Dynamic, 1> partial(nC);
  ForChunks(x.size(), nC, [&](Index const ic, Index const st, Index const n) { partial[ic] = x.segment(st, n).stableNorm(); });
  return partial.norm();
}

} // namespace pn
