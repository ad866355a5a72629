#include "lanczos.hpp"

#include "../log/log.hpp"
#include "common.hpp"
#include "iter.hpp"

#include <Eigen/Eigenvalues>
#include <limits>
#include <random>

namespace pn {

namespace {
// Fixed seed so repeated runs on the same operator give identical estimates
auto StartVector(Index const n) -> Lanczos::Vector
{
  std::mt19937                    gen(1729);
  std::normal_distribution<float> dist;
  Lanczos::Vector                 v(n);
  for (Index ii = 0; ii < n; ii++) {
    v[ii] = Cx(dist(gen), dist(gen));
  }
  return v;
}
} // namespace

auto Lanczos::run() const -> LanczosReturn { return run(StartVector(A->cols())); }

auto Lanczos::run(Vector const &v0) const -> LanczosReturn
{
  Index const n = A->cols();
  if (n < 1) { throw Log::InvalidInputError("Lanczos", "Operator has no columns"); }
  if (A->rows() != n) { throw Log::DimensionMismatchError("Lanczos", "Operator must be square, had [{},{}]", A->rows(), n); }
  if (v0.rows() != n) { throw Log::DimensionMismatchError("Lanczos", "Start vector had size {} expected {}", v0.rows(), n); }
  if (opts.kmax < 1 || opts.restarts < 1) {
    throw Log::InvalidInputError("Lanczos", "Requires at least 1 vector and 1 cycle, had kmax {} restarts {}", opts.kmax,
                                 opts.restarts);
  }
  if (!(opts.tol > 0.f)) { throw Log::InvalidInputError("Lanczos", "Tolerance must be positive, was {}", opts.tol); }

  Index const k = std::min(opts.kmax, n);
  float const ε = std::numeric_limits<float>::epsilon();
  Log::Print("Lanczos", "Smallest eigenpair of [{},{}] basis {} max cycles {} tol {}", n, n, k, opts.restarts, opts.tol);

  Eigen::MatrixXcf Q(n, k);
  Eigen::VectorXf  α(k), β(k);
  Vector           v = v0, w(n), q(n), r(n);
  float            θ = 0.f, θmax = 0.f, res = std::numeric_limits<float>::infinity();
  Index            applications = 0;

  float const normv = ParallelNorm(v);
  if (!(normv > 0.f) || !std::isfinite(normv)) { throw Log::InvalidInputError("Lanczos", "Start vector norm was {}", normv); }
  v /= normv;

  Iterating::Scope const scope;
  Log::Print("Lanczos", "IT  θ          |Av - θv|  Tol");
  for (Index ic = 0; ic < opts.restarts; ic++) {
    Q.col(0) = v;
    Index nk = 0;
    bool  invariant = false;
    for (Index ij = 0; ij < k; ij++) {
      q = Q.col(ij);
      A->forward(q, w);
      applications++;
      // The operator is self-adjoint so the Rayleigh quotient is real, drop the rounding noise
      α[ij] = ParallelDot(q, w).real();
      w -= α[ij] * q;
      if (ij > 0) { w -= β[ij - 1] * Q.col(ij - 1); }
      // Full re-orthogonalization, twice is enough
      for (Index ip = 0; ip < 2; ip++) {
        Eigen::VectorXcf const h = Q.leftCols(ij + 1).adjoint() * w;
        w -= Q.leftCols(ij + 1) * h;
      }
      β[ij] = ParallelNorm(w);
      nk = ij + 1;
      float const scale = std::max(θmax, α.head(nk).cwiseAbs().maxCoeff() + β.head(nk).maxCoeff());
      Log::Debug("Lanczos", "Cycle {} vector {} α {} β {}", ic, ij, α[ij], β[ij]);
      if (β[ij] <= ε * scale || β[ij] == 0.f) {
        invariant = true;
        break;
      }
      if (ij + 1 < k) { Q.col(ij + 1) = w / β[ij]; }
    }

    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXf> eig;
    Eigen::VectorXf const                          diag = α.head(nk);
    Eigen::VectorXf const                          subdiag = β.head(nk - 1);
    eig.computeFromTridiagonal(diag, subdiag, Eigen::ComputeEigenvectors);
    if (eig.info() != Eigen::Success) {
      throw Log::ConvergenceError("Lanczos", "Tridiagonal eigensolver failed in cycle {}", ic);
    }
    θ = eig.eigenvalues()[0];
    θmax = std::max(θmax, eig.eigenvalues().cwiseAbs().maxCoeff());
    v = Q.leftCols(nk) * eig.eigenvectors().col(0).cast<Cx>();
    v /= ParallelNorm(v);

    A->forward(v, r);
    applications++;
    r -= θ * v;
    res = ParallelNorm(r);
    float const thresh = opts.tol * std::max(θmax, std::numeric_limits<float>::min());
    Log::Print("Lanczos", "{:02d}  {:4.3E} {:4.3E} {:4.3E}", ic, θ, res, thresh);
    if (res <= thresh) {
      Log::Print("Lanczos", "Converged after {} cycles, {} operator applications", ic + 1, applications);
      return {θ, v, res, applications};
    }
    if (invariant) {
      // The Krylov space is invariant so the Ritz pair is exact, the residual is rounding error
      Log::Print("Lanczos", "Invariant subspace of dimension {} found, residual {:4.3E}", nk, res);
      return {θ, v, res, applications};
    }
    if (Iterating::ShouldStop("Lanczos")) {
      throw Log::ConvergenceError("Lanczos", "Interrupted after {} cycles, residual {:4.3E} > {:4.3E}", ic + 1, res, thresh);
    }
  }
  throw Log::ConvergenceError("Lanczos", "Did not converge in {} cycles of {} vectors, residual {:4.3E} tolerance {:4.3E}",
                              opts.restarts, k, res, opts.tol * θmax);
}

} // namespace pn
