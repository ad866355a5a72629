#include "pn/init/mask.hpp"
#include "pn/init/null.hpp"
#include "pn/init/rescale.hpp"
#include "pn/log/log.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <random>

using namespace pn;
using namespace Catch;

namespace {
auto Gaussian(Index const m, Index const n, std::mt19937 &gen) -> CxMatrix
{
  std::normal_distribution<float> dist;
  CxMatrix                        A(m, n);
  for (Index ic = 0; ic < n; ic++) {
    for (Index ir = 0; ir < m; ir++) {
      A(ir, ic) = Cx(dist(gen), dist(gen)) / std::sqrt(2.f);
    }
  }
  return A;
}

auto Cosine(CxVector const &a, CxVector const &b) -> float { return std::abs(a.dot(b)) / (a.norm() * b.norm()); }

auto Quiet() -> NullInit::Opts { return NullInit::Opts{.verbose = false}; }
} // namespace

TEST_CASE("Null", "[init]")
{
  SECTION("Small")
  {
    CxMatrix A(4, 2);
    A << 1.f, 0.f, 0.f, 1.f, 1.f, 1.f, 1.f, -1.f;
    ReVector b0(4);
    b0 << 1.f, 0.f, 1.f, 1.f;

    // m - round(mγ) = 2, so rows 1 and 3 are kept and Y = [1 -1; -1 2] with smallest eigenvector ∝ [1, (√5 - 1) / 2].
    // Keeping one more row (row 2) would give Y = diag(2, 3) and recover [1, 0] exactly.
    auto const  x = NullInitialize(A, b0, Quiet());
    float const φ = (std::sqrt(5.f) - 1.f) / 2.f;
    REQUIRE(x.rows() == 2);
    CHECK(std::abs(x[0].imag()) == Approx(0.f).margin(1.e-5));
    CHECK(x[0].real() > 0.f);
    CHECK(std::abs(x[1] / x[0] - Cx(φ)) == Approx(0.f).margin(1.e-4));
    // Scaled against the held-out rows 0 and 2
    CHECK(x[0].real() == Approx(0.7236f).margin(1.e-3));
    CHECK(x[1].real() == Approx(0.4472f).margin(1.e-3));

    ReMatrix const Ar = A.real();
    CHECK((NullInitialize(Ar, b0, Quiet()) - x).norm() == Approx(0.f).margin(1.e-5));

    auto opts = Quiet();
    opts.scale = false;
    auto const u = NullInitialize(A, b0, opts);
    CHECK(u.norm() == Approx(1.f).epsilon(1.e-5));
    CHECK(Cosine(u, x) == Approx(1.f).epsilon(1.e-5));
  }

  SECTION("Gaussian")
  {
    Index const    m = 1024, n = 8;
    std::mt19937   gen(42);
    CxMatrix const A = Gaussian(m, n, gen);
    CxVector const xt = Gaussian(n, 1, gen);
    ReVector const b0 = (A * xt).array().abs();

    auto const x = NullInitialize(A, b0, Quiet());
    INFO("cosine " << Cosine(x, xt) << " |x| " << x.norm() << " |xt| " << xt.norm());
    CHECK(Cosine(x, xt) > 0.9f);
    CHECK(x.norm() == Approx(xt.norm()).epsilon(0.25));
  }

  SECTION("Functor")
  {
    Index const    m = 256, n = 6;
    std::mt19937   gen(7);
    CxMatrix const A = Gaussian(m, n, gen);
    CxVector const xt = Gaussian(n, 1, gen);
    ReVector const b0 = (A * xt).array().abs();

    auto const fwd = [&A](CxVector const &x) -> CxVector { return A * x; };
    auto const adj = [&A](CxVector const &y) -> CxVector { return A.adjoint() * y; };
    auto const xd = NullInitialize(A, b0, Quiet());
    auto const xf = NullInitialize(fwd, adj, b0, n, Quiet());
    CHECK((xd - xf).norm() == Approx(0.f).margin(1.e-4f * xd.norm()));

    CHECK_THROWS_AS(NullInitialize(fwd, nullptr, b0, n, Quiet()), Log::InvalidInputError);
    CHECK_THROWS_AS(NullInitialize(fwd, adj, b0, 0, Quiet()), Log::InvalidInputError);
  }

  SECTION("Errors")
  {
    CxMatrix const A = CxMatrix::Random(16, 4);
    CHECK_THROWS_AS(NullInitialize(A, ReVector::Ones(15), Quiet()), Log::DimensionMismatchError);
    CHECK_THROWS_AS(NullInitialize(A, ReVector::Zero(16), Quiet()), Log::DegenerateScaleError);
    auto opts = Quiet();
    opts.γ = 1.5f;
    CHECK_THROWS_AS(NullInitialize(A, ReVector::Ones(16), opts), Log::InvalidInputError);
    CHECK_THROWS_AS(NullInitialize(Ops::Op::Ptr(), ReVector::Ones(16), Quiet()), Log::InvalidInputError);
  }
}

TEST_CASE("Rescale", "[init]")
{
  Index const    m = 64, n = 4;
  std::mt19937   gen(3);
  CxMatrix const Amat = Gaussian(m, n, gen);
  CxVector const xt = Gaussian(n, 1, gen);
  ReVector const b0 = (Amat * xt).array().abs();
  auto const     A = Ops::MatMul::Make(Amat);
  ReVector const I = SmallMask(b0, 0.5f);

  SECTION("Exact")
  {
    // The true signal up to a global phase and scale
    CxVector const x = xt * Cx(0.f, 0.5f);
    CHECK(RescaleFactor(A, I, b0, x) == Approx(2.f).epsilon(1.e-4));
  }

  SECTION("Idempotent")
  {
    CxVector const x = CxVector::Random(n);
    float const    s = RescaleFactor(A, I, b0, x);
    CHECK(s > 0.f);
    CHECK(RescaleFactor(A, I, b0, s * x) == Approx(1.f).epsilon(1.e-4));
  }

  SECTION("Degenerate")
  {
    CHECK_THROWS_AS(RescaleFactor(A, I, b0, CxVector::Zero(n)), Log::DegenerateScaleError);
    CHECK_THROWS_AS(RescaleFactor(A, I, ReVector::Zero(m), xt), Log::DegenerateScaleError);
    CHECK_THROWS_AS(RescaleFactor(A, I.head(m - 1), b0, xt), Log::DimensionMismatchError);
  }
}
