#include "pn/init/mask.hpp"
#include "pn/log/log.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <cmath>
#include <limits>

using namespace pn;
using namespace Catch;

TEST_CASE("SmallMask", "[init]")
{
  SECTION("Count")
  {
    auto const m = GENERATE(Index(1), Index(2), Index(3), Index(7), Index(100), Index(1001));
    ReVector const b0 = ReVector::Random(m).abs();
    ReVector const I = SmallMask(b0, 0.5f);
    CHECK(I.rows() == m);
    CHECK(I.sum() == float(m - std::lround(m * 0.5)));
    CHECK(((I == 0.f) || (I == 1.f)).all());
  }

  SECTION("Smallest")
  {
    ReVector b0(6);
    b0 << 0.3f, 5.f, 0.1f, 2.f, 4.f, 0.2f;
    ReVector const I = SmallMask(b0, 0.5f);
    ReVector       expected(6);
    expected << 1.f, 0.f, 1.f, 0.f, 0.f, 1.f;
    CHECK((I == expected).all());
    // Everything kept is no larger than everything left out
    CHECK((I * b0).maxCoeff() <= ((1.f - I) * b0 + (I * 1.e9f)).minCoeff());
  }

  SECTION("Ties")
  {
    // Equal magnitudes keep their order, so the earlier ones count as large
    ReVector b0(4);
    b0 << 1.f, 0.f, 1.f, 1.f;
    ReVector const I = SmallMask(b0, 0.5f);
    ReVector       expected(4);
    expected << 0.f, 1.f, 0.f, 1.f;
    CHECK((I == expected).all());
  }

  SECTION("Fraction")
  {
    ReVector const b0 = ReVector::LinSpaced(10, 1.f, 10.f);
    CHECK(SmallMask(b0, 0.2f).sum() == 8.f);
    CHECK(SmallMask(b0, 0.8f).sum() == 2.f);
    CHECK(SmallMask(b0, 0.8f)[0] == 1.f);
  }

  SECTION("Invalid")
  {
    ReVector const b0 = ReVector::Ones(4);
    CHECK_THROWS_AS(SmallMask(b0, 0.f), Log::InvalidInputError);
    CHECK_THROWS_AS(SmallMask(b0, 1.f), Log::InvalidInputError);
    CHECK_THROWS_AS(SmallMask(ReVector(0), 0.5f), Log::InvalidInputError);
    ReVector bad = b0;
    bad[2] = -1.f;
    CHECK_THROWS_AS(SmallMask(bad, 0.5f), Log::InvalidInputError);
    bad[2] = std::numeric_limits<float>::quiet_NaN();
    CHECK_THROWS_AS(SmallMask(bad, 0.5f), Log::InvalidInputError);
  }
}
