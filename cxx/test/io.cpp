#include "pn/io/reader.hpp"
#include "pn/io/writer.hpp"
#include "pn/log/log.hpp"

#include <filesystem>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace pn;
using namespace Catch;

TEST_CASE("IO", "[io]")
{
  Index const    m = 12, n = 3;
  CxMatrix const A = CxMatrix::Random(m, n);
  ReVector const b0 = ReVector::Random(m).abs();

  SECTION("Basic")
  {
    std::filesystem::path const fname = std::filesystem::temp_directory_path() / "pinot-io-test.h5";
    { // Use destructor to ensure it is written
      HD5::Writer writer(fname.string());
      CHECK_NOTHROW(writer.writeTensor(HD5::Keys::Matrix, HD5::Shape<2>{m, n}, A.data(), HD5::Dims::Matrix));
      CHECK_NOTHROW(writer.writeTensor(HD5::Keys::Measurements, HD5::Shape<1>{m}, b0.data(), HD5::Dims::Measurements));
      CHECK_NOTHROW(writer.writeStrings(HD5::Keys::Log, {"[00:00:00] [Test   ] One", "[00:00:00] [Test   ] Two"}));
    }
    CHECK(std::filesystem::exists(fname));

    REQUIRE_NOTHROW(HD5::Reader(fname.string()));
    HD5::Reader reader(fname.string());
    CHECK(reader.exists(HD5::Keys::Matrix));
    CHECK(reader.dimensions(HD5::Keys::Matrix) == std::vector<Index>{m, n});
    CHECK(!reader.exists(HD5::Keys::Data));

    CxMatrix const check = reader.readMatrix();
    REQUIRE(check.rows() == m);
    REQUIRE(check.cols() == n);
    CHECK((check - A).norm() == Approx(0.f).margin(1.e-9));
    ReVector const bcheck = reader.readMeasurements();
    CHECK((bcheck - b0).matrix().norm() == Approx(0.f).margin(1.e-9));
    auto const log = reader.readStrings();
    REQUIRE(log.size() == 2);
    CHECK(log[1] == "[00:00:00] [Test   ] Two");
    CHECK_THROWS_AS(reader.readMeasurements(HD5::Keys::Matrix), Log::Failure);
    std::filesystem::remove(fname);
  }

  SECTION("Real-Matrix")
  {
    std::filesystem::path const fname = std::filesystem::temp_directory_path() / "pinot-io-real.h5";
    ReMatrix const              R = A.real();
    {
      HD5::Writer writer(fname.string());
      writer.writeTensor(HD5::Keys::Matrix, HD5::Shape<2>{m, n}, R.data(), HD5::Dims::Matrix);
    }
    HD5::Reader    reader(fname.string());
    CxMatrix const check = reader.readMatrix();
    CHECK((check.real() - R).norm() == Approx(0.f).margin(1.e-9));
    CHECK(check.imag().norm() == Approx(0.f).margin(1.e-9));
    std::filesystem::remove(fname);
  }

  SECTION("Missing")
  {
    CHECK_THROWS_AS(HD5::Reader("/nonexistent/pinot.h5"), Log::Failure);
    std::filesystem::path const fname = std::filesystem::temp_directory_path() / "pinot-io-missing.h5";
    {
      HD5::Writer writer(fname.string());
      writer.writeStrings(HD5::Keys::Log, {"[00:00:00] [Test   ] Only"});
    }
    HD5::Reader reader(fname.string());
    CHECK(reader.readStrings().size() == 1);
    CHECK(Log::Category(reader.readStrings().front()) == "Test");
    CHECK_THROWS_AS(reader.readMatrix(), Log::Failure);
    CHECK_THROWS_AS(reader.dimensions(HD5::Keys::Data), Log::Failure);
    std::filesystem::remove(fname);
  }
}
