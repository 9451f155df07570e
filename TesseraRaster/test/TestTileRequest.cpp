#include <TesseraRaster/AssetFetchError.h>
#include <TesseraRaster/TileRequest.h>

#include <doctest/doctest.h>

#include <string>

using namespace TesseraRaster;

TEST_CASE("TileRequest") {
  SUBCASE("defaults to nearest-neighbor resampling") {
    TileRequest request;
    CHECK(request.resampling == ResamplingMethod::Nearest);
    CHECK(request.indexes.empty());
  }

  SUBCASE("resampling methods use the GDAL names") {
    CHECK(std::string(getName(ResamplingMethod::Nearest)) == "nearest");
    CHECK(std::string(getName(ResamplingMethod::Bilinear)) == "bilinear");
    CHECK(
        std::string(getName(ResamplingMethod::CubicSpline)) ==
        "cubic_spline");
    CHECK(std::string(getName(ResamplingMethod::Lanczos)) == "lanczos");
    CHECK(std::string(getName(ResamplingMethod::Rms)) == "rms");
  }
}

TEST_CASE("AssetFetchErrorKind names") {
  CHECK(std::string(getName(AssetFetchErrorKind::Timeout)) == "timeout");
  CHECK(std::string(getName(AssetFetchErrorKind::Canceled)) == "canceled");
}
