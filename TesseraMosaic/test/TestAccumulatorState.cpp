#include <TesseraMosaic/AccumulatorState.h>
#include <TesseraMosaic/AssetFailure.h>
#include <TesseraRaster/AssetFetchError.h>
#include <TesseraRaster/PixelDataType.h>
#include <TesseraRaster/TileShape.h>

#include <doctest/doctest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace TesseraMosaic;
using namespace TesseraRaster;

namespace {

struct Tally : public MergeScratch {
  int value = 0;
};

struct OtherTally : public MergeScratch {};

} // namespace

TEST_CASE("AccumulatorState") {
  AccumulatorState state(TileShape{3, 2, 4});

  SUBCASE("starts empty") {
    CHECK(state.getValues().size() == 24);
    CHECK(state.getMask().getPixelCount() == 8);
    CHECK(!state.getMask().hasValidPixels());
    CHECK(!state.getDataType());
    CHECK(state.getOutputDataType() == PixelDataType::UInt8);
    CHECK(state.getUsedAssets().empty());
    CHECK(!state.isComplete());
  }

  SUBCASE("widens the data type as assets arrive") {
    state.recordDataType(PixelDataType::UInt8);
    CHECK(state.getDataType() == PixelDataType::UInt8);
    state.recordDataType(PixelDataType::Int8);
    CHECK(state.getDataType() == PixelDataType::Int16);
    state.recordDataType(PixelDataType::Float32);
    CHECK(state.getOutputDataType() == PixelDataType::Float32);
  }

  SUBCASE("keeps strategy scratch data") {
    state.getScratch<Tally>().value = 7;
    CHECK(state.getScratch<Tally>().value == 7);
    CHECK_THROWS_AS(state.getScratch<OtherTally>(), std::logic_error);
  }

  SUBCASE("records used assets in order") {
    state.addUsedAsset("b");
    state.addUsedAsset("a");
    CHECK(state.getUsedAssets() == std::vector<std::string>{"b", "a"});
    state.markComplete();
    CHECK(state.isComplete());
  }
}

TEST_CASE("AssetFailure::toString") {
  AssetFailure withMessage{
      "scene-1",
      AssetFetchError{AssetFetchErrorKind::DecodeError, "truncated"}};
  CHECK(withMessage.toString() == "scene-1: decode-error: truncated");

  AssetFailure withoutMessage{
      "scene-2",
      AssetFetchError{AssetFetchErrorKind::Timeout, ""}};
  CHECK(withoutMessage.toString() == "scene-2: timeout");
}
