#include <TesseraRaster/TileShape.h>
#include <TesseraRaster/ValidityMask.h>

#include <doctest/doctest.h>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

using namespace TesseraRaster;

TEST_CASE("ValidityMask") {
  SUBCASE("starts with uniform validity") {
    ValidityMask invalid(2, 3);
    CHECK(invalid.getPixelCount() == 6);
    CHECK(invalid.getValidCount() == 0);
    CHECK(!invalid.hasValidPixels());
    CHECK(!invalid.isFullyValid());

    ValidityMask valid(2, 3, true);
    CHECK(valid.getValidCount() == 6);
    CHECK(valid.isFullyValid());
  }

  SUBCASE("an empty mask is never fully valid") {
    ValidityMask mask;
    CHECK(mask.getPixelCount() == 0);
    CHECK(!mask.isFullyValid());
  }

  SUBCASE("counts valid pixels as they change") {
    ValidityMask mask(2, 2);
    mask.setValid(0, 1, true);
    mask.setValid(0, 1, true);
    CHECK(mask.getValidCount() == 1);
    CHECK(mask.isValid(0, 1));
    CHECK(!mask.isValid(1, 1));

    mask.setValid(1, 1, true);
    mask.setValid(0, 0, true);
    mask.setValid(1, 0, true);
    CHECK(mask.isFullyValid());

    mask.setValid(1, 0, false);
    CHECK(mask.getValidCount() == 3);
  }

  SUBCASE("normalizes nonzero bytes to valid") {
    ValidityMask mask(1, 4, std::vector<uint8_t>{0, 255, 1, 0});
    CHECK(mask.getValidCount() == 2);
    CHECK(mask.getValues()[1] == 1);
    CHECK(mask.isValid(size_t(2)));
  }

  SUBCASE("rejects a value count that does not match") {
    CHECK_THROWS_AS(
        ValidityMask(2, 2, std::vector<uint8_t>{1, 1, 1}),
        std::invalid_argument);
  }

  SUBCASE("matches compares rows and columns only") {
    ValidityMask mask(4, 5);
    CHECK(mask.matches(TileShape{3, 4, 5}));
    CHECK(!mask.matches(TileShape{3, 5, 4}));
  }
}
