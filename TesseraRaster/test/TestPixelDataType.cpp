#include <TesseraRaster/PixelDataType.h>

#include <doctest/doctest.h>

#include <cstddef>
#include <cstdint>
#include <string>

using namespace TesseraRaster;

TEST_CASE("promotePixelDataTypes") {
  SUBCASE("identical types are unchanged") {
    CHECK(
        promotePixelDataTypes(PixelDataType::UInt16, PixelDataType::UInt16) ==
        PixelDataType::UInt16);
  }

  SUBCASE("same signedness widens") {
    CHECK(
        promotePixelDataTypes(PixelDataType::UInt8, PixelDataType::UInt16) ==
        PixelDataType::UInt16);
    CHECK(
        promotePixelDataTypes(PixelDataType::Int32, PixelDataType::Int8) ==
        PixelDataType::Int32);
  }

  SUBCASE("mixed signedness goes to a wider signed type") {
    CHECK(
        promotePixelDataTypes(PixelDataType::UInt8, PixelDataType::Int8) ==
        PixelDataType::Int16);
    CHECK(
        promotePixelDataTypes(PixelDataType::Int16, PixelDataType::UInt16) ==
        PixelDataType::Int32);
    CHECK(
        promotePixelDataTypes(PixelDataType::UInt8, PixelDataType::Int32) ==
        PixelDataType::Int32);
    CHECK(
        promotePixelDataTypes(PixelDataType::UInt32, PixelDataType::Int8) ==
        PixelDataType::Float64);
  }

  SUBCASE("integers and floats") {
    CHECK(
        promotePixelDataTypes(PixelDataType::UInt8, PixelDataType::Float32) ==
        PixelDataType::Float32);
    CHECK(
        promotePixelDataTypes(PixelDataType::Int16, PixelDataType::Float32) ==
        PixelDataType::Float32);
    CHECK(
        promotePixelDataTypes(PixelDataType::Float32, PixelDataType::UInt32) ==
        PixelDataType::Float64);
    CHECK(
        promotePixelDataTypes(PixelDataType::Float32, PixelDataType::Float64) ==
        PixelDataType::Float64);
    CHECK(
        promotePixelDataTypes(PixelDataType::UInt8, PixelDataType::Float64) ==
        PixelDataType::Float64);
  }

  SUBCASE("promotion is symmetric") {
    const PixelDataType types[] = {
        PixelDataType::UInt8,
        PixelDataType::Int8,
        PixelDataType::UInt16,
        PixelDataType::Int16,
        PixelDataType::UInt32,
        PixelDataType::Int32,
        PixelDataType::Float32,
        PixelDataType::Float64};
    for (PixelDataType a : types) {
      for (PixelDataType b : types) {
        CHECK(promotePixelDataTypes(a, b) == promotePixelDataTypes(b, a));
      }
    }
  }
}

TEST_CASE("PixelDataType properties") {
  CHECK(getSizeInBytes(PixelDataType::UInt8) == 1);
  CHECK(getSizeInBytes(PixelDataType::Int16) == 2);
  CHECK(getSizeInBytes(PixelDataType::Float32) == 4);
  CHECK(getSizeInBytes(PixelDataType::Float64) == 8);

  CHECK(isFloatingPoint(PixelDataType::Float32));
  CHECK(!isFloatingPoint(PixelDataType::Int32));
  CHECK(isSigned(PixelDataType::Int8));
  CHECK(!isSigned(PixelDataType::UInt32));

  CHECK(getLowestValue(PixelDataType::UInt16) == 0.0);
  CHECK(getHighestValue(PixelDataType::UInt16) == 65535.0);
  CHECK(getLowestValue(PixelDataType::Int8) == -128.0);
  CHECK(getHighestValue(PixelDataType::UInt8) == 255.0);

  CHECK(std::string(getName(PixelDataType::Float32)) == "float32");

  const size_t size = dispatchPixelDataType(
      PixelDataType::Int16,
      [](auto sample) { return sizeof(sample); });
  CHECK(size == sizeof(int16_t));
}
