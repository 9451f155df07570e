#include <TesseraRaster/PixelDataType.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace TesseraRaster {

namespace {

PixelDataType signedIntegerOfSize(size_t bytes) noexcept {
  switch (bytes) {
  case 1:
    return PixelDataType::Int8;
  case 2:
    return PixelDataType::Int16;
  case 4:
    return PixelDataType::Int32;
  default:
    return PixelDataType::Float64;
  }
}

PixelDataType unsignedIntegerOfSize(size_t bytes) noexcept {
  switch (bytes) {
  case 1:
    return PixelDataType::UInt8;
  case 2:
    return PixelDataType::UInt16;
  case 4:
    return PixelDataType::UInt32;
  default:
    return PixelDataType::Float64;
  }
}

} // namespace

size_t getSizeInBytes(PixelDataType type) noexcept {
  switch (type) {
  case PixelDataType::UInt8:
  case PixelDataType::Int8:
    return 1;
  case PixelDataType::UInt16:
  case PixelDataType::Int16:
    return 2;
  case PixelDataType::UInt32:
  case PixelDataType::Int32:
  case PixelDataType::Float32:
    return 4;
  case PixelDataType::Float64:
    return 8;
  }
  return 0;
}

bool isFloatingPoint(PixelDataType type) noexcept {
  return type == PixelDataType::Float32 || type == PixelDataType::Float64;
}

bool isSigned(PixelDataType type) noexcept {
  switch (type) {
  case PixelDataType::UInt8:
  case PixelDataType::UInt16:
  case PixelDataType::UInt32:
    return false;
  default:
    return true;
  }
}

double getLowestValue(PixelDataType type) noexcept {
  switch (type) {
  case PixelDataType::UInt8:
  case PixelDataType::UInt16:
  case PixelDataType::UInt32:
    return 0.0;
  case PixelDataType::Int8:
    return double(std::numeric_limits<int8_t>::lowest());
  case PixelDataType::Int16:
    return double(std::numeric_limits<int16_t>::lowest());
  case PixelDataType::Int32:
    return double(std::numeric_limits<int32_t>::lowest());
  case PixelDataType::Float32:
    return double(std::numeric_limits<float>::lowest());
  case PixelDataType::Float64:
    return std::numeric_limits<double>::lowest();
  }
  return 0.0;
}

double getHighestValue(PixelDataType type) noexcept {
  switch (type) {
  case PixelDataType::UInt8:
    return double(std::numeric_limits<uint8_t>::max());
  case PixelDataType::Int8:
    return double(std::numeric_limits<int8_t>::max());
  case PixelDataType::UInt16:
    return double(std::numeric_limits<uint16_t>::max());
  case PixelDataType::Int16:
    return double(std::numeric_limits<int16_t>::max());
  case PixelDataType::UInt32:
    return double(std::numeric_limits<uint32_t>::max());
  case PixelDataType::Int32:
    return double(std::numeric_limits<int32_t>::max());
  case PixelDataType::Float32:
    return double(std::numeric_limits<float>::max());
  case PixelDataType::Float64:
    return std::numeric_limits<double>::max();
  }
  return 0.0;
}

const char* getName(PixelDataType type) noexcept {
  switch (type) {
  case PixelDataType::UInt8:
    return "uint8";
  case PixelDataType::Int8:
    return "int8";
  case PixelDataType::UInt16:
    return "uint16";
  case PixelDataType::Int16:
    return "int16";
  case PixelDataType::UInt32:
    return "uint32";
  case PixelDataType::Int32:
    return "int32";
  case PixelDataType::Float32:
    return "float32";
  case PixelDataType::Float64:
    return "float64";
  }
  return "unknown";
}

PixelDataType promotePixelDataTypes(PixelDataType a, PixelDataType b) noexcept {
  if (a == b) {
    return a;
  }

  if (a == PixelDataType::Float64 || b == PixelDataType::Float64) {
    return PixelDataType::Float64;
  }

  if (isFloatingPoint(a) || isFloatingPoint(b)) {
    // One side is Float32, the other an integer. Float32 holds every 8- and
    // 16-bit integer exactly, but not every 32-bit one.
    const PixelDataType integer = isFloatingPoint(a) ? b : a;
    return getSizeInBytes(integer) <= 2 ? PixelDataType::Float32
                                        : PixelDataType::Float64;
  }

  const size_t sizeA = getSizeInBytes(a);
  const size_t sizeB = getSizeInBytes(b);

  if (isSigned(a) == isSigned(b)) {
    const size_t size = std::max(sizeA, sizeB);
    return isSigned(a) ? signedIntegerOfSize(size)
                       : unsignedIntegerOfSize(size);
  }

  const size_t signedSize = isSigned(a) ? sizeA : sizeB;
  const size_t unsignedSize = isSigned(a) ? sizeB : sizeA;
  if (signedSize > unsignedSize) {
    return signedIntegerOfSize(signedSize);
  }

  return signedIntegerOfSize(unsignedSize * 2);
}

} // namespace TesseraRaster
