#pragma once

#include <TesseraRaster/Library.h>

#include <cstddef>
#include <cstdint>
#include <stdexcept>

namespace TesseraRaster {

/**
 * @brief The numeric type of the samples in a {@link PixelBuffer}.
 */
enum class PixelDataType : uint8_t {
  UInt8,
  Int8,
  UInt16,
  Int16,
  UInt32,
  Int32,
  Float32,
  Float64
};

/**
 * @brief Gets the size in bytes of one sample of the given type.
 */
TESSERARASTER_API size_t getSizeInBytes(PixelDataType type) noexcept;

/**
 * @brief Returns `true` for `Float32` and `Float64`.
 */
TESSERARASTER_API bool isFloatingPoint(PixelDataType type) noexcept;

/**
 * @brief Returns `true` for the signed integer and floating-point types.
 */
TESSERARASTER_API bool isSigned(PixelDataType type) noexcept;

/**
 * @brief Gets the lowest finite value representable by the type.
 */
TESSERARASTER_API double getLowestValue(PixelDataType type) noexcept;

/**
 * @brief Gets the highest finite value representable by the type.
 */
TESSERARASTER_API double getHighestValue(PixelDataType type) noexcept;

/**
 * @brief Gets a short lowercase name for the type, such as `"uint16"`.
 */
TESSERARASTER_API const char* getName(PixelDataType type) noexcept;

/**
 * @brief Finds the narrowest type that can hold every value of both `a` and
 * `b` without truncation.
 *
 * The rules follow numpy's type promotion, restricted to the types available
 * here:
 *
 *   * Two integer types of the same signedness promote to the wider one.
 *   * A signed and an unsigned integer promote to a signed integer wider than
 *     the unsigned one, or to `Float64` when no such integer exists.
 *   * An integer of up to 16 bits and `Float32` promote to `Float32`. Wider
 *     integers and `Float32` promote to `Float64`.
 *   * Anything and `Float64` promote to `Float64`.
 */
TESSERARASTER_API PixelDataType
promotePixelDataTypes(PixelDataType a, PixelDataType b) noexcept;

/**
 * @brief Invokes `callback` with a value-initialized object of the C++ type
 * that corresponds to `type`, and returns what it returns.
 *
 * This turns a runtime {@link PixelDataType} into a compile-time type:
 *
 * ```
 * size_t size = dispatchPixelDataType(type, [](auto sample) {
 *   return sizeof(sample);
 * });
 * ```
 */
template <typename Callback>
decltype(auto) dispatchPixelDataType(PixelDataType type, Callback&& callback) {
  switch (type) {
  case PixelDataType::UInt8:
    return callback(uint8_t{});
  case PixelDataType::Int8:
    return callback(int8_t{});
  case PixelDataType::UInt16:
    return callback(uint16_t{});
  case PixelDataType::Int16:
    return callback(int16_t{});
  case PixelDataType::UInt32:
    return callback(uint32_t{});
  case PixelDataType::Int32:
    return callback(int32_t{});
  case PixelDataType::Float32:
    return callback(float{});
  case PixelDataType::Float64:
    return callback(double{});
  }

  throw std::invalid_argument("Unknown pixel data type.");
}

/**
 * @brief Maps a C++ sample type to its {@link PixelDataType}.
 */
template <typename T> struct PixelDataTypeOf;

/** @cond Doxygen_Exclude */
template <> struct PixelDataTypeOf<uint8_t> {
  static constexpr PixelDataType value = PixelDataType::UInt8;
};
template <> struct PixelDataTypeOf<int8_t> {
  static constexpr PixelDataType value = PixelDataType::Int8;
};
template <> struct PixelDataTypeOf<uint16_t> {
  static constexpr PixelDataType value = PixelDataType::UInt16;
};
template <> struct PixelDataTypeOf<int16_t> {
  static constexpr PixelDataType value = PixelDataType::Int16;
};
template <> struct PixelDataTypeOf<uint32_t> {
  static constexpr PixelDataType value = PixelDataType::UInt32;
};
template <> struct PixelDataTypeOf<int32_t> {
  static constexpr PixelDataType value = PixelDataType::Int32;
};
template <> struct PixelDataTypeOf<float> {
  static constexpr PixelDataType value = PixelDataType::Float32;
};
template <> struct PixelDataTypeOf<double> {
  static constexpr PixelDataType value = PixelDataType::Float64;
};
/** @endcond */

} // namespace TesseraRaster
