#pragma once

#include <TesseraRaster/Library.h>
#include <TesseraRaster/PixelDataType.h>
#include <TesseraRaster/TileShape.h>
#include <TesseraUtility/Assert.h>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <utility>
#include <vector>

namespace TesseraRaster {

/**
 * @brief The samples of a tile: `bands x height x width` values of a single
 * {@link PixelDataType}, stored band by band, row by row.
 *
 * The sample of band `b` at row `r` and column `c` is at index
 * `(b * height + r) * width + c`.
 *
 * Buffers are large, so they are moved between the stages of the pipeline
 * rather than copied. Use {@link clone} where a copy is really needed.
 */
class TESSERARASTER_API PixelBuffer final {
public:
  /**
   * @brief Creates an empty buffer with no bands and no pixels.
   */
  PixelBuffer() noexcept;

  /**
   * @brief Creates a buffer with every sample set to zero.
   *
   * @param dataType The sample type.
   * @param shape The dimensions.
   */
  PixelBuffer(PixelDataType dataType, const TileShape& shape);

  /**
   * @brief Creates a buffer that takes ownership of existing sample bytes.
   *
   * @param dataType The sample type.
   * @param shape The dimensions.
   * @param data The samples, in native byte order. The size must be exactly
   * `shape.getSampleCount() * getSizeInBytes(dataType)`.
   * @throws std::invalid_argument If the size of `data` does not match.
   */
  PixelBuffer(
      PixelDataType dataType,
      const TileShape& shape,
      std::vector<std::byte>&& data);

  /**
   * @brief Creates a buffer from typed samples.
   *
   * @tparam T The C++ sample type, which determines the data type.
   * @param shape The dimensions.
   * @param samples The samples. The size must be `shape.getSampleCount()`.
   * @throws std::invalid_argument If the number of samples does not match.
   */
  template <typename T>
  static PixelBuffer
  fromSamples(const TileShape& shape, const std::vector<T>& samples) {
    std::vector<std::byte> data(samples.size() * sizeof(T));
    if (!samples.empty()) {
      std::memcpy(data.data(), samples.data(), data.size());
    }
    return PixelBuffer(PixelDataTypeOf<T>::value, shape, std::move(data));
  }

  PixelBuffer(PixelBuffer&& rhs) noexcept = default;
  PixelBuffer& operator=(PixelBuffer&& rhs) noexcept = default;
  PixelBuffer(const PixelBuffer& rhs) = delete;
  PixelBuffer& operator=(const PixelBuffer& rhs) = delete;

  /**
   * @brief Makes a deep copy of this buffer.
   */
  PixelBuffer clone() const;

  /**
   * @brief Gets the sample type.
   */
  PixelDataType getDataType() const noexcept { return this->_dataType; }

  /**
   * @brief Gets the dimensions.
   */
  const TileShape& getShape() const noexcept { return this->_shape; }

  /**
   * @brief Returns `true` if the buffer has no samples.
   */
  bool empty() const noexcept { return this->_data.empty(); }

  /**
   * @brief Reads one sample, converted to `double`.
   *
   * @param sampleIndex The index of the sample, as described in the class
   * documentation.
   */
  double getValue(size_t sampleIndex) const;

  /**
   * @brief Reads the sample of a band at a pixel, converted to `double`.
   */
  double getValue(int32_t band, int32_t row, int32_t column) const {
    return this->getValue(this->getSampleIndex(band, row, column));
  }

  /**
   * @brief Writes one sample.
   *
   * The value is clamped to the range of the data type. For integer types
   * it is then truncated toward zero; a NaN is written as zero.
   *
   * @param sampleIndex The index of the sample, as described in the class
   * documentation.
   * @param value The new value.
   */
  void setValue(size_t sampleIndex, double value);

  /**
   * @brief Writes the sample of a band at a pixel.
   *
   * @see setValue(size_t, double)
   */
  void setValue(int32_t band, int32_t row, int32_t column, double value) {
    this->setValue(this->getSampleIndex(band, row, column), value);
  }

  /**
   * @brief Gets the raw sample bytes.
   */
  std::span<const std::byte> getData() const noexcept { return this->_data; }

  /**
   * @brief Views the samples as their C++ type.
   *
   * @tparam T The C++ type matching {@link getDataType}.
   */
  template <typename T> std::span<const T> getTypedSpan() const noexcept {
    TESSERA_ASSERT(PixelDataTypeOf<T>::value == this->_dataType);
    return std::span<const T>(
        reinterpret_cast<const T*>(this->_data.data()),
        this->_data.size() / sizeof(T));
  }

  /**
   * @brief Computes the sample index of a band at a pixel.
   */
  size_t
  getSampleIndex(int32_t band, int32_t row, int32_t column) const noexcept {
    TESSERA_ASSERT(band >= 0 && band < this->_shape.bands);
    TESSERA_ASSERT(row >= 0 && row < this->_shape.height);
    TESSERA_ASSERT(column >= 0 && column < this->_shape.width);
    return (size_t(band) * size_t(this->_shape.height) + size_t(row)) *
               size_t(this->_shape.width) +
           size_t(column);
  }

private:
  PixelDataType _dataType;
  TileShape _shape;
  std::vector<std::byte> _data;
};

} // namespace TesseraRaster
