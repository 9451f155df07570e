#pragma once

#include <TesseraRaster/Library.h>
#include <TesseraRaster/TileShape.h>
#include <TesseraUtility/Assert.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace TesseraRaster {

/**
 * @brief Marks which pixels of a tile hold usable data.
 *
 * A pixel is invalid where the source has nodata, is masked (for example by
 * clouds), or does not cover the tile at all. The mask is shared by every
 * band of the matching {@link PixelBuffer}.
 *
 * The number of valid pixels is maintained as the mask changes, so
 * {@link isFullyValid} and {@link hasValidPixels} are constant time.
 */
class TESSERARASTER_API ValidityMask final {
public:
  /**
   * @brief Creates an empty mask with no pixels.
   */
  ValidityMask() noexcept;

  /**
   * @brief Creates a mask where every pixel has the same validity.
   *
   * @param height The number of rows.
   * @param width The number of columns.
   * @param valid The initial validity of every pixel.
   */
  ValidityMask(int32_t height, int32_t width, bool valid = false);

  /**
   * @brief Creates a mask from one byte per pixel, row by row. Zero means
   * invalid and any other value means valid.
   *
   * @throws std::invalid_argument If `values.size()` is not `height * width`.
   */
  ValidityMask(int32_t height, int32_t width, std::vector<uint8_t>&& values);

  /**
   * @brief Gets the number of rows.
   */
  int32_t getHeight() const noexcept { return this->_height; }

  /**
   * @brief Gets the number of columns.
   */
  int32_t getWidth() const noexcept { return this->_width; }

  /**
   * @brief Gets the number of pixels, `height * width`.
   */
  size_t getPixelCount() const noexcept { return this->_values.size(); }

  /**
   * @brief Returns `true` if the mask covers exactly the rows and columns of
   * the given shape.
   */
  bool matches(const TileShape& shape) const noexcept {
    return this->_height == shape.height && this->_width == shape.width;
  }

  bool isValid(size_t pixelIndex) const noexcept {
    TESSERA_ASSERT(pixelIndex < this->_values.size());
    return this->_values[pixelIndex] != 0;
  }

  bool isValid(int32_t row, int32_t column) const noexcept {
    return this->isValid(this->getPixelIndex(row, column));
  }

  void setValid(size_t pixelIndex, bool valid) noexcept;

  void setValid(int32_t row, int32_t column, bool valid) noexcept {
    this->setValid(this->getPixelIndex(row, column), valid);
  }

  /**
   * @brief Gets the number of valid pixels.
   */
  size_t getValidCount() const noexcept { return this->_validCount; }

  /**
   * @brief Returns `true` if the mask has pixels and all of them are valid.
   */
  bool isFullyValid() const noexcept {
    return !this->_values.empty() && this->_validCount == this->_values.size();
  }

  /**
   * @brief Returns `true` if at least one pixel is valid.
   */
  bool hasValidPixels() const noexcept { return this->_validCount > 0; }

  /**
   * @brief Gets one byte per pixel, 0 for invalid and 1 for valid.
   */
  std::span<const uint8_t> getValues() const noexcept { return this->_values; }

  size_t getPixelIndex(int32_t row, int32_t column) const noexcept {
    TESSERA_ASSERT(row >= 0 && row < this->_height);
    TESSERA_ASSERT(column >= 0 && column < this->_width);
    return size_t(row) * size_t(this->_width) + size_t(column);
  }

private:
  int32_t _height;
  int32_t _width;
  std::vector<uint8_t> _values;
  size_t _validCount;
};

} // namespace TesseraRaster
