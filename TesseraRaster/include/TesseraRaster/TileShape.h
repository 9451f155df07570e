#pragma once

#include <TesseraRaster/Library.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace TesseraRaster {

/**
 * @brief The dimensions of a tile: number of bands and pixel rows and
 * columns.
 */
struct TESSERARASTER_API TileShape final {
  /**
   * @brief The number of bands.
   */
  int32_t bands = 1;

  /**
   * @brief The number of pixel rows.
   */
  int32_t height = 256;

  /**
   * @brief The number of pixel columns.
   */
  int32_t width = 256;

  /**
   * @brief Gets the number of pixels in one band, `height * width`.
   */
  constexpr size_t getPixelCount() const noexcept {
    return size_t(this->height) * size_t(this->width);
  }

  /**
   * @brief Gets the number of samples across all bands,
   * `bands * height * width`.
   */
  constexpr size_t getSampleCount() const noexcept {
    return size_t(this->bands) * this->getPixelCount();
  }

  /**
   * @brief Returns `true` if every dimension is at least one.
   */
  constexpr bool isValid() const noexcept {
    return this->bands > 0 && this->height > 0 && this->width > 0;
  }

  constexpr bool operator==(const TileShape& rhs) const noexcept {
    return this->bands == rhs.bands && this->height == rhs.height &&
           this->width == rhs.width;
  }

  constexpr bool operator!=(const TileShape& rhs) const noexcept {
    return !(*this == rhs);
  }

  /**
   * @brief Formats the shape as `"bands x height x width"`.
   */
  std::string toString() const;
};

} // namespace TesseraRaster
