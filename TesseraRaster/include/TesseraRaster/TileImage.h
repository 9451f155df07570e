#pragma once

#include <TesseraRaster/Library.h>
#include <TesseraRaster/PixelBuffer.h>
#include <TesseraRaster/ValidityMask.h>

namespace TesseraRaster {

/**
 * @brief The pixels of a tile together with the mask of which of them are
 * usable.
 *
 * Readers produce one per asset, already resampled onto the tile grid, and
 * merge strategies produce one for the finished mosaic.
 */
struct TESSERARASTER_API TileImage final {
  /**
   * @brief The pixels.
   */
  PixelBuffer pixels;

  /**
   * @brief The usable pixels. Its rows and columns match those of
   * {@link pixels}.
   */
  ValidityMask mask;

  /**
   * @brief Returns `true` if the mask's dimensions agree with the pixels'
   * dimensions and both agree with `shape`.
   */
  bool matches(const TileShape& shape) const noexcept {
    return this->pixels.getShape() == shape && this->mask.matches(shape);
  }
};

} // namespace TesseraRaster
