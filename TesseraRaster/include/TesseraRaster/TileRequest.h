#pragma once

#include <TesseraRaster/Library.h>
#include <TesseraRaster/TileID.h>
#include <TesseraRaster/TileShape.h>

#include <cstdint>
#include <vector>

namespace TesseraRaster {

/**
 * @brief How an {@link IAssetReader} resamples source pixels onto the tile
 * grid.
 *
 * The mosaic engine does not resample anything itself; the method is passed
 * through to the reader.
 */
enum class ResamplingMethod {
  Nearest,
  Bilinear,
  Cubic,
  CubicSpline,
  Lanczos,
  Average,
  Mode,
  Gauss,
  Rms
};

/**
 * @brief Gets the lowercase name of a resampling method, as used by GDAL,
 * such as `"cubic_spline"`.
 */
TESSERARASTER_API const char* getName(ResamplingMethod method) noexcept;

/**
 * @brief Everything a reader needs to produce one asset's contribution to a
 * tile.
 */
struct TESSERARASTER_API TileRequest final {
  /**
   * @brief The tile being built.
   */
  TileID tileID{0, 0, 0};

  /**
   * @brief The dimensions of the tile. Every asset result must have exactly
   * this shape; the mosaic is sized from it before any asset is read.
   */
  TileShape shape;

  /**
   * @brief The 1-based source band indexes to read. When empty, the reader
   * reads the first `shape.bands` bands.
   */
  std::vector<int32_t> indexes;

  /**
   * @brief How the reader resamples source pixels.
   */
  ResamplingMethod resampling = ResamplingMethod::Nearest;
};

} // namespace TesseraRaster
