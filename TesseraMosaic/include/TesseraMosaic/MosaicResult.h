#pragma once

#include <TesseraMosaic/AssetFailure.h>
#include <TesseraMosaic/Library.h>
#include <TesseraRaster/PixelBuffer.h>
#include <TesseraRaster/ValidityMask.h>

#include <string>
#include <vector>

namespace TesseraMosaic {

/**
 * @brief A finished mosaic tile and where its pixels came from.
 */
struct TESSERAMOSAIC_API MosaicResult final {
  /**
   * @brief The merged pixels. The rows and columns are those of the
   * requested tile.
   */
  TesseraRaster::PixelBuffer pixels;

  /**
   * @brief The pixels that at least one asset had valid.
   */
  TesseraRaster::ValidityMask mask;

  /**
   * @brief The assets that were folded into the tile, in asset list order.
   */
  std::vector<std::string> usedAssets;

  /**
   * @brief The assets that were consulted but could not be used, in asset
   * list order.
   */
  std::vector<AssetFailure> failures;

  /**
   * @brief The name of the merge strategy that produced the tile.
   */
  std::string strategyName;
};

} // namespace TesseraMosaic
