#pragma once

#include <TesseraMosaic/Library.h>
#include <TesseraRaster/AssetFetchError.h>

#include <string>

namespace TesseraMosaic {

/**
 * @brief Records that an asset was consulted for a tile but contributed
 * nothing.
 */
struct TESSERAMOSAIC_API AssetFailure final {
  /**
   * @brief The asset that failed.
   */
  std::string assetId;

  /**
   * @brief Why it failed.
   */
  TesseraRaster::AssetFetchError error;

  /**
   * @brief Formats the failure as `"<assetId>: <kind>: <message>"`.
   */
  std::string toString() const;
};

} // namespace TesseraMosaic
