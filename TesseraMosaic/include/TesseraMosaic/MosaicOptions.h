#pragma once

#include <TesseraMosaic/AssetFailure.h>
#include <TesseraMosaic/Library.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>

namespace TesseraMosaic {

/**
 * @brief Options for {@link MosaicAssembler::assemble}.
 */
struct TESSERAMOSAIC_API MosaicOptions {
  /**
   * @brief The maximum number of assets that may be read at once. Must be at
   * least one.
   */
  int32_t maximumSimultaneousReads = 4;

  /**
   * @brief Stop reading assets once this many have been read successfully,
   * even if the merge strategy would take more.
   *
   * When empty, assets are read until the strategy is complete or the list
   * runs out. Zero is not allowed.
   */
  std::optional<size_t> maximumAssetsUsed;

  /**
   * @brief How long a single asset read may run before the asset is
   * recorded as failed with
   * {@link TesseraRaster::AssetFetchErrorKind::Timeout}. Must be positive
   * when set.
   */
  std::optional<std::chrono::milliseconds> assetReadTimeout;

  /**
   * @brief Called on the assembling thread for each asset that could not be
   * used, in asset list order.
   */
  std::function<void(const AssetFailure& failure)> assetFailureCallback;
};

} // namespace TesseraMosaic
