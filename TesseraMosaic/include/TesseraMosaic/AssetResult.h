#pragma once

#include <TesseraMosaic/Library.h>
#include <TesseraRaster/AssetFetchError.h>
#include <TesseraRaster/TileImage.h>

#include <nonstd/expected.hpp>

#include <cstddef>
#include <string>

namespace TesseraMosaic {

/**
 * @brief The outcome of reading one asset: either its pixels and mask, or
 * the reason it failed.
 *
 * Each result is delivered exactly once by an {@link AssetResultStream}.
 */
struct TESSERAMOSAIC_API AssetResult final {
  /**
   * @brief The asset that was read.
   */
  std::string assetId;

  /**
   * @brief The position of the asset in the list passed to
   * {@link TaskScheduler::run}.
   */
  size_t index = 0;

  /**
   * @brief The pixels and mask, or the failure.
   */
  nonstd::expected<TesseraRaster::TileImage, TesseraRaster::AssetFetchError>
      image;

  /**
   * @brief Returns `true` if the read produced pixels.
   */
  bool succeeded() const noexcept { return this->image.has_value(); }
};

} // namespace TesseraMosaic
