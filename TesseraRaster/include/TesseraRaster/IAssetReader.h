#pragma once

#include <TesseraRaster/AssetFetchError.h>
#include <TesseraRaster/Library.h>
#include <TesseraRaster/TileImage.h>
#include <TesseraRaster/TileRequest.h>

#include <nonstd/expected.hpp>

#include <string>

namespace TesseraRaster {

/**
 * @brief Reads one asset's contribution to a tile.
 *
 * Implementations decode the asset's window that overlaps the tile, warp it
 * onto the tile grid and return the pixels with their validity mask. The
 * mosaic engine calls {@link read} concurrently from several threads for
 * distinct assets, so implementations must not share mutable state between
 * calls without synchronizing it.
 */
class TESSERARASTER_API IAssetReader {
public:
  virtual ~IAssetReader() = default;

  /**
   * @brief Reads an asset.
   *
   * @param assetId Identifies the asset, for example a scene ID or a URL.
   * @param request The tile to produce.
   * @return The pixels and mask, which should have the shape in
   * `request.shape`, or the reason the asset could not be read. A reader may
   * also throw; the exception is treated as a
   * {@link AssetFetchErrorKind::GenericIO} failure.
   */
  virtual nonstd::expected<TileImage, AssetFetchError>
  read(const std::string& assetId, const TileRequest& request) const = 0;
};

} // namespace TesseraRaster
