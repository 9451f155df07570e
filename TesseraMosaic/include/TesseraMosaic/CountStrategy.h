#pragma once

#include <TesseraMosaic/Library.h>
#include <TesseraMosaic/MergeStrategy.h>

#include <string>

namespace TesseraMosaic {

/**
 * @brief Counts, for each pixel, how many assets have it valid.
 *
 * The result has a single `UInt16` band, whatever the number of bands
 * requested, and is valid wherever the count is at least one. Every asset is
 * consulted.
 */
class TESSERAMOSAIC_API CountStrategy final : public MergeStrategy {
public:
  std::string getName() const override;

  void update(
      AccumulatorState& state,
      const TesseraRaster::PixelBuffer& pixels,
      const TesseraRaster::ValidityMask& mask) const override;

  TesseraRaster::TileImage finalize(AccumulatorState& state) const override;
};

} // namespace TesseraMosaic
