#pragma once

#include <TesseraMosaic/Library.h>
#include <TesseraMosaic/MeanStrategy.h>
#include <TesseraMosaic/MergeStrategy.h>

#include <string>

namespace TesseraMosaic {

/**
 * @brief Takes, for each sample, the median of the values of every asset
 * that has the pixel valid. With an even number of values, the median is
 * the mean of the two middle ones. Every asset is consulted.
 *
 * Every valid value is kept until the tile is finalized, so memory grows
 * with the number of assets consulted.
 */
class TESSERAMOSAIC_API MedianStrategy final : public MergeStrategy {
public:
  explicit MedianStrategy(const MeanOptions& options = {}) noexcept;

  std::string getName() const override;

  void update(
      AccumulatorState& state,
      const TesseraRaster::PixelBuffer& pixels,
      const TesseraRaster::ValidityMask& mask) const override;

  TesseraRaster::TileImage finalize(AccumulatorState& state) const override;

  const MeanOptions& getOptions() const noexcept { return this->_options; }

private:
  MeanOptions _options;
};

} // namespace TesseraMosaic
