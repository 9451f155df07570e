#pragma once

#include <TesseraMosaic/Library.h>
#include <TesseraMosaic/MergeStrategy.h>

#include <string>

namespace TesseraMosaic {

/**
 * @brief Computes, for each sample, the population standard deviation of
 * the values of every asset that has the pixel valid. The result is always
 * `Float64`. Every asset is consulted.
 */
class TESSERAMOSAIC_API StddevStrategy final : public MergeStrategy {
public:
  std::string getName() const override;

  void update(
      AccumulatorState& state,
      const TesseraRaster::PixelBuffer& pixels,
      const TesseraRaster::ValidityMask& mask) const override;

  TesseraRaster::TileImage finalize(AccumulatorState& state) const override;
};

} // namespace TesseraMosaic
