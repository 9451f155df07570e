#pragma once

#include <TesseraMosaic/Library.h>
#include <TesseraMosaic/MergeStrategy.h>

#include <string>

namespace TesseraMosaic {

/**
 * @brief Keeps, for each pixel, the value of the last asset in list order
 * that has it valid. Every asset is consulted.
 */
class TESSERAMOSAIC_API LastValidStrategy final : public MergeStrategy {
public:
  std::string getName() const override;

  void update(
      AccumulatorState& state,
      const TesseraRaster::PixelBuffer& pixels,
      const TesseraRaster::ValidityMask& mask) const override;
};

} // namespace TesseraMosaic
