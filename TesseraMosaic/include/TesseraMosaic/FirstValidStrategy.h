#pragma once

#include <TesseraMosaic/Library.h>
#include <TesseraMosaic/MergeStrategy.h>

#include <string>

namespace TesseraMosaic {

/**
 * @brief Keeps, for each pixel, the value of the first asset in list order
 * that has it valid.
 *
 * The accumulation is complete as soon as every pixel is valid, so with a
 * fully covered tile the remaining assets are never read.
 */
class TESSERAMOSAIC_API FirstValidStrategy final : public MergeStrategy {
public:
  std::string getName() const override;

  void update(
      AccumulatorState& state,
      const TesseraRaster::PixelBuffer& pixels,
      const TesseraRaster::ValidityMask& mask) const override;

  bool isComplete(const AccumulatorState& state) const override;
};

} // namespace TesseraMosaic
