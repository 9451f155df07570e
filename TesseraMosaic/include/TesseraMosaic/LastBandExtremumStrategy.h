#pragma once

#include <TesseraMosaic/ExtremumStrategy.h>
#include <TesseraMosaic/Library.h>
#include <TesseraMosaic/MergeStrategy.h>

#include <string>

namespace TesseraMosaic {

/**
 * @brief Keeps, for each pixel, every band of the asset whose last band is
 * the highest or lowest.
 *
 * This is typically used with a quality band appended to the data bands, to
 * pick the clearest scene at each pixel. Every asset is consulted.
 */
class TESSERAMOSAIC_API LastBandExtremumStrategy final : public MergeStrategy {
public:
  explicit LastBandExtremumStrategy(ExtremumKind kind) noexcept;

  /**
   * @brief Returns `"lastbandhigh"` or `"lastbandlow"`.
   */
  std::string getName() const override;

  void update(
      AccumulatorState& state,
      const TesseraRaster::PixelBuffer& pixels,
      const TesseraRaster::ValidityMask& mask) const override;

  ExtremumKind getKind() const noexcept { return this->_kind; }

private:
  ExtremumKind _kind;
};

} // namespace TesseraMosaic
