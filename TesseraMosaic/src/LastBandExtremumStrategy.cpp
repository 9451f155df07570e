#include <TesseraMosaic/AccumulatorState.h>
#include <TesseraMosaic/LastBandExtremumStrategy.h>
#include <TesseraRaster/PixelBuffer.h>
#include <TesseraRaster/ValidityMask.h>

#include <cstddef>
#include <string>
#include <vector>

using namespace TesseraRaster;

namespace TesseraMosaic {

LastBandExtremumStrategy::LastBandExtremumStrategy(ExtremumKind kind) noexcept
    : _kind(kind) {}

std::string LastBandExtremumStrategy::getName() const {
  return this->_kind == ExtremumKind::Highest ? "lastbandhigh"
                                              : "lastbandlow";
}

void LastBandExtremumStrategy::update(
    AccumulatorState& state,
    const PixelBuffer& pixels,
    const ValidityMask& mask) const {
  ValidityMask& merged = state.getMask();
  const std::vector<double>& values = state.getValues();
  const size_t pixelCount = merged.getPixelCount();
  const size_t lastBandOffset =
      size_t(state.getShape().bands - 1) * pixelCount;

  for (size_t pixel = 0; pixel < pixelCount; ++pixel) {
    if (!mask.isValid(pixel)) {
      continue;
    }

    bool replace = !merged.isValid(pixel);
    if (!replace) {
      const double candidate = pixels.getValue(lastBandOffset + pixel);
      const double current = values[lastBandOffset + pixel];
      replace = this->_kind == ExtremumKind::Highest ? candidate > current
                                                     : candidate < current;
    }

    if (replace) {
      copyPixel(state, pixels, pixel);
      merged.setValid(pixel, true);
    }
  }
}

} // namespace TesseraMosaic
