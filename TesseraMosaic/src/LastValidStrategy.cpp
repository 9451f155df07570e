#include <TesseraMosaic/AccumulatorState.h>
#include <TesseraMosaic/LastValidStrategy.h>
#include <TesseraRaster/PixelBuffer.h>
#include <TesseraRaster/ValidityMask.h>

#include <cstddef>
#include <string>

using namespace TesseraRaster;

namespace TesseraMosaic {

std::string LastValidStrategy::getName() const { return "last"; }

void LastValidStrategy::update(
    AccumulatorState& state,
    const PixelBuffer& pixels,
    const ValidityMask& mask) const {
  ValidityMask& merged = state.getMask();
  const size_t pixelCount = merged.getPixelCount();
  for (size_t pixel = 0; pixel < pixelCount; ++pixel) {
    if (mask.isValid(pixel)) {
      copyPixel(state, pixels, pixel);
      merged.setValid(pixel, true);
    }
  }
}

} // namespace TesseraMosaic
