#include <TesseraMosaic/AccumulatorState.h>
#include <TesseraMosaic/FirstValidStrategy.h>
#include <TesseraRaster/PixelBuffer.h>
#include <TesseraRaster/ValidityMask.h>

#include <cstddef>
#include <string>

using namespace TesseraRaster;

namespace TesseraMosaic {

std::string FirstValidStrategy::getName() const { return "first"; }

void FirstValidStrategy::update(
    AccumulatorState& state,
    const PixelBuffer& pixels,
    const ValidityMask& mask) const {
  ValidityMask& merged = state.getMask();
  const size_t pixelCount = merged.getPixelCount();
  for (size_t pixel = 0; pixel < pixelCount; ++pixel) {
    if (!merged.isValid(pixel) && mask.isValid(pixel)) {
      copyPixel(state, pixels, pixel);
      merged.setValid(pixel, true);
    }
  }
}

bool FirstValidStrategy::isComplete(const AccumulatorState& state) const {
  return state.getMask().isFullyValid();
}

} // namespace TesseraMosaic
