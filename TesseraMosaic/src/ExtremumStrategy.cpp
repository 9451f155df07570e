#include <TesseraMosaic/AccumulatorState.h>
#include <TesseraMosaic/ExtremumStrategy.h>
#include <TesseraRaster/PixelBuffer.h>
#include <TesseraRaster/PixelDataType.h>
#include <TesseraRaster/ValidityMask.h>

#include <cstddef>
#include <string>
#include <vector>

using namespace TesseraRaster;

namespace TesseraMosaic {

ExtremumStrategy::ExtremumStrategy(
    ExtremumKind kind,
    const ExtremumOptions& options) noexcept
    : _kind(kind), _options(options) {}

std::string ExtremumStrategy::getName() const {
  return this->_kind == ExtremumKind::Highest ? "highest" : "lowest";
}

void ExtremumStrategy::update(
    AccumulatorState& state,
    const PixelBuffer& pixels,
    const ValidityMask& mask) const {
  ValidityMask& merged = state.getMask();
  std::vector<double>& values = state.getValues();
  const size_t pixelCount = merged.getPixelCount();
  const size_t bands = size_t(state.getShape().bands);

  for (size_t pixel = 0; pixel < pixelCount; ++pixel) {
    if (!mask.isValid(pixel)) {
      continue;
    }

    if (!merged.isValid(pixel)) {
      copyPixel(state, pixels, pixel);
      merged.setValid(pixel, true);
      continue;
    }

    for (size_t band = 0; band < bands; ++band) {
      const size_t sample = band * pixelCount + pixel;
      const double candidate = pixels.getValue(sample);
      if (this->isBetter(candidate, values[sample])) {
        values[sample] = candidate;
      }
    }
  }
}

bool ExtremumStrategy::isComplete(const AccumulatorState& state) const {
  if (!this->_options.stopAtTypeLimit || !state.getMask().isFullyValid()) {
    return false;
  }

  const PixelDataType type = state.getOutputDataType();
  const double limit = this->_kind == ExtremumKind::Highest
                           ? getHighestValue(type)
                           : getLowestValue(type);

  for (double value : state.getValues()) {
    if (value != limit) {
      return false;
    }
  }

  return true;
}

} // namespace TesseraMosaic
