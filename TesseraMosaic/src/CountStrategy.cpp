#include <TesseraMosaic/AccumulatorState.h>
#include <TesseraMosaic/CountStrategy.h>
#include <TesseraRaster/PixelBuffer.h>
#include <TesseraRaster/PixelDataType.h>
#include <TesseraRaster/TileImage.h>
#include <TesseraRaster/TileShape.h>
#include <TesseraRaster/ValidityMask.h>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

using namespace TesseraRaster;

namespace TesseraMosaic {

std::string CountStrategy::getName() const { return "count"; }

void CountStrategy::update(
    AccumulatorState& state,
    const PixelBuffer& /* pixels */,
    const ValidityMask& mask) const {
  // The count of pixel i is kept in the first band's slot of the values.
  std::vector<double>& values = state.getValues();
  ValidityMask& merged = state.getMask();
  const size_t pixelCount = merged.getPixelCount();
  for (size_t pixel = 0; pixel < pixelCount; ++pixel) {
    if (mask.isValid(pixel)) {
      values[pixel] += 1.0;
      merged.setValid(pixel, true);
    }
  }
}

TileImage CountStrategy::finalize(AccumulatorState& state) const {
  const TileShape& tileShape = state.getShape();
  const TileShape shape{1, tileShape.height, tileShape.width};
  const ValidityMask& mask = state.getMask();
  const std::vector<double>& values = state.getValues();

  PixelBuffer pixels(PixelDataType::UInt16, shape);
  for (size_t pixel = 0; pixel < shape.getPixelCount(); ++pixel) {
    pixels.setValue(pixel, values[pixel]);
  }

  return TileImage{std::move(pixels), mask};
}

} // namespace TesseraMosaic
