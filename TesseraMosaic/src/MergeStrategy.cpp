#include <TesseraMosaic/AccumulatorState.h>
#include <TesseraMosaic/MergeStrategy.h>
#include <TesseraRaster/PixelBuffer.h>
#include <TesseraRaster/PixelDataType.h>
#include <TesseraRaster/TileImage.h>
#include <TesseraRaster/TileShape.h>
#include <TesseraRaster/ValidityMask.h>

#include <cstddef>
#include <utility>
#include <vector>

using namespace TesseraRaster;

namespace TesseraMosaic {

void MergeStrategy::initialize(AccumulatorState& /* state */) const {}

bool MergeStrategy::isComplete(const AccumulatorState& /* state */) const {
  return false;
}

TileImage MergeStrategy::finalize(AccumulatorState& state) const {
  return makeImage(state, state.getOutputDataType());
}

/*static*/ void MergeStrategy::copyPixel(
    AccumulatorState& state,
    const PixelBuffer& pixels,
    size_t pixelIndex) {
  std::vector<double>& values = state.getValues();
  const size_t pixelCount = state.getShape().getPixelCount();
  for (size_t band = 0; band < size_t(state.getShape().bands); ++band) {
    const size_t sample = band * pixelCount + pixelIndex;
    values[sample] = pixels.getValue(sample);
  }
}

/*static*/ TileImage
MergeStrategy::makeImage(const AccumulatorState& state, PixelDataType type) {
  const TileShape& shape = state.getShape();
  const ValidityMask& mask = state.getMask();
  const std::vector<double>& values = state.getValues();
  const size_t pixelCount = shape.getPixelCount();

  PixelBuffer pixels(type, shape);
  for (size_t band = 0; band < size_t(shape.bands); ++band) {
    for (size_t pixel = 0; pixel < pixelCount; ++pixel) {
      if (mask.isValid(pixel)) {
        const size_t sample = band * pixelCount + pixel;
        pixels.setValue(sample, values[sample]);
      }
    }
  }

  return TileImage{std::move(pixels), mask};
}

} // namespace TesseraMosaic
