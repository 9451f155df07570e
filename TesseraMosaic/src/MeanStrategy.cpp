#include <TesseraMosaic/AccumulatorState.h>
#include <TesseraMosaic/MeanStrategy.h>
#include <TesseraRaster/PixelBuffer.h>
#include <TesseraRaster/PixelDataType.h>
#include <TesseraRaster/TileImage.h>
#include <TesseraRaster/ValidityMask.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using namespace TesseraRaster;

namespace TesseraMosaic {

namespace {

struct RunningSums : public MergeScratch {
  std::vector<double> sums;
  std::vector<uint32_t> counts;
};

} // namespace

MeanStrategy::MeanStrategy(const MeanOptions& options) noexcept
    : _options(options) {}

std::string MeanStrategy::getName() const { return "mean"; }

void MeanStrategy::update(
    AccumulatorState& state,
    const PixelBuffer& pixels,
    const ValidityMask& mask) const {
  RunningSums& scratch = state.getScratch<RunningSums>();
  const size_t pixelCount = state.getShape().getPixelCount();
  const size_t bands = size_t(state.getShape().bands);
  if (scratch.counts.empty()) {
    scratch.sums.assign(bands * pixelCount, 0.0);
    scratch.counts.assign(pixelCount, 0);
  }

  ValidityMask& merged = state.getMask();
  for (size_t pixel = 0; pixel < pixelCount; ++pixel) {
    if (!mask.isValid(pixel)) {
      continue;
    }

    for (size_t band = 0; band < bands; ++band) {
      const size_t sample = band * pixelCount + pixel;
      scratch.sums[sample] += pixels.getValue(sample);
    }
    ++scratch.counts[pixel];
    merged.setValid(pixel, true);
  }
}

TileImage MeanStrategy::finalize(AccumulatorState& state) const {
  const size_t pixelCount = state.getShape().getPixelCount();
  const size_t bands = size_t(state.getShape().bands);
  std::vector<double>& values = state.getValues();

  RunningSums& scratch = state.getScratch<RunningSums>();
  if (!scratch.counts.empty()) {
    for (size_t pixel = 0; pixel < pixelCount; ++pixel) {
      const uint32_t count = scratch.counts[pixel];
      if (count == 0) {
        continue;
      }
      for (size_t band = 0; band < bands; ++band) {
        const size_t sample = band * pixelCount + pixel;
        values[sample] = scratch.sums[sample] / double(count);
      }
    }
  }

  return makeImage(
      state,
      this->_options.enforceDataType ? state.getOutputDataType()
                                     : PixelDataType::Float64);
}

} // namespace TesseraMosaic
