#pragma once

#include <TesseraMosaic/AccumulatorState.h>
#include <TesseraRaster/PixelBuffer.h>
#include <TesseraRaster/ValidityMask.h>

#include <cstddef>
#include <vector>

namespace TesseraMosaic {

/**
 * @brief Every valid value seen so far, for each sample of the tile.
 *
 * The lists grow by at most one value per consulted asset.
 */
struct PixelValueLists : public MergeScratch {
  std::vector<std::vector<double>> samples;

  /**
   * @brief Appends the samples of every pixel that `mask` has valid, and
   * marks those pixels valid in the state.
   */
  static void append(
      AccumulatorState& state,
      const TesseraRaster::PixelBuffer& pixels,
      const TesseraRaster::ValidityMask& mask) {
    PixelValueLists& lists = state.getScratch<PixelValueLists>();
    const size_t pixelCount = state.getShape().getPixelCount();
    const size_t bands = size_t(state.getShape().bands);
    if (lists.samples.empty()) {
      lists.samples.resize(bands * pixelCount);
    }

    TesseraRaster::ValidityMask& merged = state.getMask();
    for (size_t pixel = 0; pixel < pixelCount; ++pixel) {
      if (!mask.isValid(pixel)) {
        continue;
      }
      for (size_t band = 0; band < bands; ++band) {
        const size_t sample = band * pixelCount + pixel;
        lists.samples[sample].push_back(pixels.getValue(sample));
      }
      merged.setValid(pixel, true);
    }
  }

  /**
   * @brief Replaces the state's value of each sample that has at least one
   * value in its list with `statistic(list)`.
   */
  template <typename Statistic>
  static void reduce(AccumulatorState& state, Statistic&& statistic) {
    PixelValueLists& lists = state.getScratch<PixelValueLists>();
    std::vector<double>& values = state.getValues();
    for (size_t sample = 0; sample < lists.samples.size(); ++sample) {
      std::vector<double>& list = lists.samples[sample];
      if (!list.empty()) {
        values[sample] = statistic(list);
      }
    }
  }
};

} // namespace TesseraMosaic
