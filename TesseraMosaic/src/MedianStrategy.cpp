#include "PixelValueLists.h"

#include <TesseraMosaic/AccumulatorState.h>
#include <TesseraMosaic/MedianStrategy.h>
#include <TesseraRaster/PixelBuffer.h>
#include <TesseraRaster/PixelDataType.h>
#include <TesseraRaster/TileImage.h>
#include <TesseraRaster/ValidityMask.h>

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

using namespace TesseraRaster;

namespace TesseraMosaic {

MedianStrategy::MedianStrategy(const MeanOptions& options) noexcept
    : _options(options) {}

std::string MedianStrategy::getName() const { return "median"; }

void MedianStrategy::update(
    AccumulatorState& state,
    const PixelBuffer& pixels,
    const ValidityMask& mask) const {
  PixelValueLists::append(state, pixels, mask);
}

TileImage MedianStrategy::finalize(AccumulatorState& state) const {
  PixelValueLists::reduce(state, [](std::vector<double>& list) {
    const size_t middle = list.size() / 2;
    const auto middleIt = list.begin() + std::ptrdiff_t(middle);
    std::nth_element(list.begin(), middleIt, list.end());
    const double upper = *middleIt;
    if (list.size() % 2 == 1) {
      return upper;
    }

    // The lower middle value is the largest of the lower half.
    const double lower = *std::max_element(list.begin(), middleIt);
    return (lower + upper) / 2.0;
  });

  return makeImage(
      state,
      this->_options.enforceDataType ? state.getOutputDataType()
                                     : PixelDataType::Float64);
}

} // namespace TesseraMosaic
