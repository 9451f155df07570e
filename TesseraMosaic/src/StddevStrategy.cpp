#include "PixelValueLists.h"

#include <TesseraMosaic/AccumulatorState.h>
#include <TesseraMosaic/StddevStrategy.h>
#include <TesseraRaster/PixelBuffer.h>
#include <TesseraRaster/PixelDataType.h>
#include <TesseraRaster/TileImage.h>
#include <TesseraRaster/ValidityMask.h>

#include <cmath>
#include <string>
#include <vector>

using namespace TesseraRaster;

namespace TesseraMosaic {

std::string StddevStrategy::getName() const { return "stddev"; }

void StddevStrategy::update(
    AccumulatorState& state,
    const PixelBuffer& pixels,
    const ValidityMask& mask) const {
  PixelValueLists::append(state, pixels, mask);
}

TileImage StddevStrategy::finalize(AccumulatorState& state) const {
  PixelValueLists::reduce(state, [](const std::vector<double>& list) {
    double mean = 0.0;
    for (double value : list) {
      mean += value;
    }
    mean /= double(list.size());

    double sumOfSquares = 0.0;
    for (double value : list) {
      sumOfSquares += (value - mean) * (value - mean);
    }
    return std::sqrt(sumOfSquares / double(list.size()));
  });

  return makeImage(state, PixelDataType::Float64);
}

} // namespace TesseraMosaic
