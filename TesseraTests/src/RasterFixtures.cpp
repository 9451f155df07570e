#include <TesseraRaster/PixelBuffer.h>
#include <TesseraRaster/PixelDataType.h>
#include <TesseraRaster/TileImage.h>
#include <TesseraRaster/TileShape.h>
#include <TesseraRaster/ValidityMask.h>
#include <TesseraTests/RasterFixtures.h>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace TesseraRaster;

namespace TesseraTests {

TileImage makeConstantImage(
    const TileShape& shape,
    double value,
    PixelDataType dataType,
    bool valid) {
  PixelBuffer pixels(dataType, shape);
  for (size_t i = 0; i < shape.getSampleCount(); ++i) {
    pixels.setValue(i, value);
  }
  return TileImage{
      std::move(pixels),
      ValidityMask(shape.height, shape.width, valid)};
}

TileImage makeImage(
    const TileShape& shape,
    const std::vector<double>& samples,
    std::vector<uint8_t> mask,
    PixelDataType dataType) {
  if (samples.size() != shape.getSampleCount()) {
    throw std::invalid_argument("Wrong number of samples for the shape.");
  }

  PixelBuffer pixels(dataType, shape);
  for (size_t i = 0; i < samples.size(); ++i) {
    pixels.setValue(i, samples[i]);
  }
  return TileImage{
      std::move(pixels),
      ValidityMask(shape.height, shape.width, std::move(mask))};
}

TileImage cloneImage(const TileImage& image) {
  return TileImage{image.pixels.clone(), image.mask};
}

} // namespace TesseraTests
