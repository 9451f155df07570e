#include <TesseraRaster/ValidityMask.h>

#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

namespace TesseraRaster {

ValidityMask::ValidityMask() noexcept
    : _height(0), _width(0), _values(), _validCount(0) {}

ValidityMask::ValidityMask(int32_t height, int32_t width, bool valid)
    : _height(height),
      _width(width),
      _values(size_t(height) * size_t(width), uint8_t(valid ? 1 : 0)),
      _validCount(valid ? this->_values.size() : 0) {}

ValidityMask::ValidityMask(
    int32_t height,
    int32_t width,
    std::vector<uint8_t>&& values)
    : _height(height),
      _width(width),
      _values(std::move(values)),
      _validCount(0) {
  if (this->_values.size() != size_t(height) * size_t(width)) {
    throw std::invalid_argument(fmt::format(
        "A {}x{} validity mask needs {} values, but {} were given.",
        height,
        width,
        size_t(height) * size_t(width),
        this->_values.size()));
  }

  for (uint8_t& value : this->_values) {
    if (value != 0) {
      value = 1;
      ++this->_validCount;
    }
  }
}

void ValidityMask::setValid(size_t pixelIndex, bool valid) noexcept {
  TESSERA_ASSERT(pixelIndex < this->_values.size());
  uint8_t& current = this->_values[pixelIndex];
  if (valid && current == 0) {
    current = 1;
    ++this->_validCount;
  } else if (!valid && current != 0) {
    current = 0;
    --this->_validCount;
  }
}

} // namespace TesseraRaster
