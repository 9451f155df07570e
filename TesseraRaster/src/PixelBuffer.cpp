#include <TesseraRaster/PixelBuffer.h>
#include <TesseraRaster/PixelDataType.h>
#include <TesseraRaster/TileShape.h>
#include <TesseraUtility/Assert.h>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace TesseraRaster {

namespace {

template <typename T> T convertSample(double value) {
  if constexpr (std::is_floating_point_v<T>) {
    if (std::isnan(value)) {
      return static_cast<T>(value);
    }
    return static_cast<T>(std::clamp(
        value,
        double(std::numeric_limits<T>::lowest()),
        double(std::numeric_limits<T>::max())));
  } else {
    if (std::isnan(value)) {
      return T(0);
    }
    return static_cast<T>(std::trunc(std::clamp(
        value,
        double(std::numeric_limits<T>::lowest()),
        double(std::numeric_limits<T>::max()))));
  }
}

} // namespace

PixelBuffer::PixelBuffer() noexcept
    : _dataType(PixelDataType::UInt8), _shape{0, 0, 0}, _data() {}

PixelBuffer::PixelBuffer(PixelDataType dataType, const TileShape& shape)
    : _dataType(dataType),
      _shape(shape),
      _data(shape.getSampleCount() * getSizeInBytes(dataType)) {}

PixelBuffer::PixelBuffer(
    PixelDataType dataType,
    const TileShape& shape,
    std::vector<std::byte>&& data)
    : _dataType(dataType), _shape(shape), _data(std::move(data)) {
  const size_t expectedSize =
      shape.getSampleCount() * getSizeInBytes(dataType);
  if (this->_data.size() != expectedSize) {
    throw std::invalid_argument(fmt::format(
        "A {} pixel buffer of shape {} needs {} bytes, but {} were given.",
        getName(dataType),
        shape.toString(),
        expectedSize,
        this->_data.size()));
  }
}

PixelBuffer PixelBuffer::clone() const {
  std::vector<std::byte> data = this->_data;
  return PixelBuffer(this->_dataType, this->_shape, std::move(data));
}

double PixelBuffer::getValue(size_t sampleIndex) const {
  TESSERA_ASSERT(sampleIndex < this->_shape.getSampleCount());
  return dispatchPixelDataType(this->_dataType, [&](auto sample) {
    using T = decltype(sample);
    std::memcpy(
        &sample,
        this->_data.data() + sampleIndex * sizeof(T),
        sizeof(T));
    return double(sample);
  });
}

void PixelBuffer::setValue(size_t sampleIndex, double value) {
  TESSERA_ASSERT(sampleIndex < this->_shape.getSampleCount());
  dispatchPixelDataType(this->_dataType, [&](auto sample) {
    using T = decltype(sample);
    sample = convertSample<T>(value);
    std::memcpy(
        this->_data.data() + sampleIndex * sizeof(T),
        &sample,
        sizeof(T));
  });
}

} // namespace TesseraRaster
