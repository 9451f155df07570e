#include <TesseraMosaic/AccumulatorState.h>
#include <TesseraRaster/PixelDataType.h>
#include <TesseraRaster/TileShape.h>

using namespace TesseraRaster;

namespace TesseraMosaic {

AccumulatorState::AccumulatorState(const TileShape& shape)
    : _shape(shape),
      _values(shape.getSampleCount(), 0.0),
      _mask(shape.height, shape.width, false),
      _dataType(),
      _usedAssets(),
      _complete(false),
      _pScratch() {}

void AccumulatorState::recordDataType(PixelDataType type) noexcept {
  if (this->_dataType) {
    this->_dataType = promotePixelDataTypes(*this->_dataType, type);
  } else {
    this->_dataType = type;
  }
}

} // namespace TesseraMosaic
