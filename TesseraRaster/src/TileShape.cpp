#include <TesseraRaster/TileShape.h>

#include <spdlog/fmt/fmt.h>

#include <string>

namespace TesseraRaster {

std::string TileShape::toString() const {
  return fmt::format("{}x{}x{}", this->bands, this->height, this->width);
}

} // namespace TesseraRaster
