#include <TesseraRaster/TileID.h>

#include <spdlog/fmt/fmt.h>

#include <string>

namespace TesseraRaster {

std::string TileID::toString() const {
  return fmt::format("{}/{}/{}", this->level, this->x, this->y);
}

} // namespace TesseraRaster
