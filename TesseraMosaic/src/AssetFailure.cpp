#include <TesseraMosaic/AssetFailure.h>
#include <TesseraRaster/AssetFetchError.h>

#include <spdlog/fmt/fmt.h>

#include <string>

namespace TesseraMosaic {

std::string AssetFailure::toString() const {
  if (this->error.message.empty()) {
    return fmt::format(
        "{}: {}",
        this->assetId,
        TesseraRaster::getName(this->error.kind));
  }

  return fmt::format(
      "{}: {}: {}",
      this->assetId,
      TesseraRaster::getName(this->error.kind),
      this->error.message);
}

} // namespace TesseraMosaic
