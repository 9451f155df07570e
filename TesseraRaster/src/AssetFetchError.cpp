#include <TesseraRaster/AssetFetchError.h>

namespace TesseraRaster {

const char* getName(AssetFetchErrorKind kind) noexcept {
  switch (kind) {
  case AssetFetchErrorKind::Timeout:
    return "timeout";
  case AssetFetchErrorKind::DecodeError:
    return "decode-error";
  case AssetFetchErrorKind::NotFound:
    return "not-found";
  case AssetFetchErrorKind::GenericIO:
    return "generic-io";
  case AssetFetchErrorKind::DimensionMismatch:
    return "dimension-mismatch";
  case AssetFetchErrorKind::Canceled:
    return "canceled";
  }
  return "unknown";
}

} // namespace TesseraRaster
