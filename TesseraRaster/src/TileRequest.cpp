#include <TesseraRaster/TileRequest.h>

namespace TesseraRaster {

const char* getName(ResamplingMethod method) noexcept {
  switch (method) {
  case ResamplingMethod::Nearest:
    return "nearest";
  case ResamplingMethod::Bilinear:
    return "bilinear";
  case ResamplingMethod::Cubic:
    return "cubic";
  case ResamplingMethod::CubicSpline:
    return "cubic_spline";
  case ResamplingMethod::Lanczos:
    return "lanczos";
  case ResamplingMethod::Average:
    return "average";
  case ResamplingMethod::Mode:
    return "mode";
  case ResamplingMethod::Gauss:
    return "gauss";
  case ResamplingMethod::Rms:
    return "rms";
  }
  return "unknown";
}

} // namespace TesseraRaster
