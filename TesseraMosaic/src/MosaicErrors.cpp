#include <TesseraMosaic/AssetFailure.h>
#include <TesseraMosaic/MosaicErrors.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace TesseraMosaic {

ConfigurationError::ConfigurationError(const std::string& message)
    : std::invalid_argument(message) {}

NoValidAssetError::NoValidAssetError(
    const std::string& message,
    std::vector<AssetFailure> failures)
    : std::runtime_error(message), _failures(std::move(failures)) {}

} // namespace TesseraMosaic
