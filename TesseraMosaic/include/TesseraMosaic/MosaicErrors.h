#pragma once

#include <TesseraMosaic/AssetFailure.h>
#include <TesseraMosaic/Library.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace TesseraMosaic {

/**
 * @brief Thrown when a mosaic is requested with settings that can never
 * work, such as fewer than one worker or an unknown merge strategy name.
 */
class TESSERAMOSAIC_API ConfigurationError : public std::invalid_argument {
public:
  explicit ConfigurationError(const std::string& message);
};

/**
 * @brief Thrown when no asset contributed a single valid pixel to a tile.
 *
 * This happens when the asset list is empty, when every read failed, or when
 * every successful read was entirely masked out. The individual failures are
 * available for diagnostics.
 */
class TESSERAMOSAIC_API NoValidAssetError : public std::runtime_error {
public:
  /**
   * @brief Creates a new instance.
   *
   * @param message The explanation returned by `what()`.
   * @param failures Every asset that failed, in asset list order.
   */
  NoValidAssetError(
      const std::string& message,
      std::vector<AssetFailure> failures);

  /**
   * @brief Gets every asset that failed, in asset list order.
   */
  const std::vector<AssetFailure>& getFailures() const noexcept {
    return this->_failures;
  }

private:
  std::vector<AssetFailure> _failures;
};

} // namespace TesseraMosaic
