#pragma once

#include <TesseraRaster/Library.h>

#include <string>

namespace TesseraRaster {

/**
 * @brief Why one asset could not contribute to a tile.
 */
enum class AssetFetchErrorKind {
  /**
   * @brief The read did not finish within the configured timeout.
   */
  Timeout,

  /**
   * @brief The asset was found but its pixels could not be decoded.
   */
  DecodeError,

  /**
   * @brief The asset does not exist, or does not cover the tile.
   */
  NotFound,

  /**
   * @brief Any other I/O or reader failure, including exceptions thrown by
   * the reader.
   */
  GenericIO,

  /**
   * @brief The reader produced pixels whose shape differs from the requested
   * tile shape.
   */
  DimensionMismatch,

  /**
   * @brief The read was dropped before it started, because the task
   * processor that would have run it no longer exists.
   */
  Canceled
};

/**
 * @brief Gets a short lowercase name for the kind, such as `"not-found"`.
 */
TESSERARASTER_API const char* getName(AssetFetchErrorKind kind) noexcept;

/**
 * @brief Details of a failed asset read.
 */
struct TESSERARASTER_API AssetFetchError final {
  /**
   * @brief The category of the failure.
   */
  AssetFetchErrorKind kind = AssetFetchErrorKind::GenericIO;

  /**
   * @brief A human-readable explanation.
   */
  std::string message;
};

} // namespace TesseraRaster
