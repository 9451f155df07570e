#pragma once

#include <TesseraRaster/Library.h>

#include <cstdint>
#include <string>

namespace TesseraRaster {

/**
 * @brief Identifies a tile of a quadtree tiling scheme, such as the web
 * mercator grid, by its zoom level and column/row at that level.
 */
struct TESSERARASTER_API TileID final {
  /**
   * @brief Creates a new instance.
   *
   * @param level_ The zoom level, with 0 being the root.
   * @param x_ The column at that level.
   * @param y_ The row at that level.
   */
  constexpr TileID(uint32_t level_, uint32_t x_, uint32_t y_) noexcept
      : level(level_), x(x_), y(y_) {}

  constexpr bool operator==(const TileID& other) const noexcept {
    return this->level == other.level && this->x == other.x &&
           this->y == other.y;
  }

  constexpr bool operator!=(const TileID& other) const noexcept {
    return !(*this == other);
  }

  /**
   * @brief Formats the ID as `"level/x/y"`.
   */
  std::string toString() const;

  /**
   * @brief The zoom level.
   */
  uint32_t level;

  /**
   * @brief The column.
   */
  uint32_t x;

  /**
   * @brief The row.
   */
  uint32_t y;
};

} // namespace TesseraRaster
