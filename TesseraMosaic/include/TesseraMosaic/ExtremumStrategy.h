#pragma once

#include <TesseraMosaic/Library.h>
#include <TesseraMosaic/MergeStrategy.h>

#include <string>

namespace TesseraMosaic {

/**
 * @brief Which end of the value range an {@link ExtremumStrategy} keeps.
 */
enum class ExtremumKind { Highest, Lowest };

/**
 * @brief Options for an {@link ExtremumStrategy}.
 */
struct TESSERAMOSAIC_API ExtremumOptions {
  /**
   * @brief Whether to stop reading assets once every pixel is valid and
   * every sample already holds the highest (or lowest) value of the output
   * data type.
   *
   * No later asset could change such a tile. It is off by default, in which
   * case every asset is consulted.
   */
  bool stopAtTypeLimit = false;
};

/**
 * @brief Keeps, for each sample, the highest or lowest value among the
 * assets that have the pixel valid.
 *
 * Bands are compared independently, so the bands of one output pixel may
 * come from different assets. Use {@link LastBandExtremumStrategy} to keep
 * whole pixels.
 */
class TESSERAMOSAIC_API ExtremumStrategy final : public MergeStrategy {
public:
  explicit ExtremumStrategy(
      ExtremumKind kind,
      const ExtremumOptions& options = {}) noexcept;

  /**
   * @brief Returns `"highest"` or `"lowest"`.
   */
  std::string getName() const override;

  void update(
      AccumulatorState& state,
      const TesseraRaster::PixelBuffer& pixels,
      const TesseraRaster::ValidityMask& mask) const override;

  bool isComplete(const AccumulatorState& state) const override;

  ExtremumKind getKind() const noexcept { return this->_kind; }

  const ExtremumOptions& getOptions() const noexcept { return this->_options; }

private:
  bool isBetter(double candidate, double current) const noexcept {
    return this->_kind == ExtremumKind::Highest ? candidate > current
                                                : candidate < current;
  }

  ExtremumKind _kind;
  ExtremumOptions _options;
};

} // namespace TesseraMosaic
