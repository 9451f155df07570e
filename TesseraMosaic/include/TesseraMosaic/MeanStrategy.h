#pragma once

#include <TesseraMosaic/Library.h>
#include <TesseraMosaic/MergeStrategy.h>

#include <string>

namespace TesseraMosaic {

/**
 * @brief Options for a {@link MeanStrategy} or a {@link MedianStrategy}.
 */
struct TESSERAMOSAIC_API MeanOptions {
  /**
   * @brief Whether to write the statistic in the assets' data type.
   *
   * When `true`, the result is converted to the promoted data type of the
   * assets, truncating toward zero for integer types. When `false`, the
   * result is `Float64`.
   */
  bool enforceDataType = true;
};

/**
 * @brief Averages, for each sample, the values of every asset that has the
 * pixel valid. Every asset is consulted.
 */
class TESSERAMOSAIC_API MeanStrategy final : public MergeStrategy {
public:
  explicit MeanStrategy(const MeanOptions& options = {}) noexcept;

  std::string getName() const override;

  void update(
      AccumulatorState& state,
      const TesseraRaster::PixelBuffer& pixels,
      const TesseraRaster::ValidityMask& mask) const override;

  TesseraRaster::TileImage finalize(AccumulatorState& state) const override;

  const MeanOptions& getOptions() const noexcept { return this->_options; }

private:
  MeanOptions _options;
};

} // namespace TesseraMosaic
