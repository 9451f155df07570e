#pragma once

#include <TesseraMosaic/AccumulatorState.h>
#include <TesseraMosaic/Library.h>
#include <TesseraRaster/PixelBuffer.h>
#include <TesseraRaster/PixelDataType.h>
#include <TesseraRaster/TileImage.h>
#include <TesseraRaster/ValidityMask.h>

#include <cstddef>
#include <string>

namespace TesseraMosaic {

/**
 * @brief Decides, pixel by pixel, how the values of overlapping assets are
 * combined into one mosaic tile.
 *
 * A strategy is a read-only configuration object. Everything that changes
 * during an assembly lives in the {@link AccumulatorState}, so one instance
 * can serve any number of concurrent assemblies.
 *
 * For each assembly the {@link MosaicAssembler} calls {@link initialize}
 * once, then {@link update} for each successfully read asset in asset list
 * order, checking {@link isComplete} after each one, and finally
 * {@link finalize}.
 *
 * Implementations must never mark a pixel valid in the state unless the
 * incoming mask is valid there, and must never mark a valid pixel invalid
 * again.
 */
class TESSERAMOSAIC_API MergeStrategy {
public:
  virtual ~MergeStrategy() noexcept = default;

  /**
   * @brief Gets the name the strategy is registered under, such as
   * `"first"`.
   */
  virtual std::string getName() const = 0;

  /**
   * @brief Prepares a fresh state before the first asset is folded in.
   *
   * The default implementation does nothing.
   */
  virtual void initialize(AccumulatorState& state) const;

  /**
   * @brief Folds one asset into the state.
   *
   * Before this is called, the assembler has checked that `pixels` and
   * `mask` have the tile's shape and has recorded the data type of `pixels`
   * in the state.
   *
   * @param state The state to update.
   * @param pixels The asset's pixels.
   * @param mask The asset's valid pixels.
   */
  virtual void update(
      AccumulatorState& state,
      const TesseraRaster::PixelBuffer& pixels,
      const TesseraRaster::ValidityMask& mask) const = 0;

  /**
   * @brief Returns `true` if folding in more assets can no longer change
   * the result.
   *
   * The default implementation returns `false`, so every asset is consulted.
   */
  virtual bool isComplete(const AccumulatorState& state) const;

  /**
   * @brief Produces the merged tile.
   *
   * The default implementation writes {@link AccumulatorState::getValues}
   * in the state's output data type, as {@link makeImage} does.
   */
  virtual TesseraRaster::TileImage finalize(AccumulatorState& state) const;

protected:
  /**
   * @brief Copies every band of one pixel of `pixels` into the state's
   * values.
   */
  static void copyPixel(
      AccumulatorState& state,
      const TesseraRaster::PixelBuffer& pixels,
      size_t pixelIndex);

  /**
   * @brief Writes the state's values as a tile of the given data type, with
   * the state's mask. Samples of invalid pixels are zero.
   */
  static TesseraRaster::TileImage
  makeImage(const AccumulatorState& state, TesseraRaster::PixelDataType type);
};

} // namespace TesseraMosaic
