#pragma once

#include <TesseraMosaic/Library.h>
#include <TesseraRaster/PixelDataType.h>
#include <TesseraRaster/TileShape.h>
#include <TesseraRaster/ValidityMask.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace TesseraMosaic {

/**
 * @brief Per-request working data that a {@link MergeStrategy} keeps in an
 * {@link AccumulatorState}, such as running sums or value lists.
 */
class TESSERAMOSAIC_API MergeScratch {
public:
  virtual ~MergeScratch() noexcept = default;
};

/**
 * @brief The merged tile while a mosaic is being assembled.
 *
 * One instance is created for each call to
 * {@link MosaicAssembler::assemble} and is only ever touched by the thread
 * running that call. Merge strategies read and update it as each asset is
 * folded in.
 */
class TESSERAMOSAIC_API AccumulatorState final {
public:
  /**
   * @brief Creates an empty state for a tile of the given shape. Every
   * sample is zero and every pixel is invalid.
   */
  explicit AccumulatorState(const TesseraRaster::TileShape& shape);

  AccumulatorState(AccumulatorState&&) noexcept = default;
  AccumulatorState& operator=(AccumulatorState&&) noexcept = default;
  AccumulatorState(const AccumulatorState&) = delete;
  AccumulatorState& operator=(const AccumulatorState&) = delete;

  /**
   * @brief Gets the shape of the tile being assembled.
   */
  const TesseraRaster::TileShape& getShape() const noexcept {
    return this->_shape;
  }

  /**
   * @brief Gets the merged sample values, indexed like a
   * {@link TesseraRaster::PixelBuffer} of the tile's shape.
   */
  std::vector<double>& getValues() noexcept { return this->_values; }

  /** @copydoc getValues */
  const std::vector<double>& getValues() const noexcept {
    return this->_values;
  }

  /**
   * @brief Gets the merged mask. A pixel that has been marked valid must
   * never be marked invalid again.
   */
  TesseraRaster::ValidityMask& getMask() noexcept { return this->_mask; }

  /** @copydoc getMask */
  const TesseraRaster::ValidityMask& getMask() const noexcept {
    return this->_mask;
  }

  /**
   * @brief Widens the output data type so that it can hold values of `type`.
   */
  void recordDataType(TesseraRaster::PixelDataType type) noexcept;

  /**
   * @brief Gets the narrowest type that holds the values of every asset
   * folded in so far, or `std::nullopt` if there are none yet.
   */
  std::optional<TesseraRaster::PixelDataType> getDataType() const noexcept {
    return this->_dataType;
  }

  /**
   * @brief Gets the data type to write the merged tile in. This is
   * {@link getDataType}, or `UInt8` before any asset has been folded in.
   */
  TesseraRaster::PixelDataType getOutputDataType() const noexcept {
    return this->_dataType.value_or(TesseraRaster::PixelDataType::UInt8);
  }

  /**
   * @brief Gets the assets folded in so far, in the order they were folded
   * in.
   */
  const std::vector<std::string>& getUsedAssets() const noexcept {
    return this->_usedAssets;
  }

  void addUsedAsset(const std::string& assetId) {
    this->_usedAssets.emplace_back(assetId);
  }

  /**
   * @brief Returns `true` once the assembler has decided that no more assets
   * are needed.
   */
  bool isComplete() const noexcept { return this->_complete; }

  void markComplete() noexcept { this->_complete = true; }

  /**
   * @brief Gets the scratch data of the running strategy, creating it on
   * first use.
   *
   * @tparam T The strategy's scratch type. It must be default-constructible
   * and the same type on every call for a given state.
   */
  template <typename T> T& getScratch() {
    if (!this->_pScratch) {
      this->_pScratch = std::make_unique<T>();
    }

    T* pScratch = dynamic_cast<T*>(this->_pScratch.get());
    if (!pScratch) {
      throw std::logic_error(
          "The accumulator already holds scratch data of another type.");
    }
    return *pScratch;
  }

private:
  TesseraRaster::TileShape _shape;
  std::vector<double> _values;
  TesseraRaster::ValidityMask _mask;
  std::optional<TesseraRaster::PixelDataType> _dataType;
  std::vector<std::string> _usedAssets;
  bool _complete;
  std::unique_ptr<MergeScratch> _pScratch;
};

} // namespace TesseraMosaic
