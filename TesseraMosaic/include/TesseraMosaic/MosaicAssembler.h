#pragma once

#include <TesseraMosaic/Library.h>
#include <TesseraMosaic/MergeStrategy.h>
#include <TesseraMosaic/MergeStrategyRegistry.h>
#include <TesseraMosaic/MosaicOptions.h>
#include <TesseraMosaic/MosaicResult.h>

#include <spdlog/fwd.h>

#include <memory>
#include <string>
#include <vector>

namespace TesseraAsync {
class ITaskProcessor;
}

namespace TesseraRaster {
class IAssetReader;
struct TileRequest;
} // namespace TesseraRaster

namespace TesseraMosaic {

/**
 * @brief Builds a mosaic tile from a list of overlapping assets.
 *
 * The assets are read concurrently by a {@link TaskScheduler} and folded
 * into a {@link MergeStrategy} one at a time, in asset list order, so the
 * result does not depend on which read finishes first. Reading stops early
 * when the strategy is complete or when
 * {@link MosaicOptions::maximumAssetsUsed} assets have been used.
 *
 * Assets that fail to read, or that produce a tile of the wrong shape, are
 * skipped and reported in {@link MosaicResult::failures}. The assembly
 * itself only fails if no asset contributed a single valid pixel.
 *
 * An assembler holds no per-tile state. `assemble` may be called from
 * several threads at once.
 */
class TESSERAMOSAIC_API MosaicAssembler final {
public:
  /**
   * @brief Creates a new assembler.
   *
   * @param pTaskProcessor Runs the asset reads.
   * @param pLogger Receives warnings about failed assets.
   * @param registry The strategies that may be selected by name.
   * @throws ConfigurationError If the task processor or logger is null.
   */
  MosaicAssembler(
      const std::shared_ptr<TesseraAsync::ITaskProcessor>& pTaskProcessor,
      const std::shared_ptr<spdlog::logger>& pLogger,
      MergeStrategyRegistry registry = MergeStrategyRegistry::createDefault());

  /**
   * @brief Creates a new assembler that logs to spdlog's default logger and
   * knows the built-in strategies.
   */
  explicit MosaicAssembler(
      const std::shared_ptr<TesseraAsync::ITaskProcessor>& pTaskProcessor);

  /**
   * @brief Assembles one tile.
   *
   * @param assets The candidate assets, in priority order.
   * @param request The tile to build. Its shape sizes the result.
   * @param pReader Reads one asset. It may be called from several threads
   * at once.
   * @param strategy Combines the assets.
   * @param options Concurrency and limits.
   * @return The tile, the assets that went into it, and the assets that
   * failed.
   * @throws ConfigurationError If the options or the tile shape are
   * invalid, or the reader is null.
   * @throws NoValidAssetError If no asset contributed a valid pixel.
   */
  MosaicResult assemble(
      const std::vector<std::string>& assets,
      const TesseraRaster::TileRequest& request,
      const std::shared_ptr<const TesseraRaster::IAssetReader>& pReader,
      const MergeStrategy& strategy,
      const MosaicOptions& options = {}) const;

  /**
   * @brief Assembles one tile with a strategy looked up by name.
   *
   * @throws ConfigurationError If no strategy is registered under
   * `strategyName`.
   */
  MosaicResult assemble(
      const std::vector<std::string>& assets,
      const TesseraRaster::TileRequest& request,
      const std::shared_ptr<const TesseraRaster::IAssetReader>& pReader,
      const std::string& strategyName,
      const MosaicOptions& options = {}) const;

  /**
   * @brief Gets the strategies that may be selected by name.
   */
  const MergeStrategyRegistry& getRegistry() const noexcept {
    return this->_registry;
  }

  /**
   * @brief Gets the logger that assembly problems are reported to.
   */
  const std::shared_ptr<spdlog::logger>& getLogger() const noexcept {
    return this->_pLogger;
  }

private:
  std::shared_ptr<TesseraAsync::ITaskProcessor> _pTaskProcessor;
  std::shared_ptr<spdlog::logger> _pLogger;
  MergeStrategyRegistry _registry;
};

} // namespace TesseraMosaic
