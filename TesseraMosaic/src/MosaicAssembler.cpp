#include <TesseraAsync/ITaskProcessor.h>
#include <TesseraMosaic/AccumulatorState.h>
#include <TesseraMosaic/AssetFailure.h>
#include <TesseraMosaic/AssetResult.h>
#include <TesseraMosaic/MergeStrategy.h>
#include <TesseraMosaic/MergeStrategyRegistry.h>
#include <TesseraMosaic/MosaicAssembler.h>
#include <TesseraMosaic/MosaicErrors.h>
#include <TesseraMosaic/MosaicOptions.h>
#include <TesseraMosaic/MosaicResult.h>
#include <TesseraMosaic/TaskScheduler.h>
#include <TesseraRaster/AssetFetchError.h>
#include <TesseraRaster/IAssetReader.h>
#include <TesseraRaster/TileImage.h>
#include <TesseraRaster/TileRequest.h>
#include <TesseraRaster/TileShape.h>
#include <TesseraRaster/ValidityMask.h>
#include <TesseraUtility/ErrorList.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace TesseraAsync;
using namespace TesseraRaster;
using namespace TesseraUtility;

namespace TesseraMosaic {

namespace {

void validateOptions(const TileRequest& request, const MosaicOptions& options) {
  if (!request.shape.isValid()) {
    throw ConfigurationError(fmt::format(
        "The requested tile shape {} must have at least one band, row and "
        "column.",
        request.shape.toString()));
  }

  if (options.maximumAssetsUsed && *options.maximumAssetsUsed == 0) {
    throw ConfigurationError("maximumAssetsUsed must be at least 1 when set.");
  }
}

std::string describeShape(const TileImage& image) {
  return fmt::format(
      "pixels of shape {} and a {}x{} mask",
      image.pixels.getShape().toString(),
      image.mask.getHeight(),
      image.mask.getWidth());
}

// Collects the assets that could not be used during one assembly.
class FailureRecorder {
public:
  explicit FailureRecorder(const MosaicOptions& options) : _options(options) {}

  void record(const std::string& assetId, AssetFetchError&& error) {
    AssetFailure& failure =
        this->failures.emplace_back(AssetFailure{assetId, std::move(error)});
    this->errorList.emplaceWarning(failure.toString());
    if (this->_options.assetFailureCallback) {
      this->_options.assetFailureCallback(failure);
    }
  }

  std::vector<AssetFailure> failures;
  ErrorList errorList;

private:
  const MosaicOptions& _options;
};

} // namespace

MosaicAssembler::MosaicAssembler(
    const std::shared_ptr<ITaskProcessor>& pTaskProcessor,
    const std::shared_ptr<spdlog::logger>& pLogger,
    MergeStrategyRegistry registry)
    : _pTaskProcessor(pTaskProcessor),
      _pLogger(pLogger),
      _registry(std::move(registry)) {
  if (!this->_pTaskProcessor) {
    throw ConfigurationError("A task processor is required to read assets.");
  }
  if (!this->_pLogger) {
    throw ConfigurationError("A logger is required.");
  }
}

MosaicAssembler::MosaicAssembler(
    const std::shared_ptr<ITaskProcessor>& pTaskProcessor)
    : MosaicAssembler(pTaskProcessor, spdlog::default_logger()) {}

MosaicResult MosaicAssembler::assemble(
    const std::vector<std::string>& assets,
    const TileRequest& request,
    const std::shared_ptr<const IAssetReader>& pReader,
    const std::string& strategyName,
    const MosaicOptions& options) const {
  std::shared_ptr<const MergeStrategy> pStrategy =
      this->_registry.create(strategyName);
  return this->assemble(assets, request, pReader, *pStrategy, options);
}

MosaicResult MosaicAssembler::assemble(
    const std::vector<std::string>& assets,
    const TileRequest& request,
    const std::shared_ptr<const IAssetReader>& pReader,
    const MergeStrategy& strategy,
    const MosaicOptions& options) const {
  validateOptions(request, options);

  TaskScheduler scheduler(
      this->_pTaskProcessor,
      TaskSchedulerOptions{
          options.maximumSimultaneousReads,
          options.assetReadTimeout});

  if (!pReader) {
    throw ConfigurationError("An asset reader is required to read assets.");
  }

  const std::string tileName = request.tileID.toString();
  const TileShape& shape = request.shape;

  if (assets.empty()) {
    const std::string message = fmt::format(
        "Cannot assemble tile {} because no assets were given.",
        tileName);
    SPDLOG_LOGGER_ERROR(this->_pLogger, message);
    throw NoValidAssetError(message, {});
  }

  AccumulatorState state(shape);
  strategy.initialize(state);

  // The union of the masks of every asset folded in. No strategy may mark a
  // pixel outside of it valid.
  ValidityMask coverage(shape.height, shape.width, false);

  FailureRecorder recorder(options);
  size_t consulted = 0;

  AssetResultStream stream = scheduler.run(assets, pReader, request);
  while (std::optional<AssetResult> maybeResult = stream.next()) {
    AssetResult& result = *maybeResult;
    ++consulted;

    if (!result.succeeded()) {
      recorder.record(result.assetId, std::move(result.image.error()));
      continue;
    }

    TileImage& image = *result.image;
    if (!image.matches(shape)) {
      recorder.record(
          result.assetId,
          AssetFetchError{
              AssetFetchErrorKind::DimensionMismatch,
              fmt::format(
                  "expected a tile of shape {} but the reader returned {}",
                  shape.toString(),
                  describeShape(image))});
      continue;
    }

    state.recordDataType(image.pixels.getDataType());
    strategy.update(state, image.pixels, image.mask);
    state.addUsedAsset(result.assetId);

    const size_t pixelCount = coverage.getPixelCount();
    for (size_t pixel = 0; pixel < pixelCount; ++pixel) {
      if (image.mask.isValid(pixel)) {
        coverage.setValid(pixel, true);
      }
    }

    if (strategy.isComplete(state)) {
      state.markComplete();
      SPDLOG_LOGGER_DEBUG(
          this->_pLogger,
          "Merge strategy \"{}\" completed tile {} after consulting {} of {} "
          "assets.",
          strategy.getName(),
          tileName,
          consulted,
          assets.size());
      break;
    }

    if (options.maximumAssetsUsed &&
        state.getUsedAssets().size() >= *options.maximumAssetsUsed) {
      state.markComplete();
      SPDLOG_LOGGER_DEBUG(
          this->_pLogger,
          "Stopped reading assets for tile {} after using {} of {} assets.",
          tileName,
          state.getUsedAssets().size(),
          assets.size());
      break;
    }
  }

  stream.cancel();

  recorder.errorList.logWarning(
      this->_pLogger,
      fmt::format(
          "{} of {} consulted assets could not be used for tile {}",
          recorder.failures.size(),
          consulted,
          tileName));

  TileImage merged = strategy.finalize(state);
  const TileShape& mergedShape = merged.pixels.getShape();
  if (mergedShape.height != shape.height || mergedShape.width != shape.width ||
      !merged.mask.matches(shape)) {
    throw std::logic_error(fmt::format(
        "Merge strategy \"{}\" produced {} for a tile of shape {}.",
        strategy.getName(),
        describeShape(merged),
        shape.toString()));
  }

  const size_t pixelCount = coverage.getPixelCount();
  for (size_t pixel = 0; pixel < pixelCount; ++pixel) {
    if (!coverage.isValid(pixel)) {
      merged.mask.setValid(pixel, false);
    }
  }

  if (!merged.mask.hasValidPixels()) {
    ErrorList errors = ErrorList::error(fmt::format(
        "None of the {} consulted assets has a valid pixel in tile {}.",
        consulted,
        tileName));
    errors.merge(recorder.errorList);
    const std::string message =
        errors.format(fmt::format("Cannot assemble tile {}", tileName));
    SPDLOG_LOGGER_ERROR(this->_pLogger, message);
    throw NoValidAssetError(message, std::move(recorder.failures));
  }

  return MosaicResult{
      std::move(merged.pixels),
      std::move(merged.mask),
      state.getUsedAssets(),
      std::move(recorder.failures),
      strategy.getName()};
}

} // namespace TesseraMosaic
