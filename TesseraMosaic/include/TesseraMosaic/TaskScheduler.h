#pragma once

#include <TesseraMosaic/AssetResult.h>
#include <TesseraMosaic/Library.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
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
 * @brief Options for a {@link TaskScheduler}.
 */
struct TESSERAMOSAIC_API TaskSchedulerOptions {
  /**
   * @brief The maximum number of asset reads that may be in flight at once.
   * Must be at least one.
   */
  int32_t maximumSimultaneousReads = 4;

  /**
   * @brief How long a single asset read may run before its result is
   * reported as {@link TesseraRaster::AssetFetchErrorKind::Timeout}.
   *
   * The clock starts when the read starts, not when it is queued. A read
   * that times out keeps its worker slot until the reader actually returns,
   * and whatever it returns is discarded. A read that is still queued when
   * the consumer has waited this long for it is reported as a timeout too,
   * and never started. When empty, reads may take as long as they need.
   */
  std::optional<std::chrono::milliseconds> assetReadTimeout;
};

/**
 * @brief Delivers the results of one {@link TaskScheduler::run}, one at a
 * time, in the order of the asset list.
 *
 * The stream owns the reads it started. Destroying it, or calling
 * {@link cancel}, drops every read that has not started yet. Reads that are
 * already running finish in the background and their results are
 * discarded.
 */
class TESSERAMOSAIC_API AssetResultStream final {
public:
  AssetResultStream(AssetResultStream&& rhs) noexcept;
  AssetResultStream& operator=(AssetResultStream&& rhs) noexcept;
  AssetResultStream(const AssetResultStream&) = delete;
  AssetResultStream& operator=(const AssetResultStream&) = delete;
  ~AssetResultStream() noexcept;

  /**
   * @brief Waits for the result of the next asset in list order.
   *
   * A result that finishes before the results of earlier assets is held
   * until they have been delivered. If a timeout is configured and the
   * next asset's read runs longer than it, or cannot start within it, a
   * timeout failure is returned for that asset instead. A read that was
   * dropped because the task processor no longer exists is returned as a
   * {@link TesseraRaster::AssetFetchErrorKind::Canceled} failure.
   *
   * @return The next result, or `std::nullopt` once every asset has been
   * delivered or the stream has been canceled.
   */
  std::optional<AssetResult> next();

  /**
   * @brief Stops the stream. Reads that have not started never will, and
   * {@link next} returns `std::nullopt` from now on.
   */
  void cancel() noexcept;

  /**
   * @brief Returns `true` once {@link cancel} has been called.
   */
  bool isCanceled() const noexcept;

  /**
   * @brief Gets the number of assets in the stream.
   */
  size_t size() const noexcept;

  /**
   * @brief Gets the number of results delivered by {@link next} so far.
   */
  size_t getDeliveredCount() const noexcept;

private:
  struct State;

  explicit AssetResultStream(std::shared_ptr<State> pState) noexcept;

  std::shared_ptr<State> _pState;

  friend class TaskScheduler;
};

/**
 * @brief Reads a list of assets concurrently, with a bounded number of reads
 * in flight, and delivers the results in list order.
 *
 * Reads run on the {@link TesseraAsync::ITaskProcessor} given at
 * construction. A failed read, including one whose reader throws, becomes a
 * failed {@link AssetResult}; it never aborts the other reads.
 */
class TESSERAMOSAIC_API TaskScheduler final {
public:
  /**
   * @brief Creates a new scheduler.
   *
   * @param pTaskProcessor Runs the reads.
   * @param options The concurrency limit and timeout.
   * @throws ConfigurationError If the options are invalid or the task
   * processor is null.
   */
  TaskScheduler(
      const std::shared_ptr<TesseraAsync::ITaskProcessor>& pTaskProcessor,
      const TaskSchedulerOptions& options = {});

  /**
   * @brief Starts reading the assets.
   *
   * The first `maximumSimultaneousReads` reads start right away, in list
   * order. Each call to {@link AssetResultStream::next} then queues the read
   * of one more asset, so that the reads of the `maximumSimultaneousReads`
   * assets following the last delivered result are always queued or
   * running. An asset the consumer never gets close to is never read.
   *
   * @param assets The assets to read, in priority order.
   * @param pReader The reader. It is kept alive until every read is done.
   * @param request The tile to read.
   * @return The stream of results.
   */
  AssetResultStream run(
      const std::vector<std::string>& assets,
      const std::shared_ptr<const TesseraRaster::IAssetReader>& pReader,
      const TesseraRaster::TileRequest& request) const;

  /**
   * @brief Gets the options this scheduler was created with.
   */
  const TaskSchedulerOptions& getOptions() const noexcept {
    return this->_options;
  }

private:
  std::shared_ptr<TesseraAsync::ITaskProcessor> _pTaskProcessor;
  TaskSchedulerOptions _options;
};

} // namespace TesseraMosaic
