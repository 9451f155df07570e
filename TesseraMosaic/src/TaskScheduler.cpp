#include <TesseraAsync/ITaskProcessor.h>
#include <TesseraAsync/TaskController.h>
#include <TesseraAsync/ThrottlingGroup.h>
#include <TesseraMosaic/AssetResult.h>
#include <TesseraMosaic/MosaicErrors.h>
#include <TesseraMosaic/TaskScheduler.h>
#include <TesseraRaster/AssetFetchError.h>
#include <TesseraRaster/IAssetReader.h>
#include <TesseraRaster/TileImage.h>
#include <TesseraRaster/TileRequest.h>

#include <nonstd/expected.hpp>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace TesseraAsync;
using namespace TesseraRaster;

namespace TesseraMosaic {

namespace {

using ReadOutcome = nonstd::expected<TileImage, AssetFetchError>;

enum class SlotStatus { Queued, Running, Done, Abandoned };

struct Slot {
  SlotStatus status = SlotStatus::Queued;
  std::chrono::steady_clock::time_point startedAt;
  std::optional<ReadOutcome> outcome;
};

ReadOutcome readAsset(
    const IAssetReader& reader,
    const std::string& assetId,
    const TileRequest& request) {
  try {
    return reader.read(assetId, request);
  } catch (const std::exception& e) {
    return nonstd::make_unexpected(
        AssetFetchError{AssetFetchErrorKind::GenericIO, e.what()});
  } catch (...) {
    return nonstd::make_unexpected(AssetFetchError{
        AssetFetchErrorKind::GenericIO,
        "The reader threw an exception of unknown type."});
  }
}

} // namespace

struct AssetResultStream::State
    : public std::enable_shared_from_this<AssetResultStream::State> {
  std::vector<std::string> assets;
  std::shared_ptr<const IAssetReader> pReader;
  TileRequest request;
  size_t readAhead = 1;
  std::optional<std::chrono::milliseconds> timeout;
  std::shared_ptr<TaskController> pController;
  std::shared_ptr<ThrottlingGroup> pGroup;

  mutable std::mutex mutex;
  std::condition_variable changed;
  std::vector<Slot> slots;
  size_t nextIndex = 0;
  size_t queuedCount = 0;
  bool canceled = false;

  // Queues the reads of every asset before `end` that is not queued yet.
  // Must be called without holding the mutex, because a task processor may
  // run the reads inline.
  void queueUpTo(size_t end) {
    size_t begin;
    {
      std::lock_guard<std::mutex> lock(this->mutex);
      if (this->canceled) {
        return;
      }
      end = std::min(end, this->assets.size());
      begin = this->queuedCount;
      this->queuedCount = std::max(begin, end);
    }

    std::shared_ptr<State> pThis = this->shared_from_this();
    for (size_t i = begin; i < end; ++i) {
      this->pGroup->run(
          this->pController,
          [pThis, i]() {
            if (!pThis->markStarted(i)) {
              return;
            }
            ReadOutcome outcome =
                readAsset(*pThis->pReader, pThis->assets[i], pThis->request);
            pThis->markFinished(i, std::move(outcome));
          },
          [pThis, i]() { pThis->markDropped(i); });
    }
  }

  // Returns false if the read should not happen, because the consumer gave
  // up waiting for it to start or the stream was canceled.
  bool markStarted(size_t index) {
    std::lock_guard<std::mutex> lock(this->mutex);
    Slot& slot = this->slots[index];
    if (slot.status != SlotStatus::Queued || this->canceled) {
      return false;
    }
    slot.status = SlotStatus::Running;
    slot.startedAt = std::chrono::steady_clock::now();
    this->changed.notify_all();
    return true;
  }

  void markFinished(size_t index, ReadOutcome&& outcome) {
    std::lock_guard<std::mutex> lock(this->mutex);
    Slot& slot = this->slots[index];
    // A result that arrives after its slot timed out, or after the stream
    // was canceled, is dropped.
    if (slot.status != SlotStatus::Running || this->canceled) {
      return;
    }
    slot.status = SlotStatus::Done;
    slot.outcome.emplace(std::move(outcome));
    this->changed.notify_all();
  }

  // The read was never started, either because the stream was canceled or
  // because the task processor no longer exists.
  void markDropped(size_t index) {
    std::lock_guard<std::mutex> lock(this->mutex);
    Slot& slot = this->slots[index];
    if (slot.status != SlotStatus::Queued) {
      return;
    }
    slot.status = SlotStatus::Abandoned;
    slot.outcome.emplace(nonstd::make_unexpected(AssetFetchError{
        AssetFetchErrorKind::Canceled,
        "The read was dropped before it started."}));
    this->changed.notify_all();
  }
};

AssetResultStream::AssetResultStream(std::shared_ptr<State> pState) noexcept
    : _pState(std::move(pState)) {}

AssetResultStream::AssetResultStream(AssetResultStream&& rhs) noexcept =
    default;

AssetResultStream&
AssetResultStream::operator=(AssetResultStream&& rhs) noexcept {
  if (this != &rhs) {
    this->cancel();
    this->_pState = std::move(rhs._pState);
  }
  return *this;
}

AssetResultStream::~AssetResultStream() noexcept { this->cancel(); }

std::optional<AssetResult> AssetResultStream::next() {
  if (!this->_pState) {
    return std::nullopt;
  }

  State& state = *this->_pState;

  // Only the readAhead assets starting at the one being waited for are
  // queued. Assets further down the list are queued as the consumer asks for
  // them, so nothing is read past the point where the consumer stops.
  size_t index;
  {
    std::lock_guard<std::mutex> lock(state.mutex);
    index = state.nextIndex;
  }
  state.queueUpTo(index + state.readAhead);

  std::unique_lock<std::mutex> lock(state.mutex);

  if (state.canceled || state.nextIndex >= state.slots.size()) {
    return std::nullopt;
  }

  Slot& slot = state.slots[index];

  // A queued read can be stuck behind earlier reads that timed out but still
  // hold their place in the concurrency limit. It gets the same timeout,
  // measured from when the consumer starts waiting for it.
  const auto waitStart = std::chrono::steady_clock::now();

  while (!slot.outcome && !state.canceled) {
    if (!state.timeout) {
      state.changed.wait(lock);
      continue;
    }

    const SlotStatus waitingFor = slot.status;
    const auto deadline =
        (waitingFor == SlotStatus::Running ? slot.startedAt : waitStart) +
        *state.timeout;
    if (state.changed.wait_until(lock, deadline) != std::cv_status::timeout ||
        slot.outcome || slot.status != waitingFor) {
      continue;
    }

    slot.status = SlotStatus::Abandoned;
    if (waitingFor == SlotStatus::Running) {
      slot.outcome.emplace(nonstd::make_unexpected(AssetFetchError{
          AssetFetchErrorKind::Timeout,
          fmt::format(
              "The read did not finish within {} ms.",
              state.timeout->count())}));
    } else {
      slot.outcome.emplace(nonstd::make_unexpected(AssetFetchError{
          AssetFetchErrorKind::Timeout,
          fmt::format(
              "The read could not start within {} ms because earlier reads "
              "are still running.",
              state.timeout->count())}));
    }
  }

  if (state.canceled) {
    return std::nullopt;
  }

  ++state.nextIndex;

  AssetResult result{
      state.assets[index],
      index,
      std::move(*slot.outcome)};
  slot.outcome.reset();
  return result;
}

void AssetResultStream::cancel() noexcept {
  if (!this->_pState) {
    return;
  }

  State& state = *this->_pState;
  {
    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.canceled) {
      return;
    }
    state.canceled = true;
    state.changed.notify_all();
  }

  state.pController->cancel();
  state.pGroup->dropCanceled();
}

bool AssetResultStream::isCanceled() const noexcept {
  if (!this->_pState) {
    return true;
  }
  std::lock_guard<std::mutex> lock(this->_pState->mutex);
  return this->_pState->canceled;
}

size_t AssetResultStream::size() const noexcept {
  return this->_pState ? this->_pState->assets.size() : 0;
}

size_t AssetResultStream::getDeliveredCount() const noexcept {
  if (!this->_pState) {
    return 0;
  }
  std::lock_guard<std::mutex> lock(this->_pState->mutex);
  return this->_pState->nextIndex;
}

TaskScheduler::TaskScheduler(
    const std::shared_ptr<ITaskProcessor>& pTaskProcessor,
    const TaskSchedulerOptions& options)
    : _pTaskProcessor(pTaskProcessor), _options(options) {
  if (!this->_pTaskProcessor) {
    throw ConfigurationError("A task processor is required to read assets.");
  }

  if (options.maximumSimultaneousReads < 1) {
    throw ConfigurationError(fmt::format(
        "maximumSimultaneousReads must be at least 1, but is {}.",
        options.maximumSimultaneousReads));
  }

  if (options.assetReadTimeout &&
      options.assetReadTimeout->count() <= 0) {
    throw ConfigurationError(fmt::format(
        "assetReadTimeout must be positive, but is {} ms.",
        options.assetReadTimeout->count()));
  }
}

AssetResultStream TaskScheduler::run(
    const std::vector<std::string>& assets,
    const std::shared_ptr<const IAssetReader>& pReader,
    const TileRequest& request) const {
  if (!pReader) {
    throw ConfigurationError("An asset reader is required to read assets.");
  }

  auto pState = std::make_shared<AssetResultStream::State>();
  pState->assets = assets;
  pState->pReader = pReader;
  pState->request = request;
  pState->readAhead = size_t(this->_options.maximumSimultaneousReads);
  pState->timeout = this->_options.assetReadTimeout;
  pState->pController = std::make_shared<TaskController>();
  pState->pGroup = std::make_shared<ThrottlingGroup>(
      this->_pTaskProcessor,
      this->_options.maximumSimultaneousReads);
  pState->slots.resize(assets.size());

  // Created first so that the queued reads are canceled if queueing throws.
  AssetResultStream stream(pState);
  pState->queueUpTo(pState->readAhead);

  return stream;
}

} // namespace TesseraMosaic
