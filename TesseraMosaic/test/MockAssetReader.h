#pragma once

#include <TesseraRaster/AssetFetchError.h>
#include <TesseraRaster/IAssetReader.h>
#include <TesseraRaster/TileImage.h>
#include <TesseraRaster/TileRequest.h>
#include <TesseraTests/RasterFixtures.h>

#include <nonstd/expected.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace TesseraMosaic {

// Blocks readers until the test opens it.
struct Gate {
  std::mutex mutex;
  std::condition_variable opened;
  bool isOpen = false;

  void wait() {
    std::unique_lock<std::mutex> lock(this->mutex);
    this->opened.wait(lock, [this]() { return this->isOpen; });
  }

  void open() {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->isOpen = true;
    this->opened.notify_all();
  }
};

// An asset reader that serves canned images and failures, and records how
// often and how concurrently it is called.
class MockAssetReader : public TesseraRaster::IAssetReader {
public:
  using Result = nonstd::
      expected<TesseraRaster::TileImage, TesseraRaster::AssetFetchError>;
  using Behavior =
      std::function<Result(const TesseraRaster::TileRequest& request)>;

  void addImage(const std::string& assetId, TesseraRaster::TileImage image) {
    auto pImage =
        std::make_shared<TesseraRaster::TileImage>(std::move(image));
    this->addBehavior(assetId, [pImage](const TesseraRaster::TileRequest&) {
      return Result(TesseraTests::cloneImage(*pImage));
    });
  }

  void addFailure(
      const std::string& assetId,
      TesseraRaster::AssetFetchErrorKind kind,
      const std::string& message = {}) {
    TesseraRaster::AssetFetchError error{kind, message};
    this->addBehavior(assetId, [error](const TesseraRaster::TileRequest&) {
      return Result(nonstd::make_unexpected(error));
    });
  }

  void addBehavior(const std::string& assetId, Behavior behavior) {
    this->_behaviors[assetId] = std::move(behavior);
  }

  // Every read sleeps this long before producing its result.
  void setDelay(std::chrono::milliseconds delay) { this->_delay = delay; }

  Result read(
      const std::string& assetId,
      const TesseraRaster::TileRequest& request) const override {
    {
      std::lock_guard<std::mutex> lock(this->_mutex);
      ++this->_readCounts[assetId];
      ++this->_inFlight;
      this->_maximumInFlight =
          std::max(this->_maximumInFlight, this->_inFlight);
    }

    if (this->_delay.count() > 0) {
      std::this_thread::sleep_for(this->_delay);
    }

    try {
      Result result = this->produce(assetId, request);
      this->onReadFinished();
      return result;
    } catch (...) {
      this->onReadFinished();
      throw;
    }
  }

  size_t getReadCount(const std::string& assetId) const {
    std::lock_guard<std::mutex> lock(this->_mutex);
    auto it = this->_readCounts.find(assetId);
    return it == this->_readCounts.end() ? 0 : it->second;
  }

  size_t getTotalReadCount() const {
    std::lock_guard<std::mutex> lock(this->_mutex);
    size_t total = 0;
    for (const auto& entry : this->_readCounts) {
      total += entry.second;
    }
    return total;
  }

  int32_t getMaximumInFlight() const {
    std::lock_guard<std::mutex> lock(this->_mutex);
    return this->_maximumInFlight;
  }

private:
  void onReadFinished() const {
    std::lock_guard<std::mutex> lock(this->_mutex);
    --this->_inFlight;
  }

  Result produce(
      const std::string& assetId,
      const TesseraRaster::TileRequest& request) const {
    auto it = this->_behaviors.find(assetId);
    if (it == this->_behaviors.end()) {
      return nonstd::make_unexpected(TesseraRaster::AssetFetchError{
          TesseraRaster::AssetFetchErrorKind::NotFound,
          "no such asset"});
    }
    return it->second(request);
  }

  std::map<std::string, Behavior> _behaviors;
  std::chrono::milliseconds _delay{0};

  mutable std::mutex _mutex;
  mutable std::map<std::string, size_t> _readCounts;
  mutable int32_t _inFlight = 0;
  mutable int32_t _maximumInFlight = 0;
};

} // namespace TesseraMosaic
