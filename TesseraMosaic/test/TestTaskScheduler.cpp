#include "MockAssetReader.h"

#include <TesseraAsync/ITaskProcessor.h>
#include <TesseraMosaic/AssetResult.h>
#include <TesseraMosaic/MosaicErrors.h>
#include <TesseraMosaic/TaskScheduler.h>
#include <TesseraRaster/AssetFetchError.h>
#include <TesseraRaster/TileRequest.h>
#include <TesseraRaster/TileShape.h>
#include <TesseraTests/RasterFixtures.h>
#include <TesseraTests/SimpleTaskProcessor.h>
#include <TesseraTests/ThreadTaskProcessor.h>

#include <doctest/doctest.h>

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace TesseraAsync;
using namespace TesseraMosaic;
using namespace TesseraRaster;
using namespace TesseraTests;

namespace {

TileRequest makeRequest() {
  TileRequest request;
  request.tileID = TileID(3, 4, 2);
  request.shape = TileShape{1, 2, 2};
  return request;
}

std::vector<std::string> drainIds(AssetResultStream& stream) {
  std::vector<std::string> ids;
  while (std::optional<AssetResult> result = stream.next()) {
    ids.emplace_back(result->assetId);
  }
  return ids;
}

} // namespace

TEST_CASE("TaskScheduler") {
  const TileRequest request = makeRequest();

  SUBCASE("delivers results in asset list order") {
    auto pReader = std::make_shared<MockAssetReader>();
    pReader->addBehavior("slow", [](const TileRequest& slowRequest) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      return MockAssetReader::Result(
          makeConstantImage(slowRequest.shape, 1.0));
    });
    pReader->addImage("fast", makeConstantImage(request.shape, 2.0));
    pReader->addFailure("missing", AssetFetchErrorKind::NotFound);

    TaskScheduler scheduler(
        std::make_shared<ThreadTaskProcessor>(),
        TaskSchedulerOptions{3, std::nullopt});
    AssetResultStream stream =
        scheduler.run({"slow", "fast", "missing"}, pReader, request);

    std::optional<AssetResult> first = stream.next();
    REQUIRE(first);
    CHECK(first->assetId == "slow");
    CHECK(first->index == 0);
    REQUIRE(first->succeeded());
    CHECK(first->image->pixels.getValue(0) == 1.0);

    std::optional<AssetResult> second = stream.next();
    REQUIRE(second);
    CHECK(second->assetId == "fast");
    CHECK(second->index == 1);
    CHECK(second->succeeded());

    std::optional<AssetResult> third = stream.next();
    REQUIRE(third);
    CHECK(third->assetId == "missing");
    REQUIRE(!third->succeeded());
    CHECK(third->image.error().kind == AssetFetchErrorKind::NotFound);

    CHECK(!stream.next());
    CHECK(stream.getDeliveredCount() == 3);
  }

  SUBCASE("never runs more than the maximum number of reads at once") {
    auto pReader = std::make_shared<MockAssetReader>();
    std::vector<std::string> assets{"a", "b", "c", "d", "e"};
    for (const std::string& asset : assets) {
      pReader->addImage(asset, makeConstantImage(request.shape, 1.0));
    }
    pReader->setDelay(std::chrono::milliseconds(20));

    TaskScheduler scheduler(
        std::make_shared<ThreadTaskProcessor>(),
        TaskSchedulerOptions{2, std::nullopt});
    AssetResultStream stream = scheduler.run(assets, pReader, request);

    CHECK(drainIds(stream) == assets);
    CHECK(pReader->getTotalReadCount() == 5);
    CHECK(pReader->getMaximumInFlight() <= 2);
  }

  SUBCASE("turns a throwing reader into a generic I/O failure") {
    auto pReader = std::make_shared<MockAssetReader>();
    pReader->addBehavior(
        "broken",
        [](const TileRequest&) -> MockAssetReader::Result {
          throw std::runtime_error("disk on fire");
        });
    pReader->addImage("ok", makeConstantImage(request.shape, 1.0));

    TaskScheduler scheduler(std::make_shared<SimpleTaskProcessor>());
    AssetResultStream stream =
        scheduler.run({"broken", "ok"}, pReader, request);

    std::optional<AssetResult> broken = stream.next();
    REQUIRE(broken);
    REQUIRE(!broken->succeeded());
    CHECK(broken->image.error().kind == AssetFetchErrorKind::GenericIO);
    CHECK(broken->image.error().message == "disk on fire");

    std::optional<AssetResult> ok = stream.next();
    REQUIRE(ok);
    CHECK(ok->succeeded());
  }

  SUBCASE("reports a read that runs too long as a timeout") {
    auto pGate = std::make_shared<Gate>();
    auto pReader = std::make_shared<MockAssetReader>();
    pReader->addBehavior("hung", [pGate](const TileRequest& hungRequest) {
      pGate->wait();
      return MockAssetReader::Result(
          makeConstantImage(hungRequest.shape, 1.0));
    });
    pReader->addImage("fine", makeConstantImage(request.shape, 2.0));

    TaskScheduler scheduler(
        std::make_shared<ThreadTaskProcessor>(),
        TaskSchedulerOptions{2, std::chrono::milliseconds(50)});
    AssetResultStream stream =
        scheduler.run({"hung", "fine"}, pReader, request);

    std::optional<AssetResult> hung = stream.next();
    REQUIRE(hung);
    CHECK(hung->assetId == "hung");
    REQUIRE(!hung->succeeded());
    CHECK(hung->image.error().kind == AssetFetchErrorKind::Timeout);

    std::optional<AssetResult> fine = stream.next();
    REQUIRE(fine);
    CHECK(fine->succeeded());
    CHECK(!stream.next());

    pGate->open();
  }

  SUBCASE("times out a read stuck behind a hung read") {
    auto pGate = std::make_shared<Gate>();
    auto pReader = std::make_shared<MockAssetReader>();
    pReader->addBehavior("hung", [pGate](const TileRequest& hungRequest) {
      pGate->wait();
      return MockAssetReader::Result(
          makeConstantImage(hungRequest.shape, 1.0));
    });
    pReader->addImage("fine", makeConstantImage(request.shape, 2.0));

    TaskScheduler scheduler(
        std::make_shared<ThreadTaskProcessor>(),
        TaskSchedulerOptions{1, std::chrono::milliseconds(50)});
    AssetResultStream stream =
        scheduler.run({"hung", "fine"}, pReader, request);

    std::optional<AssetResult> hung = stream.next();
    REQUIRE(hung);
    REQUIRE(!hung->succeeded());
    CHECK(hung->image.error().kind == AssetFetchErrorKind::Timeout);

    const auto waitStart = std::chrono::steady_clock::now();
    std::optional<AssetResult> fine = stream.next();
    const auto waited = std::chrono::steady_clock::now() - waitStart;
    REQUIRE(fine);
    CHECK(fine->assetId == "fine");
    REQUIRE(!fine->succeeded());
    CHECK(fine->image.error().kind == AssetFetchErrorKind::Timeout);
    CHECK(waited < std::chrono::seconds(5));
    CHECK(!stream.next());

    // The only slot is still held by the hung read.
    CHECK(pReader->getReadCount("fine") == 0);

    stream.cancel();
    pGate->open();
  }

  SUBCASE("reports reads dropped with their task processor as canceled") {
    auto pReader = std::make_shared<MockAssetReader>();
    pReader->addImage("a", makeConstantImage(request.shape, 1.0));
    pReader->addImage("b", makeConstantImage(request.shape, 2.0));

    auto pProcessor = std::make_shared<SimpleTaskProcessor>();
    AssetResultStream stream =
        TaskScheduler(pProcessor, TaskSchedulerOptions{1, std::nullopt})
            .run({"a", "b"}, pReader, request);
    pProcessor.reset();

    std::optional<AssetResult> a = stream.next();
    REQUIRE(a);
    CHECK(a->succeeded());

    std::optional<AssetResult> b = stream.next();
    REQUIRE(b);
    REQUIRE(!b->succeeded());
    CHECK(b->image.error().kind == AssetFetchErrorKind::Canceled);
    CHECK(pReader->getReadCount("b") == 0);
    CHECK(!stream.next());
  }

  SUBCASE("only reads ahead as far as the concurrency limit") {
    auto pReader = std::make_shared<MockAssetReader>();
    std::vector<std::string> assets{"a", "b", "c", "d"};
    for (const std::string& asset : assets) {
      pReader->addImage(asset, makeConstantImage(request.shape, 1.0));
    }

    TaskScheduler scheduler(
        std::make_shared<SimpleTaskProcessor>(),
        TaskSchedulerOptions{2, std::nullopt});
    AssetResultStream stream = scheduler.run(assets, pReader, request);
    CHECK(pReader->getTotalReadCount() == 2);

    REQUIRE(stream.next());
    CHECK(pReader->getTotalReadCount() == 2);

    REQUIRE(stream.next());
    CHECK(pReader->getTotalReadCount() == 3);
    CHECK(pReader->getReadCount("c") == 1);
    CHECK(pReader->getReadCount("d") == 0);
  }

  SUBCASE("cancel stops the stream and unstarted reads") {
    auto pReader = std::make_shared<MockAssetReader>();
    std::vector<std::string> assets{"a", "b", "c"};
    for (const std::string& asset : assets) {
      pReader->addImage(asset, makeConstantImage(request.shape, 1.0));
    }

    TaskScheduler scheduler(
        std::make_shared<SimpleTaskProcessor>(),
        TaskSchedulerOptions{1, std::nullopt});
    AssetResultStream stream = scheduler.run(assets, pReader, request);

    std::optional<AssetResult> first = stream.next();
    REQUIRE(first);
    CHECK(first->assetId == "a");

    stream.cancel();
    CHECK(stream.isCanceled());
    CHECK(!stream.next());
    CHECK(pReader->getReadCount("b") == 0);
    CHECK(pReader->getReadCount("c") == 0);
  }

  SUBCASE("an empty asset list produces an empty stream") {
    auto pReader = std::make_shared<MockAssetReader>();
    TaskScheduler scheduler(std::make_shared<SimpleTaskProcessor>());
    AssetResultStream stream = scheduler.run({}, pReader, request);
    CHECK(stream.size() == 0);
    CHECK(!stream.next());
  }

  SUBCASE("rejects invalid configuration") {
    auto pProcessor = std::make_shared<SimpleTaskProcessor>();

    CHECK_THROWS_AS(
        TaskScheduler(nullptr, TaskSchedulerOptions{}),
        ConfigurationError);
    CHECK_THROWS_AS(
        TaskScheduler(pProcessor, TaskSchedulerOptions{0, std::nullopt}),
        ConfigurationError);
    CHECK_THROWS_AS(
        TaskScheduler(pProcessor, TaskSchedulerOptions{-3, std::nullopt}),
        ConfigurationError);
    CHECK_THROWS_AS(
        TaskScheduler(
            pProcessor,
            TaskSchedulerOptions{2, std::chrono::milliseconds(0)}),
        ConfigurationError);

    TaskScheduler scheduler(pProcessor);
    CHECK_THROWS_AS(
        scheduler.run({"a"}, nullptr, request),
        ConfigurationError);
  }
}
