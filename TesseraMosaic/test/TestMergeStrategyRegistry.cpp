#include <TesseraMosaic/AccumulatorState.h>
#include <TesseraMosaic/FirstValidStrategy.h>
#include <TesseraMosaic/MergeStrategy.h>
#include <TesseraMosaic/MergeStrategyRegistry.h>
#include <TesseraMosaic/MosaicErrors.h>
#include <TesseraRaster/PixelBuffer.h>
#include <TesseraRaster/ValidityMask.h>

#include <doctest/doctest.h>

#include <memory>
#include <string>
#include <vector>

using namespace TesseraMosaic;
using namespace TesseraRaster;

namespace {

class NothingStrategy : public MergeStrategy {
public:
  std::string getName() const override { return "nothing"; }

  void update(AccumulatorState&, const PixelBuffer&, const ValidityMask&)
      const override {}
};

} // namespace

TEST_CASE("MergeStrategyRegistry") {
  MergeStrategyRegistry registry = MergeStrategyRegistry::createDefault();

  SUBCASE("knows the built-in strategies") {
    const std::vector<std::string> expected{
        "count",
        "first",
        "highest",
        "last",
        "lastbandhigh",
        "lastbandlow",
        "lowest",
        "mean",
        "median",
        "stddev"};
    CHECK(registry.getNames() == expected);

    for (const std::string& name : expected) {
      CAPTURE(name);
      std::shared_ptr<const MergeStrategy> pStrategy = registry.create(name);
      REQUIRE(pStrategy);
      CHECK(pStrategy->getName() == name);
    }
  }

  SUBCASE("looks names up without regard to case") {
    CHECK(registry.contains("FIRST"));
    CHECK(registry.create("Median")->getName() == "median");
  }

  SUBCASE("rejects an unknown name") {
    CHECK(!registry.contains("brightest"));
    CHECK_THROWS_AS(registry.create("brightest"), ConfigurationError);

    try {
      registry.create("brightest");
    } catch (const ConfigurationError& e) {
      const std::string message = e.what();
      CHECK(message.find("brightest") != std::string::npos);
      CHECK(message.find("first") != std::string::npos);
    }
  }

  SUBCASE("accepts custom strategies") {
    registry.registerStrategy("Nothing", []() {
      return std::make_shared<NothingStrategy>();
    });
    CHECK(registry.contains("nothing"));
    CHECK(registry.create("nothing")->getName() == "nothing");
  }

  SUBCASE("replaces a strategy registered under the same name") {
    registry.registerStrategy("mean", []() {
      return std::make_shared<FirstValidStrategy>();
    });
    CHECK(registry.create("mean")->getName() == "first");
  }

  SUBCASE("rejects invalid registrations") {
    CHECK_THROWS_AS(
        registry.registerStrategy("", []() {
          return std::make_shared<NothingStrategy>();
        }),
        ConfigurationError);
    CHECK_THROWS_AS(
        registry.registerStrategy("empty", MergeStrategyRegistry::Factory()),
        ConfigurationError);

    registry.registerStrategy("null", []() {
      return std::shared_ptr<const MergeStrategy>();
    });
    CHECK_THROWS_AS(registry.create("null"), ConfigurationError);
  }
}
