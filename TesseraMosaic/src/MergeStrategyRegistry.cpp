#include <TesseraMosaic/CountStrategy.h>
#include <TesseraMosaic/ExtremumStrategy.h>
#include <TesseraMosaic/FirstValidStrategy.h>
#include <TesseraMosaic/LastBandExtremumStrategy.h>
#include <TesseraMosaic/LastValidStrategy.h>
#include <TesseraMosaic/MeanStrategy.h>
#include <TesseraMosaic/MedianStrategy.h>
#include <TesseraMosaic/MergeStrategy.h>
#include <TesseraMosaic/MergeStrategyRegistry.h>
#include <TesseraMosaic/MosaicErrors.h>
#include <TesseraMosaic/StddevStrategy.h>
#include <TesseraUtility/joinToString.h>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace TesseraMosaic {

namespace {

std::string toLower(const std::string& name) {
  std::string result = name;
  std::transform(result.begin(), result.end(), result.begin(), [](char c) {
    return char(std::tolower(static_cast<unsigned char>(c)));
  });
  return result;
}

template <typename TStrategy, typename... TArgs>
MergeStrategyRegistry::Factory makeFactory(TArgs... args) {
  return [args...]() -> std::shared_ptr<const MergeStrategy> {
    return std::make_shared<TStrategy>(args...);
  };
}

} // namespace

/*static*/ MergeStrategyRegistry MergeStrategyRegistry::createDefault() {
  MergeStrategyRegistry registry;
  registry.registerStrategy("first", makeFactory<FirstValidStrategy>());
  registry.registerStrategy("last", makeFactory<LastValidStrategy>());
  registry.registerStrategy(
      "highest",
      makeFactory<ExtremumStrategy>(ExtremumKind::Highest));
  registry.registerStrategy(
      "lowest",
      makeFactory<ExtremumStrategy>(ExtremumKind::Lowest));
  registry.registerStrategy("mean", makeFactory<MeanStrategy>());
  registry.registerStrategy("median", makeFactory<MedianStrategy>());
  registry.registerStrategy("stddev", makeFactory<StddevStrategy>());
  registry.registerStrategy("count", makeFactory<CountStrategy>());
  registry.registerStrategy(
      "lastbandhigh",
      makeFactory<LastBandExtremumStrategy>(ExtremumKind::Highest));
  registry.registerStrategy(
      "lastbandlow",
      makeFactory<LastBandExtremumStrategy>(ExtremumKind::Lowest));
  return registry;
}

void MergeStrategyRegistry::registerStrategy(
    const std::string& name,
    Factory factory) {
  if (name.empty()) {
    throw ConfigurationError("A merge strategy name must not be empty.");
  }
  if (!factory) {
    throw ConfigurationError(fmt::format(
        "The factory for merge strategy \"{}\" must not be empty.",
        name));
  }

  this->_factories[toLower(name)] = std::move(factory);
}

bool MergeStrategyRegistry::contains(const std::string& name) const {
  return this->_factories.find(toLower(name)) != this->_factories.end();
}

std::vector<std::string> MergeStrategyRegistry::getNames() const {
  std::vector<std::string> names;
  names.reserve(this->_factories.size());
  for (const auto& entry : this->_factories) {
    names.emplace_back(entry.first);
  }
  return names;
}

std::shared_ptr<const MergeStrategy>
MergeStrategyRegistry::create(const std::string& name) const {
  auto it = this->_factories.find(toLower(name));
  if (it == this->_factories.end()) {
    throw ConfigurationError(fmt::format(
        "Unknown merge strategy \"{}\". Known strategies are: {}.",
        name,
        TesseraUtility::joinToString(this->getNames(), ", ")));
  }

  std::shared_ptr<const MergeStrategy> pStrategy = it->second();
  if (!pStrategy) {
    throw ConfigurationError(fmt::format(
        "The factory for merge strategy \"{}\" returned no strategy.",
        it->first));
  }
  return pStrategy;
}

} // namespace TesseraMosaic
