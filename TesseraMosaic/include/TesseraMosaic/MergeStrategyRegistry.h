#pragma once

#include <TesseraMosaic/Library.h>
#include <TesseraMosaic/MergeStrategy.h>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace TesseraMosaic {

/**
 * @brief Maps strategy names to factories, so that callers can select a
 * {@link MergeStrategy} by name.
 *
 * Names are case-insensitive.
 */
class TESSERAMOSAIC_API MergeStrategyRegistry final {
public:
  /**
   * @brief Creates a new strategy instance.
   */
  using Factory = std::function<std::shared_ptr<const MergeStrategy>()>;

  /**
   * @brief Creates a registry holding the built-in strategies: `first`,
   * `last`, `highest`, `lowest`, `mean`, `median`, `stddev`, `count`,
   * `lastbandhigh` and `lastbandlow`, each with default options.
   */
  static MergeStrategyRegistry createDefault();

  /**
   * @brief Adds a strategy, replacing any strategy already registered under
   * the same name.
   *
   * @throws ConfigurationError If `name` is empty or `factory` is empty.
   */
  void registerStrategy(const std::string& name, Factory factory);

  /**
   * @brief Returns `true` if a strategy is registered under `name`.
   */
  bool contains(const std::string& name) const;

  /**
   * @brief Gets the registered names, in lowercase and sorted.
   */
  std::vector<std::string> getNames() const;

  /**
   * @brief Creates the strategy registered under `name`.
   *
   * @throws ConfigurationError If no strategy is registered under `name`,
   * or if its factory returns `nullptr`.
   */
  std::shared_ptr<const MergeStrategy> create(const std::string& name) const;

private:
  std::map<std::string, Factory> _factories;
};

} // namespace TesseraMosaic
