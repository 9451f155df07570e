#pragma once

#include <TesseraUtility/Library.h>
#include <TesseraUtility/joinToString.h>

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace TesseraUtility {

/**
 * @brief Collects the errors and warnings produced while assembling a mosaic
 * tile.
 *
 * Problems that affect a single asset (a read timeout, an undecodable scene)
 * are recorded as warnings because the tile can still be built from the
 * remaining assets. Problems that prevent the tile from being produced at all
 * are recorded as errors.
 */
struct TESSERAUTILITY_API ErrorList {
  /**
   * @brief Creates an {@link ErrorList} holding one error.
   *
   * @param errorMessage The error message.
   */
  static ErrorList error(std::string errorMessage);

  /**
   * @brief Creates an {@link ErrorList} holding one warning.
   *
   * @param warningMessage The warning message.
   */
  static ErrorList warning(std::string warningMessage);

  /**
   * @brief Appends the errors and warnings of another list to this one.
   */
  void merge(const ErrorList& errorList);

  /**
   * @brief Appends the errors and warnings of another list to this one,
   * moving the messages out of it.
   */
  void merge(ErrorList&& errorList);

  /**
   * @brief Adds an error message.
   */
  template <typename ErrorStr> void emplaceError(ErrorStr&& error) {
    errors.emplace_back(std::forward<ErrorStr>(error));
  }

  /**
   * @brief Adds a warning message.
   */
  template <typename WarningStr> void emplaceWarning(WarningStr&& warning) {
    warnings.emplace_back(std::forward<WarningStr>(warning));
  }

  /**
   * @brief Returns `true` if at least one error has been recorded.
   */
  bool hasErrors() const noexcept;

  /**
   * @brief Returns `true` if at least one warning has been recorded.
   */
  bool hasWarnings() const noexcept;

  /**
   * @brief Logs the warnings, if any, as a single message.
   *
   * @param pLogger The logger to write to.
   * @param prompt A line printed before the list of warnings.
   */
  template <typename PromptStr>
  void logWarning(
      const std::shared_ptr<spdlog::logger>& pLogger,
      PromptStr&& prompt) const noexcept {
    if (!warnings.empty()) {
      SPDLOG_LOGGER_WARN(
          pLogger,
          "{}:\n- {}",
          std::forward<PromptStr>(prompt),
          TesseraUtility::joinToString(warnings, "\n- "));
    }
  }

  /**
   * @brief Renders the errors, then the warnings, one per line after the
   * prompt.
   *
   * @param prompt The first line of the result.
   * @returns The rendered text, or an empty string if the list is empty.
   */
  template <typename PromptStr>
  std::string format(PromptStr&& prompt) const noexcept {
    if (this->warnings.empty() && this->errors.empty()) {
      return std::string();
    }

    std::string result = prompt;

    if (!this->errors.empty()) {
      result += "\n- [Error] " +
                TesseraUtility::joinToString(this->errors, "\n- [Error] ");
    }

    if (!this->warnings.empty()) {
      result += "\n- [Warning] " +
                TesseraUtility::joinToString(this->warnings, "\n- [Warning] ");
    }

    return result;
  }

  /**
   * @brief Same as {@link hasErrors}.
   */
  explicit operator bool() const noexcept;

  /**
   * @brief The error messages, in the order they were recorded.
   */
  std::vector<std::string> errors;

  /**
   * @brief The warning messages, in the order they were recorded.
   */
  std::vector<std::string> warnings;
};

} // namespace TesseraUtility
