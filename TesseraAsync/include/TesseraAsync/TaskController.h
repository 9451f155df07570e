#pragma once

#include <TesseraAsync/Library.h>

#include <atomic>

namespace TesseraAsync {

/**
 * @brief A cancellation flag shared between the code that submits a group of
 * tasks and the {@link ThrottlingGroup} that runs them.
 *
 * Canceling is cooperative: queued tasks that have not started yet are
 * dropped, tasks that are already running finish normally and their owner is
 * expected to discard what they produce.
 */
class TESSERAASYNC_API TaskController final {
public:
  TaskController() noexcept;

  /**
   * @brief Requests cancellation. Safe to call from any thread, any number of
   * times.
   */
  void cancel() noexcept;

  /**
   * @brief Returns `true` once {@link cancel} has been called.
   */
  bool isCanceled() const noexcept;

private:
  std::atomic<bool> _canceled;
};

} // namespace TesseraAsync
