#pragma once

#include <TesseraAsync/Library.h>

#include <functional>

namespace TesseraAsync {
/**
 * @brief Runs tasks in background threads.
 *
 * The mosaic engine never creates threads itself; it hands every asset read
 * to an implementation of this interface. Applications that already own a
 * thread pool can adapt it here, others can use {@link ThreadPool}.
 */
class TESSERAASYNC_API ITaskProcessor {
public:
  virtual ~ITaskProcessor() = default;

  /**
   * @brief Starts a task that executes the given function in a background
   * thread.
   *
   * Implementations must eventually call `f` exactly once. They may call it
   * before this method returns.
   *
   * @param f The function to execute.
   */
  virtual void startTask(std::function<void()> f) = 0;
};
} // namespace TesseraAsync
