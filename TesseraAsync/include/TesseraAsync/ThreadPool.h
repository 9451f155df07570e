#pragma once

#include <TesseraAsync/ITaskProcessor.h>
#include <TesseraAsync/Library.h>

#include <cstdint>
#include <functional>
#include <memory>

namespace TesseraAsync {

/**
 * @brief An {@link ITaskProcessor} backed by a fixed number of Async++ worker
 * threads.
 *
 * Destroying the pool waits for the tasks that are currently running to
 * finish. For that reason the last reference to a pool must not be released
 * by one of the pool's own tasks; keep the pool owned by something that
 * outlives every task it runs.
 */
class TESSERAASYNC_API ThreadPool final : public ITaskProcessor {
public:
  /**
   * @brief Creates a new thread pool with the given number of threads.
   *
   * @param numberOfThreads The number of threads to create. Values less than
   * one create a single thread.
   */
  ThreadPool(int32_t numberOfThreads);
  ~ThreadPool() override;

  void startTask(std::function<void()> f) override;

  /**
   * @brief Gets the number of worker threads in this pool.
   */
  int32_t getNumberOfThreads() const noexcept {
    return this->_numberOfThreads;
  }

private:
  struct Scheduler;

  int32_t _numberOfThreads;
  std::shared_ptr<Scheduler> _pScheduler;
};

} // namespace TesseraAsync
