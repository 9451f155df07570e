#pragma once

#include <TesseraAsync/ITaskProcessor.h>
#include <TesseraAsync/Library.h>
#include <TesseraAsync/TaskController.h>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>

namespace TesseraAsync {

/**
 * @brief Limits how many tasks run at the same time.
 *
 * Tasks are started in the order they were queued, on the
 * {@link ITaskProcessor} supplied at construction, and never more than
 * `maximumRunning` at once. When a task finishes, the next queued task
 * starts. A queued task whose {@link TaskController} has been canceled is
 * never started; its cancellation callback is invoked instead.
 *
 * Instances must be owned by a `std::shared_ptr`, because running tasks keep
 * the group alive until they complete. The group does not keep the task
 * processor alive. Tasks queued after the processor is destroyed are never
 * started; their cancellation callbacks are invoked instead.
 */
class TESSERAASYNC_API ThrottlingGroup final
    : public std::enable_shared_from_this<ThrottlingGroup> {
public:
  /**
   * @brief Creates a new group.
   *
   * @param pTaskProcessor Runs the tasks. Only a weak reference is kept.
   * @param maximumRunning The maximum number of tasks that may be running at
   * once. Values less than one allow a single task.
   */
  ThrottlingGroup(
      const std::shared_ptr<ITaskProcessor>& pTaskProcessor,
      int32_t maximumRunning);

  /**
   * @brief Queues a task.
   *
   * @param pController Cancels the task if it has not started yet.
   * @param f The work to do. If it throws, the exception propagates out of
   * the task processor after the slot has been released.
   * @param onCanceled Invoked instead of `f` if the controller is canceled
   * before the task starts. May be empty.
   */
  void run(
      const std::shared_ptr<TaskController>& pController,
      std::function<void()> f,
      std::function<void()> onCanceled = {});

  /**
   * @brief Drops every queued task whose controller has been canceled,
   * invoking the cancellation callbacks in queue order.
   *
   * Tasks are also dropped lazily as slots free up. Call this after
   * canceling to have the callbacks fire right away.
   */
  void dropCanceled();

  /**
   * @brief Gets the maximum number of tasks that may run at once.
   */
  int32_t getMaximumRunning() const noexcept { return this->_maximumRunning; }

  /**
   * @brief Gets the number of tasks that are running right now.
   */
  int32_t getCurrentRunning() const;

  /**
   * @brief Gets the number of tasks that are queued but not yet started.
   */
  size_t getPendingCount() const;

private:
  struct Task {
    std::function<void()> invoke;
    std::function<void()> onCanceled;
    std::shared_ptr<TaskController> pController;
  };

  void onTaskComplete();
  void startTasks();

  std::weak_ptr<ITaskProcessor> _pTaskProcessor;
  int32_t _maximumRunning;

  mutable std::mutex _mutex;
  int32_t _currentRunning;
  std::deque<Task> _queue;
};

} // namespace TesseraAsync
