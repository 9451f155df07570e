#include <TesseraAsync/TaskController.h>
#include <TesseraAsync/ThrottlingGroup.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace TesseraAsync {

ThrottlingGroup::ThrottlingGroup(
    const std::shared_ptr<ITaskProcessor>& pTaskProcessor,
    int32_t maximumRunning)
    : _pTaskProcessor(pTaskProcessor),
      _maximumRunning(maximumRunning <= 0 ? 1 : maximumRunning),
      _mutex(),
      _currentRunning(0),
      _queue() {}

void ThrottlingGroup::run(
    const std::shared_ptr<TaskController>& pController,
    std::function<void()> f,
    std::function<void()> onCanceled) {
  {
    std::lock_guard<std::mutex> lock(this->_mutex);
    this->_queue.push_back(
        Task{std::move(f), std::move(onCanceled), pController});
  }

  this->startTasks();
}

void ThrottlingGroup::dropCanceled() {
  std::vector<Task> canceled;

  {
    std::lock_guard<std::mutex> lock(this->_mutex);
    for (auto it = this->_queue.begin(); it != this->_queue.end();) {
      if (it->pController && it->pController->isCanceled()) {
        canceled.emplace_back(std::move(*it));
        it = this->_queue.erase(it);
      } else {
        ++it;
      }
    }
  }

  for (Task& task : canceled) {
    if (task.onCanceled) {
      task.onCanceled();
    }
  }
}

int32_t ThrottlingGroup::getCurrentRunning() const {
  std::lock_guard<std::mutex> lock(this->_mutex);
  return this->_currentRunning;
}

size_t ThrottlingGroup::getPendingCount() const {
  std::lock_guard<std::mutex> lock(this->_mutex);
  return this->_queue.size();
}

void ThrottlingGroup::onTaskComplete() {
  {
    std::lock_guard<std::mutex> lock(this->_mutex);
    --this->_currentRunning;
  }

  this->startTasks();
}

void ThrottlingGroup::startTasks() {
  std::shared_ptr<ITaskProcessor> pTaskProcessor;
  std::vector<Task> toStart;
  std::vector<Task> canceled;

  // Claim slots under the lock, but start the tasks after releasing it. A
  // task processor may run the task inline, and the task's completion
  // re-enters this method.
  {
    std::lock_guard<std::mutex> lock(this->_mutex);
    if (this->_queue.empty()) {
      return;
    }

    // A running task must not own the processor, or the last reference could
    // be released on one of the processor's own threads.
    pTaskProcessor = this->_pTaskProcessor.lock();

    while (!this->_queue.empty() &&
           (!pTaskProcessor || this->_currentRunning < this->_maximumRunning)) {
      Task task = std::move(this->_queue.front());
      this->_queue.pop_front();

      if (!pTaskProcessor ||
          (task.pController && task.pController->isCanceled())) {
        canceled.emplace_back(std::move(task));
        continue;
      }

      ++this->_currentRunning;
      toStart.emplace_back(std::move(task));
    }
  }

  for (Task& task : canceled) {
    if (task.onCanceled) {
      task.onCanceled();
    }
  }

  if (toStart.empty()) {
    return;
  }

  std::shared_ptr<ThrottlingGroup> pThis = this->shared_from_this();
  for (Task& task : toStart) {
    pTaskProcessor->startTask(
        [pThis, invoke = std::move(task.invoke)]() mutable {
          try {
            invoke();
          } catch (...) {
            pThis->onTaskComplete();
            throw;
          }
          pThis->onTaskComplete();
        });
  }
}

} // namespace TesseraAsync
