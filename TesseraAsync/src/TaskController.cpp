#include <TesseraAsync/TaskController.h>

namespace TesseraAsync {

TaskController::TaskController() noexcept : _canceled(false) {}

void TaskController::cancel() noexcept {
  this->_canceled.store(true, std::memory_order_release);
}

bool TaskController::isCanceled() const noexcept {
  return this->_canceled.load(std::memory_order_acquire);
}

} // namespace TesseraAsync
