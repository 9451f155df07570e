#include <TesseraAsync/ThreadPool.h>

#include <async++.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

namespace TesseraAsync {

struct ThreadPool::Scheduler {
  Scheduler(int32_t numberOfThreads) : scheduler(size_t(numberOfThreads)) {}

  async::threadpool_scheduler scheduler;
};

ThreadPool::ThreadPool(int32_t numberOfThreads)
    : _numberOfThreads(numberOfThreads <= 0 ? 1 : numberOfThreads),
      _pScheduler(std::make_shared<Scheduler>(this->_numberOfThreads)) {}

ThreadPool::~ThreadPool() = default;

void ThreadPool::startTask(std::function<void()> f) {
  async::spawn(this->_pScheduler->scheduler, std::move(f));
}

} // namespace TesseraAsync
