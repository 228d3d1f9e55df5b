#include <algorithm>

#include "Support/ThreadPool.h"

namespace taintreach {

unsigned ThreadPool::computeWorkerCount(unsigned Requested, size_t NumTasks) {
  unsigned NCores = std::max(1u, std::thread::hardware_concurrency());
  unsigned N = Requested == 0 ? NCores : std::min(Requested, NCores);
  if (NumTasks < N)
    N = static_cast<unsigned>(NumTasks);
  return N;
}

// Constructs the thread pool and launches worker threads.
ThreadPool::ThreadPool(unsigned NumWorkers) : IsStop(false) {
  for (unsigned I = 0; I < NumWorkers; ++I) {
    Workers.emplace_back([this] {
      for (;;) {
        std::function<void()> Task;

        {
          std::unique_lock<std::mutex> Lock(this->QueueMutex);
          this->Condition.wait(Lock, [this] {
            return this->IsStop || !this->TaskQueue.empty();
          });
          // If ThreadPool already stopped, return without checking
          // tasks.
          if (this->IsStop)
            return;

          Task = std::move(this->TaskQueue.front());
          this->TaskQueue.pop();
        }

        Task();
      }
    });
  }
}

// Destructor joins all worker threads. Queued tasks that never started are
// dropped; their futures report a broken promise.
ThreadPool::~ThreadPool() {
  {
    std::unique_lock<std::mutex> Lock(QueueMutex);
    IsStop = true;
  }
  Condition.notify_all();
  for (std::thread &Worker : Workers) {
    Worker.join();
  }
}

} // namespace taintreach
