#ifndef TAINTREACH_SUPPORT_THREADPOOL_H
#define TAINTREACH_SUPPORT_THREADPOOL_H

#include <llvm/Support/ErrorHandling.h>

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace taintreach {

/// Fixed-size worker pool. With zero workers every task runs inline in
/// enqueue(), which keeps single-threaded runs free of thread overhead.
class ThreadPool {
public:
    explicit ThreadPool(unsigned NumWorkers);
    ~ThreadPool();

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;

    /// add new work item to the pool
    template<class F, class... Args>
    auto enqueue(F &&, Args &&...) -> std::future<typename std::result_of<F(Args...)>::type>;

    /// min(Requested, hardware cores, NumTasks); Requested == 0 means "cores".
    static unsigned computeWorkerCount(unsigned Requested, size_t NumTasks);

private:
    /// we need to keep track of threads so we can join them
    std::vector<std::thread> Workers;

    /// the task queue containing tasks
    std::queue<std::function<void()>> TaskQueue;

    std::mutex QueueMutex;             ///< The lock
    std::condition_variable Condition; ///< the wait cond

    bool IsStop; ///< identifying if the thread pool is running
};


template<class F, class... Args>
auto ThreadPool::enqueue(F &&Func, Args &&... Arguments) -> std::future<typename std::result_of<F(Args...)>::type> {
    using return_type = typename std::result_of<F(Args...)>::type; // The return type

    auto Task = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(Func), std::forward<Args>(Arguments)...));
    std::future<return_type> Res = Task->get_future();

    if (Workers.empty()) {
        (*Task)();
        return Res;
    }

    {
        std::unique_lock<std::mutex> Lock(QueueMutex); // acquiring lock

        // don't allow to enqueue after stopping the pool
        if (IsStop)
            llvm_unreachable("enqueue on stopped ThreadPool");

        TaskQueue.emplace([Task]() { (*Task)(); });
    }
    Condition.notify_one();
    return Res;
}

} // namespace taintreach

#endif // TAINTREACH_SUPPORT_THREADPOOL_H
