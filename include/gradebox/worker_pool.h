#ifndef INCLUDE_GRADEBOX_WORKER_POOL_H_
#define INCLUDE_GRADEBOX_WORKER_POOL_H_

#include <queue>
#include <mutex>
#include <memory>
#include <future>
#include <thread>
#include <vector>
#include <functional>
#include <type_traits>
#include <condition_variable>

// Threads for blocking work (engine calls). Submit returns a future that
//   yields the result or rethrows what the job threw.
class WorkerPool {
  std::vector<std::thread> threads_;
  std::queue<std::function<void()>> jobs_;
  std::mutex mtx_;
  std::condition_variable cv_;
  bool stopping_;

  void WorkLoop_();
 public:
  explicit WorkerPool(int threads);
  // finishes queued jobs first
  ~WorkerPool();
  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  size_t Size() const { return threads_.size(); }

  template <class Func>
  std::future<std::invoke_result_t<Func>> Submit(Func&& func) {
    using Result = std::invoke_result_t<Func>;
    // std::function needs a copyable callable
    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Func>(func));
    std::future<Result> ret = task->get_future();
    {
      std::lock_guard lck(mtx_);
      jobs_.emplace([task]() { (*task)(); });
    }
    cv_.notify_one();
    return ret;
  }
};

#endif  // INCLUDE_GRADEBOX_WORKER_POOL_H_
