#include <gradebox/worker_pool.h>

#include <spdlog/spdlog.h>

WorkerPool::WorkerPool(int threads) : stopping_(false) {
  if (threads < 1) threads = 1;
  spdlog::debug("Starting {} workers", threads);
  for (int i = 0; i < threads; i++) threads_.emplace_back([this]() { WorkLoop_(); });
}

WorkerPool::~WorkerPool() {
  {
    std::lock_guard lck(mtx_);
    stopping_ = true;
  }
  cv_.notify_all();
  for (auto& i : threads_) i.join();
}

void WorkerPool::WorkLoop_() {
  std::unique_lock lck(mtx_);
  while (true) {
    cv_.wait(lck, [this]{ return stopping_ || !jobs_.empty(); });
    if (jobs_.empty()) return; // stopping
    std::function<void()> job = std::move(jobs_.front());
    jobs_.pop();
    lck.unlock();
    job();
    lck.lock();
  }
}
