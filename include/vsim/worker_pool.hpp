#pragma once
#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace vsim {

// Fixed-size pool with a single locked FIFO. A pool built with zero threads runs
// every task inline on the submitting thread (deterministic test mode).
class WorkerPool {
public:
  explicit WorkerPool(std::size_t threads) {
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
      workers_.emplace_back([this] { worker_loop_(); });
    }
  }

  ~WorkerPool() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      stop_ = true;
    }
    cv_.notify_all();
    for (auto& w : workers_) w.join();
  }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  std::size_t thread_count() const noexcept { return workers_.size(); }
  bool inline_mode() const noexcept { return workers_.empty(); }

  template <class F, class R = std::invoke_result_t<std::decay_t<F>>>
  std::future<R> enqueue(F&& f) {
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
    std::future<R> fut = task->get_future();
    if (inline_mode()) {
      (*task)();
      return fut;
    }
    {
      std::lock_guard<std::mutex> lk(mu_);
      tasks_.emplace([task = std::move(task)]() { (*task)(); });
    }
    cv_.notify_one();
    return fut;
  }

  // Splits [0, n) into contiguous ranges, one task per worker, and blocks until
  // all ranges are done. fn(begin, end) must only touch elements of its range.
  template <class F>
  void parallel_for(std::size_t n, F&& fn) {
    if (n == 0) return;
    const std::size_t parts = std::max<std::size_t>(1, std::min(n, thread_count()));
    if (parts == 1) {
      fn(std::size_t{0}, n);
      return;
    }
    const std::size_t chunk = (n + parts - 1) / parts;
    std::vector<std::future<void>> futs;
    futs.reserve(parts);
    for (std::size_t begin = 0; begin < n; begin += chunk) {
      const std::size_t end = std::min(n, begin + chunk);
      futs.push_back(enqueue([&fn, begin, end]() { fn(begin, end); }));
    }
    for (auto& f : futs) f.wait();
    for (auto& f : futs) f.get();  // rethrows a range's exception on the caller
  }

private:
  void worker_loop_() {
    for (;;) {
      std::function<void()> task;
      {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [this] { return stop_ || !tasks_.empty(); });
        if (stop_ && tasks_.empty()) return;
        task = std::move(tasks_.front());
        tasks_.pop();
      }
      task();
    }
  }

  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool stop_{false};
};

} // namespace vsim
