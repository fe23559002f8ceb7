#pragma once

#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace archlens {

inline std::size_t HardwareConcurrency() {
  const auto count = std::thread::hardware_concurrency();
  return count > 0 ? count : 1;
}

// Fixed set of threads draining a FIFO task queue. Tasks report results and
// exceptions through the returned future.
class WorkerPool {
public:
  explicit WorkerPool(std::size_t thread_count = 0) {
    if (thread_count == 0) {
      thread_count = HardwareConcurrency();
    }
    workers_.reserve(thread_count);
    for (std::size_t i = 0; i < thread_count; ++i) {
      workers_.emplace_back([this] { WorkerLoop(); });
    }
  }

  ~WorkerPool() {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      stopping_ = true;
    }
    condition_.notify_all();
    for (auto &worker : workers_) {
      if (worker.joinable()) {
        worker.join();
      }
    }
  }

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  template <typename Function>
  auto Submit(Function &&function)
      -> std::future<std::invoke_result_t<Function>> {
    using Result = std::invoke_result_t<Function>;
    auto task = std::make_shared<std::packaged_task<Result()>>(
        std::forward<Function>(function));
    auto future = task->get_future();
    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (stopping_) {
        throw std::runtime_error("Cannot submit to a stopped worker pool");
      }
      tasks_.emplace([task]() { (*task)(); });
    }
    condition_.notify_one();
    return future;
  }

  std::size_t size() const { return workers_.size(); }

private:
  void WorkerLoop() {
    while (true) {
      std::function<void()> task;
      {
        std::unique_lock<std::mutex> lock(mutex_);
        condition_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
        if (stopping_ && tasks_.empty()) {
          return;
        }
        task = std::move(tasks_.front());
        tasks_.pop();
      }
      task();
    }
  }

  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;
  std::mutex mutex_;
  std::condition_variable condition_;
  bool stopping_ = false;
};

// Applies function to every item on the pool; results keep input order.
template <typename Item, typename Function>
auto ParallelMap(WorkerPool &pool, const std::vector<Item> &items,
                 Function function)
    -> std::vector<std::invoke_result_t<Function, const Item &>> {
  using Result = std::invoke_result_t<Function, const Item &>;
  std::vector<std::future<Result>> futures;
  futures.reserve(items.size());
  for (const auto &item : items) {
    futures.push_back(pool.Submit([&function, &item]() { return function(item); }));
  }
  // Every task must finish before function and items go out of scope.
  std::vector<Result> results;
  results.reserve(items.size());
  std::exception_ptr failure;
  for (auto &future : futures) {
    if (failure) {
      future.wait();
      continue;
    }
    try {
      results.push_back(future.get());
    } catch (...) {
      failure = std::current_exception();
    }
  }
  if (failure) {
    std::rethrow_exception(failure);
  }
  return results;
}

} // namespace archlens
