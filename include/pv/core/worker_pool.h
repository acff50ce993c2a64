#pragma once
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

#include "pv/error.h"

namespace pv::core {

// Fixed-size thread pool. Tasks run in submission order per worker; results and
// exceptions come back through the returned future.
class WorkerPool {
public:
  explicit WorkerPool(size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  template <class F>
  auto Submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>>;

  size_t size() const noexcept { return workers_.size(); }

private:
  void WorkerLoop();

  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;
  std::mutex queue_mutex_;
  std::condition_variable condition_;
  bool stop_{false};
};

template <class F>
auto WorkerPool::Submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
  using ReturnType = std::invoke_result_t<std::decay_t<F>>;

  auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(fn));
  std::future<ReturnType> result = task->get_future();
  {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    if (stop_) {
      throw Error{ErrorDomain::State, errors::state::kPoolStopped, "submit on stopped WorkerPool"};
    }
    tasks_.emplace([task]() { (*task)(); });
  }
  condition_.notify_one();
  return result;
}

} // namespace pv::core
