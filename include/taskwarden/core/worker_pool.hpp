#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace taskwarden {

// Fixed-size thread pool. Jobs return std::future so the caller can poll
// for completion instead of blocking on it.
class WorkerPool {
public:
  explicit WorkerPool(std::size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  auto operator=(const WorkerPool&) -> WorkerPool& = delete;

  template <typename Fn>
  [[nodiscard]] auto submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
    using R = std::invoke_result_t<Fn>;
    auto job = std::make_shared<std::packaged_task<R()>>(std::forward<Fn>(fn));
    auto future = job->get_future();
    {
      std::lock_guard lock(mu_);
      jobs_.emplace_back([job] { (*job)(); });
    }
    cv_.notify_one();
    return future;
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return threads_.size();
  }

  // Drains queued jobs and joins every thread. Idempotent.
  auto shutdown() -> void;

private:
  auto worker_loop() -> void;

  std::vector<std::thread> threads_;
  std::deque<std::move_only_function<void()>> jobs_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool stopping_{false};
};

}  // namespace taskwarden
