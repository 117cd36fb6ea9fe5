#include "taskwarden/scheduler/task_loader.hpp"

#include "taskwarden/core/constants.hpp"
#include "taskwarden/util/log.hpp"

namespace taskwarden {

TaskLoader::TaskLoader(TaskRepository& tasks, Scheduler& scheduler,
                       std::chrono::milliseconds interval)
    : tasks_(tasks), scheduler_(scheduler), interval_(interval) {
}

TaskLoader::~TaskLoader() {
  stop();
}

auto TaskLoader::start() -> void {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread([this] { loop(); });
}

auto TaskLoader::stop() -> void {
  if (!running_.exchange(false)) {
    return;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

auto TaskLoader::load_once() -> std::size_t {
  auto batch = tasks_.list_dispatchable(limits::kLoaderBatchSize);
  if (!batch) {
    log::error("Task loader: listing dispatchable tasks failed: {}",
               batch.error().message());
    return 0;
  }

  std::size_t accepted = 0;
  for (auto& task : *batch) {
    if (scheduler_.submit(std::move(task))) {
      ++accepted;
    }
  }
  if (accepted > 0) {
    log::info("Task loader: queued {} new task(s)", accepted);
  }
  return accepted;
}

auto TaskLoader::loop() -> void {
  while (running_.load(std::memory_order_acquire)) {
    load_once();

    std::unique_lock lock(mu_);
    cv_.wait_for(lock, interval_, [this] {
      return !running_.load(std::memory_order_acquire);
    });
  }
}

}  // namespace taskwarden
