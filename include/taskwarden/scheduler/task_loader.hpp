#pragma once

#include "taskwarden/scheduler/scheduler.hpp"
#include "taskwarden/storage/task_repository.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

namespace taskwarden {

// Periodically feeds dispatchable tasks from storage into the scheduler.
class TaskLoader {
public:
  TaskLoader(TaskRepository& tasks, Scheduler& scheduler,
             std::chrono::milliseconds interval);
  ~TaskLoader();

  TaskLoader(const TaskLoader&) = delete;
  TaskLoader& operator=(const TaskLoader&) = delete;

  auto start() -> void;
  auto stop() -> void;

  // One poll. Returns how many tasks the scheduler accepted.
  auto load_once() -> std::size_t;

private:
  auto loop() -> void;

  TaskRepository& tasks_;
  Scheduler& scheduler_;
  std::chrono::milliseconds interval_;

  std::atomic<bool> running_{false};
  std::mutex mu_;
  std::condition_variable cv_;
  std::thread thread_;
};

}  // namespace taskwarden
