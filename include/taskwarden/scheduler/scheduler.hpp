#pragma once

#include "taskwarden/config/system_config.hpp"
#include "taskwarden/core/worker_pool.hpp"
#include "taskwarden/executor/composite_executor.hpp"
#include "taskwarden/logging/tenant_log.hpp"
#include "taskwarden/scheduler/health_gate.hpp"
#include "taskwarden/scheduler/retry_policy.hpp"
#include "taskwarden/scheduler/task.hpp"
#include "taskwarden/storage/task_repository.hpp"
#include "taskwarden/util/id.hpp"
#include "taskwarden/util/time.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <future>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace taskwarden {

struct SchedulerStats {
  std::size_t queued{0};
  std::size_t in_flight{0};
  std::size_t active_resources{0};
  std::unordered_map<OwnerId, int> active_per_owner;
  std::uint64_t completed{0};
  std::uint64_t failed{0};
};

// Dispatches tasks onto a bounded worker pool.
//
// Admission, checked in order on every scan:
//   - at most one in-flight task per resource
//   - at most max_per_user in-flight tasks per owner
//   - a failed task waits until progress.next_attempt_at
// A task that fails any check goes to the back of the queue.
//
// The dispatch thread only does bookkeeping. Workers mark the task RUNNING,
// run it and persist the outcome before its admission marks are released.
class Scheduler {
public:
  struct Collaborators {
    TaskRepository& tasks;
    CompositeExecutor& executors;
    HealthGate& gate;
    RetryPolicy& retry;
    LogSink& tenant_log;
  };

  Scheduler(SchedulerConfig config, Collaborators deps,
            NowFn now = system_now);
  ~Scheduler();

  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  // Queues the task unless the same id is already queued or in flight.
  auto submit(Task task) -> bool;

  // Starts the dispatch thread. Non-blocking.
  auto start() -> void;
  auto run() -> void {
    start();
  }

  // Stops admitting, then waits up to shutdown_timeout for in-flight work.
  // Returns true when everything finished in time.
  auto stop() -> bool;

  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto stats() const -> SchedulerStats;

private:
  struct Outcome {
    Task task;
    bool requeue{false};
  };

  struct InFlight {
    TaskId id;
    OwnerId owner;
    ResourceId resource;
    std::future<Outcome> result;
  };

  auto dispatch_loop() -> void;
  auto reap() -> void;
  auto dispatch() -> void;
  [[nodiscard]] auto try_admit(const Task& task) -> bool;
  auto release(OwnerId owner, ResourceId resource) -> void;
  auto settle(InFlight& job) -> void;

  // Per-task boundary; never throws.
  auto execute(Task task) -> Outcome;
  auto execute_session(Task& task) -> Outcome;
  auto on_failure(Task task, std::string_view error) -> Outcome;

  SchedulerConfig config_;
  Collaborators deps_;
  NowFn now_;

  mutable std::mutex queue_mu_;
  std::deque<Task> queue_;
  std::unordered_set<TaskId> tracked_;

  // Admission state: resource exclusivity and per-owner counters.
  mutable std::mutex admission_mu_;
  std::unordered_set<ResourceId> active_resources_;
  std::unordered_map<OwnerId, int> active_per_owner_;

  // Owned by the dispatch thread until stop() joins it.
  std::vector<InFlight> in_flight_;

  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{true};
  std::atomic<std::size_t> in_flight_count_{0};
  std::atomic<std::uint64_t> completed_{0};
  std::atomic<std::uint64_t> failed_{0};

  std::mutex wake_mu_;
  std::condition_variable wake_cv_;
  std::thread loop_thread_;

  // Last member: destroyed first, so workers are joined while the state
  // they touch is still alive.
  WorkerPool pool_;
};

}  // namespace taskwarden
