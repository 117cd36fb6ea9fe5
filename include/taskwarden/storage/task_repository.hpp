#pragma once

#include "taskwarden/core/error.hpp"
#include "taskwarden/scheduler/task.hpp"
#include "taskwarden/storage/durable_store.hpp"
#include "taskwarden/util/id.hpp"
#include "taskwarden/util/time.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taskwarden {

struct NewTask {
  OwnerId owner_id;
  ResourceId resource_id;
  std::string task_type{"warmup"};
  TaskSettings settings;
  TaskProgress progress;
};

struct TaskStatistics {
  std::int64_t pending{0};
  std::int64_t running{0};
  std::int64_t completed{0};
  std::int64_t failed{0};

  [[nodiscard]] auto total() const noexcept -> std::int64_t {
    return pending + running + completed + failed;
  }
};

// Every accessor that takes an OwnerId filters on it in SQL, so a caller can
// never read or change a row that belongs to another tenant.
class TaskRepository {
public:
  explicit TaskRepository(DurableStore& store, NowFn now = system_now);

  // Creates the schema on every reachable endpoint.
  [[nodiscard]] auto migrate() -> Result<void>;

  [[nodiscard]] auto create(const NewTask& task) -> Result<Task>;
  [[nodiscard]] auto get(OwnerId owner, TaskId id) -> Result<Task>;
  [[nodiscard]] auto list_for_owner(OwnerId owner, std::size_t limit,
                                    std::optional<TaskStatus> status = {})
      -> Result<std::vector<Task>>;
  [[nodiscard]] auto statistics(OwnerId owner) -> Result<TaskStatistics>;

  [[nodiscard]] auto mark_running(OwnerId owner, TaskId id) -> Result<void>;
  [[nodiscard]] auto mark_completed(OwnerId owner, TaskId id,
                                    const TaskProgress& progress)
      -> Result<void>;
  [[nodiscard]] auto mark_failed(OwnerId owner, TaskId id,
                                 const TaskProgress& progress,
                                 std::string_view error) -> Result<void>;

  // Not tenant scoped; used by the loader. PENDING tasks plus FAILED tasks
  // that carry a retry time.
  [[nodiscard]] auto list_dispatchable(std::size_t limit)
      -> Result<std::vector<Task>>;

  // RUNNING rows left behind by a dead process go back to PENDING.
  [[nodiscard]] auto reopen_stale_running() -> Result<std::size_t>;

private:
  DurableStore& store_;
  NowFn now_;
};

}  // namespace taskwarden
