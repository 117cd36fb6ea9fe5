#pragma once

#include "taskwarden/core/error.hpp"
#include "taskwarden/scheduler/task.hpp"
#include "taskwarden/storage/task_repository.hpp"

#include <cstddef>
#include <functional>

namespace taskwarden {

struct RecoveryResult {
  std::size_t tasks_reopened{0};
  std::size_t tasks_requeued{0};
};

class Recovery {
public:
  explicit Recovery(TaskRepository& tasks);

  // Reopens tasks a previous process left RUNNING, then hands every
  // dispatchable task to on_recovered.
  [[nodiscard]] auto recover(std::move_only_function<void(Task)> on_recovered)
      -> Result<RecoveryResult>;

private:
  TaskRepository& tasks_;
};

}  // namespace taskwarden
