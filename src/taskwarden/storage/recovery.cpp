#include "taskwarden/storage/recovery.hpp"

#include "taskwarden/core/constants.hpp"
#include "taskwarden/util/log.hpp"

namespace taskwarden {

Recovery::Recovery(TaskRepository& tasks) : tasks_(tasks) {
}

auto Recovery::recover(std::move_only_function<void(Task)> on_recovered)
    -> Result<RecoveryResult> {
  RecoveryResult result;

  auto reopened = tasks_.reopen_stale_running();
  if (!reopened) {
    log::error("Failed to reopen stale running tasks: {}",
               reopened.error().message());
    return fail(reopened.error());
  }
  result.tasks_reopened = *reopened;
  if (result.tasks_reopened > 0) {
    log::warn("Reopened {} task(s) left running by a previous process",
              result.tasks_reopened);
  }

  auto dispatchable = tasks_.list_dispatchable(limits::kLoaderBatchSize);
  if (!dispatchable) {
    log::error("Failed to list dispatchable tasks");
    return fail(dispatchable.error());
  }
  for (auto& task : *dispatchable) {
    on_recovered(std::move(task));
    ++result.tasks_requeued;
  }

  log::info("Recovery complete: {} reopened, {} requeued",
            result.tasks_reopened, result.tasks_requeued);
  return ok(std::move(result));
}

}  // namespace taskwarden
