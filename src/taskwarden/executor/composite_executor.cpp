#include "taskwarden/executor/composite_executor.hpp"

#include "taskwarden/util/log.hpp"

namespace taskwarden {

auto CompositeExecutor::register_executor(std::string name,
                                          std::shared_ptr<IExecutor> executor)
    -> void {
  executors_[std::move(name)] = std::move(executor);
}

auto CompositeExecutor::bind_task_type(std::string task_type,
                                       std::string_view executor_name)
    -> Result<void> {
  auto it = executors_.find(std::string(executor_name));
  if (it == executors_.end()) {
    log::error("CompositeExecutor: no executor named {}", executor_name);
    return fail(Error::ExecutorNotFound);
  }
  by_type_[std::move(task_type)] = it->second;
  return ok();
}

auto CompositeExecutor::resolve(std::string_view task_type) const
    -> Result<std::shared_ptr<IExecutor>> {
  auto it = by_type_.find(task_type);
  if (it == by_type_.end()) {
    return fail(Error::ExecutorNotFound);
  }
  return it->second;
}

auto CompositeExecutor::execute(std::string_view task_type,
                                ResourceId resource,
                                const TaskSettings& settings)
    -> Result<SessionResult> {
  auto executor = resolve(task_type);
  if (!executor) {
    log::error("CompositeExecutor: no executor registered for task type {}",
               task_type);
    return fail(executor.error());
  }
  return (*executor)->execute(resource, settings);
}

auto create_composite_executor(const SystemConfig& config)
    -> Result<std::unique_ptr<CompositeExecutor>> {
  auto composite = std::make_unique<CompositeExecutor>();
  composite->register_executor("noop", create_noop_executor());
  composite->register_executor("shell", create_shell_executor(config.shell));
  for (const auto& [task_type, executor] : config.executors) {
    if (auto r = composite->bind_task_type(task_type, executor); !r) {
      return fail(r.error());
    }
  }
  return composite;
}

}  // namespace taskwarden
