#pragma once

#include "taskwarden/config/system_config.hpp"
#include "taskwarden/core/error.hpp"
#include "taskwarden/executor/executor.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace taskwarden {

// Picks an executor by task type. Executors are registered by name and task
// types are bound to those names, so several types can share one executor.
class CompositeExecutor {
public:
  CompositeExecutor() = default;

  CompositeExecutor(const CompositeExecutor&) = delete;
  auto operator=(const CompositeExecutor&) -> CompositeExecutor& = delete;
  CompositeExecutor(CompositeExecutor&&) noexcept = default;
  auto operator=(CompositeExecutor&&) noexcept -> CompositeExecutor& = default;

  auto register_executor(std::string name, std::shared_ptr<IExecutor> executor)
      -> void;

  [[nodiscard]] auto bind_task_type(std::string task_type,
                                    std::string_view executor_name)
      -> Result<void>;

  [[nodiscard]] auto resolve(std::string_view task_type) const
      -> Result<std::shared_ptr<IExecutor>>;

  [[nodiscard]] auto execute(std::string_view task_type, ResourceId resource,
                             const TaskSettings& settings)
      -> Result<SessionResult>;

private:
  std::unordered_map<std::string, std::shared_ptr<IExecutor>> executors_;
  std::map<std::string, std::shared_ptr<IExecutor>, std::less<>> by_type_;
};

// Registers the built-in noop and shell executors and binds task types from
// config.executors.
[[nodiscard]] auto create_composite_executor(const SystemConfig& config)
    -> Result<std::unique_ptr<CompositeExecutor>>;

}  // namespace taskwarden
