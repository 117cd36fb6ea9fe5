#pragma once

#include "taskwarden/config/system_config.hpp"
#include "taskwarden/core/error.hpp"
#include "taskwarden/scheduler/task.hpp"
#include "taskwarden/util/id.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace taskwarden {

// Outcome of one automation session against a resource.
struct SessionResult {
  nlohmann::json actions_performed = nlohmann::json::object();
  std::vector<std::string> errors;
  nlohmann::json session_metadata = nlohmann::json::object();
  // Phase the resource is in after the session, if the executor moved it.
  std::optional<std::string> current_phase;
};

void to_json(nlohmann::json& j, const SessionResult& r);
void from_json(const nlohmann::json& j, SessionResult& r);

// Runs one session synchronously on the calling worker thread. Errors are
// returned; an implementation that throws is caught by the scheduler.
class IExecutor {
public:
  virtual ~IExecutor() = default;

  [[nodiscard]] virtual auto execute(ResourceId resource,
                                     const TaskSettings& settings)
      -> Result<SessionResult> = 0;
};

[[nodiscard]] auto create_noop_executor() -> std::unique_ptr<IExecutor>;
[[nodiscard]] auto create_shell_executor(ShellExecutorConfig config)
    -> std::unique_ptr<IExecutor>;

}  // namespace taskwarden
