#include "taskwarden/executor/executor.hpp"

namespace taskwarden {

class NoopExecutor : public IExecutor {
public:
  ~NoopExecutor() override = default;

  auto execute(ResourceId resource, const TaskSettings& settings)
      -> Result<SessionResult> override {
    SessionResult result;
    result.session_metadata["resource_id"] = resource.value();
    result.session_metadata["passive"] = settings.force_passive;
    return result;
  }
};

auto create_noop_executor() -> std::unique_ptr<IExecutor> {
  return std::make_unique<NoopExecutor>();
}

}  // namespace taskwarden
