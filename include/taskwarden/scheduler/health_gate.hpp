#pragma once

#include "taskwarden/config/system_config.hpp"
#include "taskwarden/core/error.hpp"
#include "taskwarden/scheduler/task.hpp"
#include "taskwarden/util/id.hpp"

#include <memory>

namespace taskwarden {

// Scores a resource on a 0..100 scale. May fail or throw.
class IScorer {
public:
  virtual ~IScorer() = default;
  [[nodiscard]] virtual auto score(ResourceId resource) -> Result<double> = 0;
};

class FixedScorer final : public IScorer {
public:
  explicit FixedScorer(double value) noexcept : value_(value) {
  }
  [[nodiscard]] auto score(ResourceId) -> Result<double> override {
    return value_;
  }

private:
  double value_;
};

// Switches a task into passive mode when its resource looks risky or
// unhealthy. A scorer that cannot answer counts as risky.
class HealthGate {
public:
  HealthGate(std::shared_ptr<IScorer> risk, std::shared_ptr<IScorer> health,
             HealthGateConfig config = {});

  [[nodiscard]] auto decide(ResourceId resource, TaskSettings settings) const
      -> TaskSettings;

private:
  [[nodiscard]] auto needs_passive(ResourceId resource) const -> bool;

  std::shared_ptr<IScorer> risk_;
  std::shared_ptr<IScorer> health_;
  HealthGateConfig config_;
};

}  // namespace taskwarden
