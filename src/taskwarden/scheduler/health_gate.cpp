#include "taskwarden/scheduler/health_gate.hpp"

#include "taskwarden/util/log.hpp"

#include <cmath>
#include <exception>

namespace taskwarden {

HealthGate::HealthGate(std::shared_ptr<IScorer> risk,
                       std::shared_ptr<IScorer> health, HealthGateConfig config)
    : risk_(std::move(risk)), health_(std::move(health)), config_(config) {
}

auto HealthGate::needs_passive(ResourceId resource) const -> bool {
  try {
    auto risk = risk_->score(resource);
    if (!risk) {
      log::warn("Risk scorer failed for resource {}: {}", resource,
                risk.error().message());
      return true;
    }
    if (!std::isfinite(*risk)) {
      log::warn("Risk scorer returned {} for resource {}", *risk, resource);
      return true;
    }
    if (*risk >= config_.risk_threshold) {
      log::info("Resource {} risk {:.1f} >= {:.1f}, passive mode", resource,
                *risk, config_.risk_threshold);
      return true;
    }

    auto health = health_->score(resource);
    if (!health) {
      log::warn("Health scorer failed for resource {}: {}", resource,
                health.error().message());
      return true;
    }
    if (!std::isfinite(*health)) {
      log::warn("Health scorer returned {} for resource {}", *health,
                resource);
      return true;
    }
    if (*health < config_.health_threshold) {
      log::info("Resource {} health {:.1f} < {:.1f}, passive mode", resource,
                *health, config_.health_threshold);
      return true;
    }
    return false;
  } catch (const std::exception& e) {
    log::warn("Scorer threw for resource {}: {}", resource, e.what());
    return true;
  }
}

auto HealthGate::decide(ResourceId resource, TaskSettings settings) const
    -> TaskSettings {
  if (needs_passive(resource)) {
    settings.force_passive = true;
  }
  return settings;
}

}  // namespace taskwarden
