#include "taskwarden/scheduler/health_gate.hpp"

#include <limits>
#include <stdexcept>

#include "gtest/gtest.h"

using namespace taskwarden;

namespace {

class FailingScorer final : public IScorer {
public:
  auto score(ResourceId) -> Result<double> override {
    return fail(Error::Timeout);
  }
};

class ThrowingScorer final : public IScorer {
public:
  auto score(ResourceId) -> Result<double> override {
    throw std::runtime_error("scoring service unreachable");
  }
};

auto gate(double risk, double health) -> HealthGate {
  return HealthGate(std::make_shared<FixedScorer>(risk),
                    std::make_shared<FixedScorer>(health));
}

}  // namespace

TEST(HealthGateTest, LowRiskHealthyResource_KeepsSettings) {
  TaskSettings settings;
  settings.warmup_speed = "fast";

  auto decided = gate(10, 90).decide(ResourceId{42}, settings);

  EXPECT_FALSE(decided.force_passive);
  EXPECT_EQ(decided.warmup_speed, "fast");
}

TEST(HealthGateTest, RiskAtOrAboveThreshold_ForcesPassive) {
  EXPECT_TRUE(gate(75, 90).decide(ResourceId{42}, {}).force_passive);
  EXPECT_TRUE(gate(60, 90).decide(ResourceId{42}, {}).force_passive);
  EXPECT_FALSE(gate(59.9, 90).decide(ResourceId{42}, {}).force_passive);
}

TEST(HealthGateTest, HealthBelowThreshold_ForcesPassive) {
  EXPECT_TRUE(gate(0, 39).decide(ResourceId{42}, {}).force_passive);
  EXPECT_FALSE(gate(0, 40).decide(ResourceId{42}, {}).force_passive);
}

TEST(HealthGateTest, AlreadyPassive_StaysPassive) {
  TaskSettings settings;
  settings.force_passive = true;

  EXPECT_TRUE(gate(0, 100).decide(ResourceId{42}, settings).force_passive);
}

TEST(HealthGateTest, ScorerError_ForcesPassive) {
  HealthGate g(std::make_shared<FailingScorer>(),
               std::make_shared<FixedScorer>(100));

  EXPECT_TRUE(g.decide(ResourceId{42}, {}).force_passive);
}

TEST(HealthGateTest, ScorerThrows_ForcesPassive) {
  HealthGate g(std::make_shared<FixedScorer>(0),
               std::make_shared<ThrowingScorer>());

  EXPECT_TRUE(g.decide(ResourceId{42}, {}).force_passive);
}

TEST(HealthGateTest, CustomThresholds) {
  HealthGate g(std::make_shared<FixedScorer>(75),
               std::make_shared<FixedScorer>(50),
               HealthGateConfig{.risk_threshold = 80, .health_threshold = 40});

  EXPECT_FALSE(g.decide(ResourceId{42}, {}).force_passive);
}

TEST(HealthGateTest, NonFiniteScore_ForcesPassive) {
  constexpr double nan = std::numeric_limits<double>::quiet_NaN();
  constexpr double inf = std::numeric_limits<double>::infinity();

  EXPECT_TRUE(gate(nan, 90).decide(ResourceId{42}, {}).force_passive);
  EXPECT_TRUE(gate(0, nan).decide(ResourceId{42}, {}).force_passive);
  EXPECT_TRUE(gate(0, inf).decide(ResourceId{42}, {}).force_passive);
  EXPECT_TRUE(gate(-inf, 90).decide(ResourceId{42}, {}).force_passive);
}
