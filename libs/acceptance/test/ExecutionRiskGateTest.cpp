// ExecutionRiskGateTest.cpp
//
// Unit tests for posture to notional mapping, hard guard kill switch and
// block reason accounting.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <limits>
#include <memory>
#include <vector>

#include "AcceptanceOrchestrator.h"
#include "ExecutionRiskGate.h"
#include "InMemoryMetricsSink.h"
#include "MetricNames.h"
#include "RiskGovernanceException.h"
#include "TestUtils.h"

using namespace mkc_riskgov;
using Catch::Approx;

namespace
{
  std::vector<GuardEvaluation> cleanGuards()
  {
    std::vector<GuardEvaluation> guards;
    for (GuardKind kind : allGuardKinds())
      guards.push_back(GuardEvaluation{kind, 0.0, 0.0, 0.0, false, false});

    return guards;
  }

  void breachHard(std::vector<GuardEvaluation>& guards, GuardKind kind)
  {
    for (auto& g : guards)
      if (g.kind == kind)
	{
	  g.breachedSoft = true;
	  g.breachedHard = true;
	}
  }
}

TEST_CASE("ExecutionRiskGate: posture scaling", "[ExecutionRiskGate]")
{
  auto sink = std::make_shared<InMemoryMetricsSink>();
  ExecutionRiskGate gate(ExecutionGateConfiguration(), sink);

  ExecutionDecision d = gate.decide(Posture::Pass, cleanGuards(), 1000.0);
  REQUIRE(d.recommendedNotional == Approx(1000.0));
  REQUIRE(d.riskScale == 1.0);
  REQUIRE_FALSE(d.blockReason.has_value());

  d = gate.decide(Posture::Derisk, cleanGuards(), 1000.0);
  REQUIRE(d.recommendedNotional == Approx(500.0));
  REQUIRE(d.riskScale == 0.5);
  REQUIRE(*sink->getGauge(metric_names::kExecutionRiskScale, {{"profile", "default"}}) == 0.5);

  d = gate.decide(Posture::Block, cleanGuards(), 1000.0);
  REQUIRE(d.recommendedNotional == 0.0);
  REQUIRE(d.riskScale == 0.0);
  REQUIRE(*d.blockReason == ExecutionRiskGate::kPostureBlockReason);
  REQUIRE(gate.getBlockCount("posture_block") == 1);
}

TEST_CASE("ExecutionRiskGate: configured BLOCK scale", "[ExecutionRiskGate]")
{
  auto sink = std::make_shared<InMemoryMetricsSink>();
  ExecutionGateConfiguration config;
  config.scaleMap[Posture::Block] = 0.25;
  config.minNotional = 100.0;
  ExecutionRiskGate gate(config, sink);

  ExecutionDecision d = gate.decide(Posture::Block, cleanGuards(), 1000.0);
  REQUIRE(d.recommendedNotional == Approx(250.0));
  REQUIRE(d.riskScale == 0.25);
  REQUIRE_FALSE(d.blockReason.has_value());
  REQUIRE(gate.getBlockCount("posture_block") == 0);
  REQUIRE(*sink->getGauge(metric_names::kExecutionRiskScale, {{"profile", "default"}}) == 0.25);

  // Lifted to the minimum, and zero stays zero
  REQUIRE(gate.decide(Posture::Block, cleanGuards(), 200.0).recommendedNotional == Approx(100.0));
  REQUIRE(gate.decide(Posture::Block, cleanGuards(), 0.0).recommendedNotional == 0.0);

  SECTION("a hard guard still kills the order")
    {
      std::vector<GuardEvaluation> guards = cleanGuards();
      breachHard(guards, GuardKind::Kappa);

      d = gate.decide(Posture::Block, guards, 1000.0);
      REQUIRE(d.recommendedNotional == 0.0);
      REQUIRE(d.riskScale == 0.0);
      REQUIRE(*d.blockReason == "kappa");
    }
}

TEST_CASE("ExecutionRiskGate: hard guard breach kills the order", "[ExecutionRiskGate]")
{
  auto sink = std::make_shared<InMemoryMetricsSink>();
  ExecutionRiskGate gate(ExecutionGateConfiguration(), sink);

  std::vector<GuardEvaluation> guards = cleanGuards();
  breachHard(guards, GuardKind::Kappa);
  breachHard(guards, GuardKind::LatencyP95);

  // First breached guard in guard order, whatever the posture
  const ExecutionDecision d = gate.decide(Posture::Pass, guards, 1000.0);
  REQUIRE(d.recommendedNotional == 0.0);
  REQUIRE(d.riskScale == 0.0);
  REQUIRE(*d.blockReason == "latency_p95");

  gate.decide(Posture::Block, guards, 1000.0);
  REQUIRE(gate.getBlockCount("latency_p95") == 2);
  REQUIRE(gate.getBlockCount("posture_block") == 0);
  REQUIRE(sink->getCounter(metric_names::kExecutionBlockTotal,
			   {{"reason", "latency_p95"}, {"profile", "default"}}) == 2.0);

  SECTION("kill switch disabled")
    {
      ExecutionGateConfiguration config;
      config.hardBlockOnGuard = false;
      ExecutionRiskGate lenient(config);

      const ExecutionDecision e = lenient.decide(Posture::Derisk, guards, 1000.0);
      REQUIRE(e.recommendedNotional == Approx(500.0));
      REQUIRE_FALSE(e.blockReason.has_value());
    }
}

TEST_CASE("ExecutionRiskGate: notional limits", "[ExecutionRiskGate]")
{
  ExecutionGateConfiguration config;
  config.minNotional = 100.0;
  config.maxNotional = 800.0;
  ExecutionRiskGate gate(config);

  REQUIRE(gate.decide(Posture::Pass, cleanGuards(), 1000.0).recommendedNotional == Approx(800.0));
  REQUIRE(gate.decide(Posture::Derisk, cleanGuards(), 100.0).recommendedNotional == Approx(100.0));
  REQUIRE(gate.decide(Posture::Pass, cleanGuards(), 0.0).recommendedNotional == 0.0);

  const double nan = std::numeric_limits<double>::quiet_NaN();
  REQUIRE_THROWS_AS(gate.decide(Posture::Pass, cleanGuards(), -1.0), InvalidInputException);
  REQUIRE_THROWS_AS(gate.decide(Posture::Pass, cleanGuards(), nan), InvalidInputException);
}

TEST_CASE("ExecutionRiskGate: configuration", "[ExecutionRiskGate][Config]")
{
  ExecutionGateConfiguration config;
  REQUIRE(config.validationErrors().empty());

  config.scaleMap[Posture::Derisk] = 1.5;
  REQUIRE_THROWS_AS(ExecutionRiskGate(config), ConfigurationException);

  config = ExecutionGateConfiguration();
  config.minNotional = 10.0;
  config.maxNotional = 5.0;
  REQUIRE_THROWS_AS(config.validate(), ConfigurationException);
}

TEST_CASE("ExecutionRiskGate: latency scenario", "[ExecutionRiskGate][Scenario]")
{
  // Hard latency threshold 150 ms, ten cycles at 200 ms
  AcceptanceOrchestrator orchestrator;
  ExecutionRiskGate gate;

  GuardMetrics metrics;
  metrics.latencyP95 = 200.0;

  ExecutionDecision last{};
  for (std::size_t i = 1; i <= 10; ++i)
    last = gate.decide(orchestrator.step(metrics, timestampAt(i)), 1000.0);

  REQUIRE(orchestrator.getPosture() == Posture::Block);
  REQUIRE(last.riskScale == 0.0);
  REQUIRE(last.recommendedNotional == 0.0);
  REQUIRE(*last.blockReason == "latency_p95");
}
