// SequentialGovernanceTesterTest.cpp
//
// Unit tests for SequentialGovernanceTester:
//  - Wald boundaries and ACCEPT_H1 / ACCEPT_H0 decisions
//  - the alpha budget interlock (denied spend keeps the test at CONTINUE)
//  - min/max sample rules, run reset and restart spends
//  - the unknown-variance GLR model
//  - state capture and restore

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>

#include "AlphaSpendingLedger.h"
#include "AlphaSpendingPolicy.h"
#include "InMemoryMetricsSink.h"
#include "MetricNames.h"
#include "RiskGovernanceException.h"
#include "RiskLogger.h"
#include "SequentialGovernanceTester.h"
#include "TestUtils.h"

using namespace mkc_riskgov;
using Catch::Approx;

namespace
{
  // Requests the same allowance for every test
  class FixedAllowancePolicy : public AlphaSpendingPolicy
  {
  public:
    explicit FixedAllowancePolicy(double amount)
      : mAmount(amount)
    {}

    double allowance(const SpendingContext&) const override
    {
      return mAmount;
    }

    std::string getName() const override
    {
      return "fixed";
    }

  private:
    double mAmount;
  };

  SequentialTesterConfiguration unitShiftConfiguration()
  {
    SequentialTesterConfiguration config;
    config.mu0 = 0.0;
    config.mu1 = 1.0;
    config.sigma = 1.0;
    config.beta = 0.2;
    config.expectedTests = 5;
    return config;
  }
}

TEST_CASE("SequentialTesterConfiguration: validation", "[SequentialGovernanceTester][Configuration]")
{
  SequentialTesterConfiguration config = unitShiftConfiguration();
  REQUIRE_NOTHROW(config.validate());

  SECTION("equal hypotheses")
    {
      config.mu1 = config.mu0;
      REQUIRE_THROWS_AS(config.validate(), ConfigurationException);
    }

  SECTION("non-positive sigma")
    {
      config.sigma = 0.0;
      REQUIRE_THROWS_AS(config.validate(), ConfigurationException);
    }

  SECTION("beta out of range")
    {
      config.beta = 1.0;
      REQUIRE_THROWS_AS(config.validate(), ConfigurationException);
    }

  SECTION("max samples below min samples")
    {
      config.minSamples = 10;
      config.maxSamples = 5;
      REQUIRE_THROWS_AS(config.validate(), ConfigurationException);
    }

  SECTION("all violations are reported")
    {
      config.sigma = -1.0;
      config.expectedTests = 0;
      REQUIRE(config.validationErrors().size() == 2);
    }
}

TEST_CASE("SequentialGovernanceTester: constructor validation", "[SequentialGovernanceTester]")
{
  auto ledger = std::make_shared<AlphaSpendingLedger>(0.05);
  auto policy = std::make_shared<UniformSpendingPolicy>();

  REQUIRE_THROWS_AS(SequentialGovernanceTester("", unitShiftConfiguration(), ledger, policy),
		    std::invalid_argument);
  REQUIRE_THROWS_AS(SequentialGovernanceTester("t", unitShiftConfiguration(), nullptr, policy),
		    std::invalid_argument);
  REQUIRE_THROWS_AS(SequentialGovernanceTester("t", unitShiftConfiguration(), ledger, nullptr),
		    std::invalid_argument);
}

TEST_CASE("SequentialGovernanceTester: Wald boundaries", "[SequentialGovernanceTester]")
{
  REQUIRE(SequentialGovernanceTester::upperBoundary(0.01, 0.2) == Approx(std::log(80.0)));
  REQUIRE(SequentialGovernanceTester::lowerBoundary(0.01, 0.2) == Approx(std::log(0.2 / 0.99)));
}

TEST_CASE("SequentialGovernanceTester: decisions with known variance", "[SequentialGovernanceTester]")
{
  // Budget 0.05 over 5 tests: alpha_test = 0.01, upper = log 80 = 4.38, lower = -1.60.
  // With mu0 = 0, mu1 = 1, sigma = 1 each observation adds x - 0.5 to the llr.
  auto metrics = std::make_shared<InMemoryMetricsSink>();
  auto ledger = std::make_shared<AlphaSpendingLedger>(0.05);
  SequentialGovernanceTester tester("canary-1", unitShiftConfiguration(), ledger,
				    std::make_shared<UniformSpendingPolicy>(), 1, metrics);

  SECTION("strong evidence for H1")
    {
      GovernanceDecision d;
      for (int i = 0; i < 4; ++i)
	{
	  d = tester.observe(1.5, timestampAt(i));
	  REQUIRE(d.decision == SequentialDecision::Continue);
	}

      REQUIRE(d.llr == Approx(4.0));
      REQUIRE(d.alphaSpent == Approx(0.01));
      REQUIRE(d.upperBoundary == Approx(std::log(80.0)));
      REQUIRE(d.pValue == Approx(0.0013499).epsilon(1e-3));
      REQUIRE(ledger->getCumulativeAlpha() == Approx(0.01));

      d = tester.observe(1.5, timestampAt(4));
      REQUIRE(d.decision == SequentialDecision::AcceptH1);
      REQUIRE(d.nSamples == 5);
      REQUIRE(d.policyId == "canary-1");
      REQUIRE(metrics->getCounter(metric_names::kGovernanceDecisionTotal,
				  {{"decision", "ACCEPT_H1"}}) == 1.0);
    }

  SECTION("strong evidence for H0")
    {
      REQUIRE(tester.observe(-0.5).decision == SequentialDecision::Continue);
      const GovernanceDecision d = tester.observe(-0.5);
      REQUIRE(d.decision == SequentialDecision::AcceptH0);
      REQUIRE(d.llr == Approx(-2.0));
      REQUIRE_FALSE(d.truncated);
    }

  SECTION("the run resets after a decision and a restart spends again")
    {
      tester.observe(-0.5, timestampAt(0));
      tester.observe(-0.5, timestampAt(1));

      const SequentialTestState& state = tester.getState();
      REQUIRE(state.runsCompleted == 1);
      REQUIRE(state.nSamples == 0);
      REQUIRE(state.logLikelihoodRatio == 0.0);
      REQUIRE(state.allocation == AllocationStatus::Pending);

      tester.observe(0.2, timestampAt(2));
      const auto entries = ledger->getEntries();
      REQUIRE(entries.size() == 2);
      REQUIRE(entries[0].eventType == LedgerEventType::TestAllocation);
      REQUIRE(entries[1].eventType == LedgerEventType::TestRestart);
      REQUIRE(ledger->getCumulativeAlpha() == Approx(0.02));
    }

  SECTION("non-finite observations are rejected without side effects")
    {
      REQUIRE_THROWS_AS(tester.observe(std::numeric_limits<double>::quiet_NaN()),
			InvalidInputException);
      REQUIRE(tester.getState().nSamples == 0);
      REQUIRE(ledger->getEntryCount() == 0);
    }
}

TEST_CASE("SequentialGovernanceTester: denied budget forces CONTINUE", "[SequentialGovernanceTester][Budget]")
{
  // Budget 0.05 with 0.04 already spent; the next test asks for 0.03
  std::ostringstream logStream;
  auto logger = std::make_shared<RiskLogger>(logStream);
  auto metrics = std::make_shared<InMemoryMetricsSink>();
  auto ledger = std::make_shared<AlphaSpendingLedger>(0.05);
  ledger->recordSpend("earlier-test", 0.04, LedgerEventType::TestAllocation);

  SequentialGovernanceTester tester("late-test", unitShiftConfiguration(), ledger,
				    std::make_shared<FixedAllowancePolicy>(0.03), 1, metrics, logger);

  for (int i = 0; i < 50; ++i)
    {
      const GovernanceDecision d = tester.observe(3.0, timestampAt(i));
      REQUIRE(d.decision == SequentialDecision::Continue);
      REQUIRE(d.budgetDenied);
      REQUIRE(d.alphaSpent == 0.0);
      REQUIRE(std::isnan(d.upperBoundary));
    }

  REQUIRE(tester.getState().allocation == AllocationStatus::Denied);
  REQUIRE(ledger->getCumulativeAlpha() == Approx(0.04));
  REQUIRE(ledger->getEntryCount() == 1);
  REQUIRE(logger->getLineCount(LogLevel::Warning) == 1);
  REQUIRE(logStream.str().find("late-test") != std::string::npos);
  REQUIRE(metrics->getCounter(metric_names::kAlphaSpendDeniedTotal) == 1.0);
}

TEST_CASE("SequentialGovernanceTester: sample limits", "[SequentialGovernanceTester]")
{
  auto ledger = std::make_shared<AlphaSpendingLedger>(0.05);
  auto policy = std::make_shared<UniformSpendingPolicy>();
  SequentialTesterConfiguration config = unitShiftConfiguration();

  SECTION("no decision before minSamples")
    {
      config.minSamples = 10;
      SequentialGovernanceTester tester("min", config, ledger, policy);

      for (int i = 0; i < 9; ++i)
	REQUIRE(tester.observe(1.5).decision == SequentialDecision::Continue);

      const GovernanceDecision d = tester.observe(1.5);
      REQUIRE(d.decision == SequentialDecision::AcceptH1);
      REQUIRE(d.nSamples == 10);
    }

  SECTION("truncation at maxSamples accepts H0")
    {
      config.maxSamples = 20;
      SequentialGovernanceTester tester("max", config, ledger, policy);

      GovernanceDecision d;
      for (int i = 0; i < 20; ++i)
	d = tester.observe(0.5);

      REQUIRE(d.decision == SequentialDecision::AcceptH0);
      REQUIRE(d.truncated);
      REQUIRE(d.nSamples == 20);
    }
}

TEST_CASE("SequentialGovernanceTester: GLR model estimates the variance", "[SequentialGovernanceTester][GLR]")
{
  auto ledger = std::make_shared<AlphaSpendingLedger>(0.05);
  SequentialTesterConfiguration config = unitShiftConfiguration();
  config.model = LikelihoodModel::GaussianGlr;

  SequentialGovernanceTester tester("glr", config, ledger, std::make_shared<UniformSpendingPolicy>());

  const GovernanceDecision first = tester.observe(1.4);
  REQUIRE(first.decision == SequentialDecision::Continue);
  REQUIRE(first.llr == 0.0);

  // Mean 1.5, sample variance 0.02: llr = 2 / 0.04 * (2.25 - 0.25) = 100
  const GovernanceDecision second = tester.observe(1.6);
  REQUIRE(second.llr == Approx(100.0));
  REQUIRE(second.decision == SequentialDecision::AcceptH1);

  REQUIRE(likelihoodModelFromString("gaussian_glr") == LikelihoodModel::GaussianGlr);
  REQUIRE_THROWS_AS(likelihoodModelFromString("poisson"), ConfigurationException);
}

TEST_CASE("SequentialGovernanceTester: restore continues identically", "[SequentialGovernanceTester][Persistence]")
{
  auto ledgerA = std::make_shared<AlphaSpendingLedger>(0.05);
  auto ledgerB = std::make_shared<AlphaSpendingLedger>(0.05);
  auto policy = std::make_shared<UniformSpendingPolicy>();

  SequentialGovernanceTester original("t", unitShiftConfiguration(), ledgerA, policy);
  original.observe(0.9);
  original.observe(0.7);

  SequentialGovernanceTester restored("t", unitShiftConfiguration(), ledgerB, policy);
  restored.restoreState(original.getState());

  const GovernanceDecision a = original.observe(1.1);
  const GovernanceDecision b = restored.observe(1.1);

  REQUIRE(a.llr == Approx(b.llr));
  REQUIRE(a.nSamples == b.nSamples);
  REQUIRE(a.decision == b.decision);
  REQUIRE(ledgerB->getEntryCount() == 0);

  SequentialTestState bad = original.getState();
  bad.allocation = AllocationStatus::Granted;
  bad.alphaTest = 0.0;
  REQUIRE_THROWS_AS(restored.restoreState(bad), std::invalid_argument);
}
