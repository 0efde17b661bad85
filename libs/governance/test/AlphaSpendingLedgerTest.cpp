// AlphaSpendingLedgerTest.cpp
//
// Unit tests for AlphaSpendingLedger:
//  - canSpend / recordSpend / trySpend against the total budget
//  - input validation and the BudgetExceededException contract
//  - monotone, bounded cumulative alpha under concurrent callers
//  - restore from persisted entries

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <atomic>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "AlphaSpendingLedger.h"
#include "InMemoryMetricsSink.h"
#include "MetricNames.h"
#include "RiskGovernanceException.h"
#include "TestUtils.h"

using namespace mkc_riskgov;
using Catch::Approx;

TEST_CASE("AlphaSpendingLedger: constructor validation", "[AlphaSpendingLedger]")
{
  REQUIRE_THROWS_AS(AlphaSpendingLedger(0.0), std::invalid_argument);
  REQUIRE_THROWS_AS(AlphaSpendingLedger(1.0), std::invalid_argument);
  REQUIRE_THROWS_AS(AlphaSpendingLedger(-0.05), std::invalid_argument);
  REQUIRE_NOTHROW(AlphaSpendingLedger(0.05));
}

TEST_CASE("AlphaSpendingLedger: spending within the budget", "[AlphaSpendingLedger]")
{
  auto metrics = std::make_shared<InMemoryMetricsSink>();
  AlphaSpendingLedger ledger(0.05, metrics);

  REQUIRE(ledger.getCumulativeAlpha() == 0.0);
  REQUIRE(ledger.canSpend(0.05));
  REQUIRE_FALSE(ledger.canSpend(0.0500001));

  SECTION("recordSpend appends immutable entries with running totals")
    {
      ledger.recordSpend("policy-a", 0.01, LedgerEventType::TestAllocation, timestampAt(0));
      ledger.recordSpend("policy-b", 0.02, LedgerEventType::TestAllocation, timestampAt(1));
      ledger.recordSpend("policy-a", 0.01, LedgerEventType::TestRestart, timestampAt(2));

      const auto entries = ledger.getEntries();
      REQUIRE(entries.size() == 3);
      REQUIRE(entries[0].cumulativeAlpha == Approx(0.01));
      REQUIRE(entries[1].cumulativeAlpha == Approx(0.03));
      REQUIRE(entries[2].cumulativeAlpha == Approx(0.04));
      REQUIRE(entries[2].eventType == LedgerEventType::TestRestart);
      REQUIRE(entries[1].timestamp == timestampAt(1));

      REQUIRE(ledger.getCumulativeAlpha() == Approx(0.04));
      REQUIRE(ledger.getRemainingBudget() == Approx(0.01));
      REQUIRE(ledger.getSpentForTest("policy-a") == Approx(0.02));
      REQUIRE(ledger.getSpentForTest("unknown") == 0.0);

      const auto byType = ledger.getSpendByEventType();
      REQUIRE(byType.at(LedgerEventType::TestAllocation) == Approx(0.03));
      REQUIRE(byType.at(LedgerEventType::TestRestart) == Approx(0.01));

      REQUIRE(metrics->getGauge(metric_names::kAlphaSpentTotal).value() == Approx(0.04));
    }

  SECTION("the full budget can be spent exactly")
    {
      for (int i = 0; i < 5; ++i)
	REQUIRE(ledger.trySpend("t" + std::to_string(i), 0.01, LedgerEventType::TestAllocation));

      REQUIRE(ledger.getCumulativeAlpha() <= 0.05);
      REQUIRE(ledger.getCumulativeAlpha() == Approx(0.05));
      REQUIRE_FALSE(ledger.canSpend(0.001));
    }

  SECTION("entries are returned by copy")
    {
      ledger.recordSpend("policy-a", 0.01, LedgerEventType::TestAllocation);
      auto entries = ledger.getEntries();
      entries.clear();
      REQUIRE(ledger.getEntryCount() == 1);
    }
}

TEST_CASE("AlphaSpendingLedger: overspending is refused", "[AlphaSpendingLedger]")
{
  auto metrics = std::make_shared<InMemoryMetricsSink>();
  AlphaSpendingLedger ledger(0.05, metrics);
  ledger.recordSpend("policy-a", 0.04, LedgerEventType::TestAllocation);

  REQUIRE_FALSE(ledger.canSpend(0.03));
  REQUIRE_THROWS_AS(ledger.recordSpend("policy-b", 0.03, LedgerEventType::TestAllocation),
		    BudgetExceededException);
  REQUIRE_FALSE(ledger.trySpend("policy-b", 0.03, LedgerEventType::TestAllocation));

  REQUIRE(ledger.getCumulativeAlpha() == Approx(0.04));
  REQUIRE(ledger.getEntryCount() == 1);
  REQUIRE(metrics->getCounter(metric_names::kAlphaSpendDeniedTotal) == 1.0);
}

TEST_CASE("AlphaSpendingLedger: invalid spends", "[AlphaSpendingLedger]")
{
  AlphaSpendingLedger ledger(0.05);

  REQUIRE_THROWS_AS(ledger.recordSpend("", 0.01, LedgerEventType::TestAllocation),
		    InvalidInputException);
  REQUIRE_THROWS_AS(ledger.recordSpend("t", 0.0, LedgerEventType::TestAllocation),
		    InvalidInputException);
  REQUIRE_THROWS_AS(ledger.recordSpend("t", -0.01, LedgerEventType::TestAllocation),
		    InvalidInputException);
  REQUIRE_THROWS_AS(ledger.trySpend("t", std::numeric_limits<double>::quiet_NaN(),
				    LedgerEventType::TestAllocation),
		    InvalidInputException);
  REQUIRE_FALSE(ledger.canSpend(std::numeric_limits<double>::infinity()));
  REQUIRE(ledger.getEntryCount() == 0);
}

TEST_CASE("AlphaSpendingLedger: concurrent callers never overspend", "[AlphaSpendingLedger][Concurrency]")
{
  AlphaSpendingLedger ledger(0.05);
  const int numThreads = 8;
  const int attemptsPerThread = 20;
  std::atomic<int> granted(0);
  std::atomic<bool> sawDecrease(false);

  std::vector<std::thread> threads;
  for (int t = 0; t < numThreads; ++t)
    {
      threads.emplace_back([&ledger, &granted, &sawDecrease, t, attemptsPerThread]() {
	  double last = 0.0;
	  for (int i = 0; i < attemptsPerThread; ++i)
	    {
	      const std::string id = "t" + std::to_string(t) + "-" + std::to_string(i);
	      if (ledger.canSpend(0.001) &&
		  ledger.trySpend(id, 0.001, LedgerEventType::TestAllocation))
		++granted;

	      const double now = ledger.getCumulativeAlpha();
	      if (now < last)
		sawDecrease = true;
	      last = now;
	    }
	});
    }

  for (auto& thread : threads)
    thread.join();

  REQUIRE(granted.load() == 50);
  REQUIRE_FALSE(sawDecrease.load());
  REQUIRE(ledger.getCumulativeAlpha() <= 0.05);
  REQUIRE(ledger.getEntryCount() == 50);

  const auto entries = ledger.getEntries();
  for (std::size_t i = 1; i < entries.size(); ++i)
    REQUIRE(entries[i].cumulativeAlpha >= entries[i - 1].cumulativeAlpha);
}

TEST_CASE("AlphaSpendingLedger: restoreEntries", "[AlphaSpendingLedger][Persistence]")
{
  std::vector<AlphaLedgerEntry> persisted = {
    {"policy-a", 0.01, 0.0, LedgerEventType::TestAllocation, timestampAt(0)},
    {"policy-b", 0.02, 0.0, LedgerEventType::TestAllocation, timestampAt(1)}
  };

  SECTION("running totals are recomputed")
    {
      AlphaSpendingLedger ledger(0.05);
      ledger.restoreEntries(persisted);

      REQUIRE(ledger.getCumulativeAlpha() == Approx(0.03));
      REQUIRE(ledger.getEntries()[1].cumulativeAlpha == Approx(0.03));
      REQUIRE(ledger.getSpentForTest("policy-b") == Approx(0.02));
    }

  SECTION("entries exceeding the budget are rejected")
    {
      AlphaSpendingLedger ledger(0.02);
      REQUIRE_THROWS_AS(ledger.restoreEntries(persisted), PersistenceException);
      REQUIRE(ledger.getEntryCount() == 0);
    }

  SECTION("malformed entries are rejected")
    {
      persisted[0].alphaSpent = -1.0;
      AlphaSpendingLedger ledger(0.05);
      REQUIRE_THROWS_AS(ledger.restoreEntries(persisted), PersistenceException);
    }

  SECTION("a restore may not move the total backwards")
    {
      AlphaSpendingLedger ledger(0.05);
      ledger.recordSpend("policy-c", 0.04, LedgerEventType::TestAllocation);
      REQUIRE_THROWS_AS(ledger.restoreEntries(persisted), PersistenceException);
      REQUIRE(ledger.getCumulativeAlpha() == Approx(0.04));
    }
}

TEST_CASE("AlphaSpendingLedger: event type names", "[AlphaSpendingLedger]")
{
  REQUIRE(std::string(toString(LedgerEventType::TestAllocation)) == "test_allocation");
  REQUIRE(ledgerEventTypeFromString("test_restart") == LedgerEventType::TestRestart);
  REQUIRE_THROWS_AS(ledgerEventTypeFromString("bogus"), std::invalid_argument);
}
