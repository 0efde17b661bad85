// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "AlphaSpendingLedger.h"
#include <cmath>
#include <sstream>
#include <stdexcept>
#include "MetricNames.h"
#include "RiskGovernanceException.h"

namespace mkc_riskgov
{
  namespace
  {
    constexpr double kBudgetTolerance = 1e-12;
    const char* const kComponent = "AlphaSpendingLedger";
  }

  const char* toString(LedgerEventType type)
  {
    switch (type)
      {
      case LedgerEventType::TestAllocation:
	return "test_allocation";
      case LedgerEventType::TestRestart:
	return "test_restart";
      }

    return "unknown";
  }

  LedgerEventType ledgerEventTypeFromString(const std::string& name)
  {
    if (name == "test_allocation")
      return LedgerEventType::TestAllocation;

    if (name == "test_restart")
      return LedgerEventType::TestRestart;

    throw std::invalid_argument("Unknown ledger event type: " + name);
  }

  AlphaSpendingLedger::AlphaSpendingLedger(double totalBudget,
					   std::shared_ptr<IMetricsSink> metrics,
					   std::shared_ptr<RiskLogger> logger)
    : mTotalBudget(totalBudget),
      mCumulativeAlpha(0.0),
      mMutex(),
      mEntries(),
      mSpentByTest(),
      mMetrics(metrics ? std::move(metrics) : std::make_shared<NullMetricsSink>()),
      mLogger(std::move(logger))
  {
    if (!(totalBudget > 0.0 && totalBudget < 1.0))
      throw std::invalid_argument("AlphaSpendingLedger: total budget must be in (0, 1)");
  }

  bool AlphaSpendingLedger::canSpend(double amount) const
  {
    if (!std::isfinite(amount) || amount < 0.0)
      return false;

    return fitsBudget(getCumulativeAlpha(), amount);
  }

  void AlphaSpendingLedger::recordSpend(const std::string& testId,
					double amount,
					LedgerEventType eventType,
					const boost::posix_time::ptime& timestamp)
  {
    validateSpend(testId, amount);

    std::lock_guard<std::mutex> lock(mMutex);
    const double cumulative = mCumulativeAlpha.load(std::memory_order_relaxed);

    if (!fitsBudget(cumulative, amount))
      {
	std::ostringstream msg;
	msg << "AlphaSpendingLedger: spend of " << amount << " by " << testId
	    << " exceeds budget (cumulative " << cumulative << ", total " << mTotalBudget << ")";
	throw BudgetExceededException(msg.str());
      }

    appendLocked(testId, amount, eventType, timestamp);
  }

  bool AlphaSpendingLedger::trySpend(const std::string& testId,
				     double amount,
				     LedgerEventType eventType,
				     const boost::posix_time::ptime& timestamp)
  {
    validateSpend(testId, amount);

    std::lock_guard<std::mutex> lock(mMutex);
    if (!fitsBudget(mCumulativeAlpha.load(std::memory_order_relaxed), amount))
      {
	mMetrics->incrementCounter(metric_names::kAlphaSpendDeniedTotal, {});
	return false;
      }

    appendLocked(testId, amount, eventType, timestamp);
    return true;
  }

  double AlphaSpendingLedger::getRemainingBudget() const
  {
    const double remaining = mTotalBudget - getCumulativeAlpha();
    return remaining > 0.0 ? remaining : 0.0;
  }

  std::vector<AlphaLedgerEntry> AlphaSpendingLedger::getEntries() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mEntries;
  }

  std::size_t AlphaSpendingLedger::getEntryCount() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mEntries.size();
  }

  double AlphaSpendingLedger::getSpentForTest(const std::string& testId) const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    const auto it = mSpentByTest.find(testId);
    return (it != mSpentByTest.end()) ? it->second : 0.0;
  }

  std::map<LedgerEventType, double> AlphaSpendingLedger::getSpendByEventType() const
  {
    std::lock_guard<std::mutex> lock(mMutex);

    std::map<LedgerEventType, double> summary;
    for (const auto& entry : mEntries)
      summary[entry.eventType] += entry.alphaSpent;

    return summary;
  }

  void AlphaSpendingLedger::restoreEntries(const std::vector<AlphaLedgerEntry>& entries)
  {
    std::vector<AlphaLedgerEntry> rebuilt;
    std::map<std::string, double> spentByTest;
    rebuilt.reserve(entries.size());

    double cumulative = 0.0;
    for (const auto& entry : entries)
      {
	if (entry.testId.empty() || !std::isfinite(entry.alphaSpent) || !(entry.alphaSpent > 0.0))
	  throw PersistenceException("AlphaSpendingLedger: restored entry is malformed");

	if (!fitsBudget(cumulative, entry.alphaSpent))
	  throw PersistenceException("AlphaSpendingLedger: restored entries exceed the total budget");

	cumulative += entry.alphaSpent;
	AlphaLedgerEntry copy(entry);
	copy.cumulativeAlpha = cumulative;
	rebuilt.push_back(copy);
	spentByTest[entry.testId] += entry.alphaSpent;
      }

    std::lock_guard<std::mutex> lock(mMutex);

    // Restoring can never move the running total backwards
    if (cumulative + kBudgetTolerance < mCumulativeAlpha.load(std::memory_order_relaxed))
      throw PersistenceException("AlphaSpendingLedger: restored entries would reduce cumulative alpha");

    mEntries.swap(rebuilt);
    mSpentByTest.swap(spentByTest);
    mCumulativeAlpha.store(cumulative, std::memory_order_release);
    mMetrics->setGauge(metric_names::kAlphaSpentTotal, {}, cumulative);

    std::ostringstream msg;
    msg << "restored " << mEntries.size() << " entries, cumulative alpha " << cumulative;
    logTo(mLogger, LogLevel::Info, kComponent, msg.str());
  }

  void AlphaSpendingLedger::validateSpend(const std::string& testId, double amount) const
  {
    if (testId.empty())
      throw InvalidInputException("AlphaSpendingLedger: test id must not be empty");

    if (!std::isfinite(amount) || !(amount > 0.0))
      throw InvalidInputException("AlphaSpendingLedger: spend amount must be finite and positive");
  }

  bool AlphaSpendingLedger::fitsBudget(double cumulative, double amount) const
  {
    return cumulative + amount <= mTotalBudget + kBudgetTolerance;
  }

  void AlphaSpendingLedger::appendLocked(const std::string& testId,
					 double amount,
					 LedgerEventType eventType,
					 const boost::posix_time::ptime& timestamp)
  {
    // Clamp so accumulated rounding inside the tolerance never reports a
    // total above the budget
    double cumulative = mCumulativeAlpha.load(std::memory_order_relaxed) + amount;
    if (cumulative > mTotalBudget)
      cumulative = mTotalBudget;

    mEntries.push_back(AlphaLedgerEntry{testId, amount, cumulative, eventType, timestamp});
    mSpentByTest[testId] += amount;
    mCumulativeAlpha.store(cumulative, std::memory_order_release);

    mMetrics->setGauge(metric_names::kAlphaSpentTotal, {}, cumulative);

    std::ostringstream msg;
    msg << toString(eventType) << " test=" << testId << " alpha=" << amount
	<< " cumulative=" << cumulative << "/" << mTotalBudget;
    logTo(mLogger, LogLevel::Info, kComponent, msg.str());
  }
}
