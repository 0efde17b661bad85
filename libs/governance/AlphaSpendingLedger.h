// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RISKGOV_ALPHA_SPENDING_LEDGER_H
#define __RISKGOV_ALPHA_SPENDING_LEDGER_H 1

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "IMetricsSink.h"
#include "RiskLogger.h"

namespace mkc_riskgov
{
  enum class LedgerEventType
  {
    TestAllocation,	// first run of a sequential test
    TestRestart		// new run of a test after a terminal decision
  };

  const char* toString(LedgerEventType type);

  // @throws std::invalid_argument for an unknown name
  LedgerEventType ledgerEventTypeFromString(const std::string& name);

  /**
   * @brief Immutable record of one alpha spend.
   */
  struct AlphaLedgerEntry
  {
    std::string testId;
    double alphaSpent;
    double cumulativeAlpha;	// running total including this entry
    LedgerEventType eventType;
    boost::posix_time::ptime timestamp;
  };

  /**
   * @brief Process-wide, append-only account of the family-wise alpha budget.
   *
   * Invariant: the cumulative alpha is non-decreasing and never exceeds the
   * total budget, whatever the interleaving of callers.
   *
   * Writers serialize on an internal mutex. getCumulativeAlpha() is a lock
   * free atomic read. Every other accessor returns a copy.
   *
   * Usage contract: call canSpend() first and spend only if it returned
   * true. recordSpend() throws BudgetExceededException when the contract is
   * broken. trySpend() performs the check and the spend under one lock so
   * two callers that both passed canSpend() cannot overspend together.
   */
  class AlphaSpendingLedger
  {
  public:
    /**
     * @throws std::invalid_argument if totalBudget is not in (0, 1)
     */
    explicit AlphaSpendingLedger(double totalBudget,
				 std::shared_ptr<IMetricsSink> metrics = nullptr,
				 std::shared_ptr<RiskLogger> logger = nullptr);

    AlphaSpendingLedger(const AlphaSpendingLedger&) = delete;
    AlphaSpendingLedger& operator=(const AlphaSpendingLedger&) = delete;

    // cumulative + amount <= total budget
    bool canSpend(double amount) const;

    /**
     * @brief Append a spend.
     * @throws InvalidInputException if amount is not finite and positive or testId is empty
     * @throws BudgetExceededException if the spend would exceed the budget
     */
    void recordSpend(const std::string& testId,
		     double amount,
		     LedgerEventType eventType,
		     const boost::posix_time::ptime& timestamp =
		       boost::posix_time::microsec_clock::universal_time());

    /**
     * @brief Spend only if the budget allows it.
     * @return true if the entry was appended
     * @throws InvalidInputException if amount is not finite and positive or testId is empty
     */
    bool trySpend(const std::string& testId,
		  double amount,
		  LedgerEventType eventType,
		  const boost::posix_time::ptime& timestamp =
		    boost::posix_time::microsec_clock::universal_time());

    double getCumulativeAlpha() const
    {
      return mCumulativeAlpha.load(std::memory_order_acquire);
    }

    double getTotalBudget() const
    {
      return mTotalBudget;
    }

    double getRemainingBudget() const;

    std::vector<AlphaLedgerEntry> getEntries() const;
    std::size_t getEntryCount() const;

    double getSpentForTest(const std::string& testId) const;
    std::map<LedgerEventType, double> getSpendByEventType() const;

    /**
     * @brief Replace the ledger contents with persisted entries.
     *
     * Running totals are recomputed from the amounts; the stored
     * cumulativeAlpha fields are ignored.
     *
     * @throws PersistenceException if the entries are invalid or exceed the budget
     */
    void restoreEntries(const std::vector<AlphaLedgerEntry>& entries);

  private:
    void validateSpend(const std::string& testId, double amount) const;
    bool fitsBudget(double cumulative, double amount) const;
    void appendLocked(const std::string& testId,
		      double amount,
		      LedgerEventType eventType,
		      const boost::posix_time::ptime& timestamp);

  private:
    const double mTotalBudget;
    std::atomic<double> mCumulativeAlpha;
    mutable std::mutex mMutex;
    std::vector<AlphaLedgerEntry> mEntries;
    std::map<std::string, double> mSpentByTest;
    std::shared_ptr<IMetricsSink> mMetrics;
    std::shared_ptr<RiskLogger> mLogger;
  };
}

#endif
