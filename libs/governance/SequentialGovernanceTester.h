// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RISKGOV_SEQUENTIAL_GOVERNANCE_TESTER_H
#define __RISKGOV_SEQUENTIAL_GOVERNANCE_TESTER_H 1

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "AlphaSpendingLedger.h"
#include "AlphaSpendingPolicy.h"
#include "IMetricsSink.h"
#include "RiskLogger.h"

namespace mkc_riskgov
{
  enum class SequentialDecision
  {
    Continue,
    AcceptH1,
    AcceptH0
  };

  const char* toString(SequentialDecision decision);

  // @throws std::invalid_argument for an unknown name
  SequentialDecision sequentialDecisionFromString(const std::string& name);

  enum class LikelihoodModel
  {
    GaussianKnownVariance,	// simple vs simple SPRT with known sigma
    GaussianGlr			// generalized likelihood ratio, variance estimated from the run
  };

  const char* toString(LikelihoodModel model);

  // @throws ConfigurationException for an unknown name
  LikelihoodModel likelihoodModelFromString(const std::string& name);

  enum class AllocationStatus
  {
    Pending,	// no alpha requested yet for the current run
    Granted,
    Denied	// ledger refused; the run stays at CONTINUE
  };

  const char* toString(AllocationStatus status);
  AllocationStatus allocationStatusFromString(const std::string& name);

  struct SequentialTesterConfiguration
  {
    double mu0 = 0.0;			// H0 mean of the performance statistic
    double mu1 = 0.1;			// H1 mean
    double sigma = 1.0;			// known sigma (GaussianKnownVariance)
    double beta = 0.2;			// target Type-II error
    std::size_t minSamples = 1;		// no decision before this many observations
    std::size_t maxSamples = 0;		// truncate to ACCEPT_H0 after this many, 0 = never
    std::size_t expectedTests = 10;	// m for the spending policy
    LikelihoodModel model = LikelihoodModel::GaussianKnownVariance;
    double varianceFloor = 1e-12;

    std::vector<std::string> validationErrors() const;

    // @throws ConfigurationException
    void validate() const;
  };

  struct SequentialTestState
  {
    double logLikelihoodRatio = 0.0;
    std::size_t nSamples = 0;
    SequentialDecision decision = SequentialDecision::Continue;
    double alphaTest = 0.0;
    AllocationStatus allocation = AllocationStatus::Pending;
    double sum = 0.0;
    double sumOfSquares = 0.0;
    std::size_t runsCompleted = 0;
    std::size_t totalSteps = 0;
  };

  /**
   * @brief Output of one observation, published to the governance feed.
   */
  struct GovernanceDecision
  {
    std::string policyId;
    SequentialDecision decision;
    double llr;
    std::size_t nSamples;
    double alphaSpent;		// alpha allocated to the run, 0 when denied or pending
    double upperBoundary;	// NaN while no alpha is allocated
    double lowerBoundary;
    double pValue;		// one sided normal approximation toward H1
    bool budgetDenied;
    bool truncated;		// ACCEPT_H0 forced by maxSamples
    boost::posix_time::ptime timestamp;
  };

  /**
   * @brief Wald sequential probability ratio test of a policy performance
   * statistic, interlocked with the global alpha budget.
   *
   * The log likelihood ratio accumulates llr += log p(x|H1) - log p(x|H0).
   * With alpha_test the alpha granted to the run:
   *
   *   upper = log((1 - beta) / alpha_test)   decide ACCEPT_H1 when llr >= upper
   *   lower = log(beta / (1 - alpha_test))   decide ACCEPT_H0 when llr <= lower
   *
   * Alpha is requested at the first observation of each run: the spending
   * policy sizes the allowance, the ledger is asked with canSpend() and the
   * spend is committed with trySpend(). If either refuses, the run is forced
   * to CONTINUE for good and a warning is logged. Runs never overspend.
   *
   * After a terminal decision the run state resets; the next observation
   * starts a new run with a new allocation.
   *
   * Not thread-safe: one tester belongs to one policy under test.
   */
  class SequentialGovernanceTester
  {
  public:
    /**
     * @param testId Identifier recorded in the ledger and the decision feed.
     * @param firstTestIndex 1-based index of this test among expectedTests.
     * @throws ConfigurationException if the configuration is invalid
     * @throws std::invalid_argument if ledger or policy is null or testId is empty
     */
    SequentialGovernanceTester(const std::string& testId,
			       const SequentialTesterConfiguration& config,
			       std::shared_ptr<AlphaSpendingLedger> ledger,
			       std::shared_ptr<AlphaSpendingPolicy> policy,
			       std::size_t firstTestIndex = 1,
			       std::shared_ptr<IMetricsSink> metrics = nullptr,
			       std::shared_ptr<RiskLogger> logger = nullptr);

    /**
     * @throws InvalidInputException if value is not finite
     */
    GovernanceDecision observe(double value,
			       const boost::posix_time::ptime& timestamp =
				 boost::posix_time::microsec_clock::universal_time());

    const SequentialTestState& getState() const
    {
      return mState;
    }

    // @throws std::invalid_argument if the state is inconsistent
    void restoreState(const SequentialTestState& state);

    const std::string& getTestId() const
    {
      return mTestId;
    }

    const SequentialTesterConfiguration& getConfiguration() const
    {
      return mConfig;
    }

    static double upperBoundary(double alphaTest, double beta);
    static double lowerBoundary(double alphaTest, double beta);

  private:
    void requestAllocation(const boost::posix_time::ptime& timestamp);
    void accumulate(double value);
    double currentPValue() const;
    void resetRun();

  private:
    std::string mTestId;
    SequentialTesterConfiguration mConfig;
    std::shared_ptr<AlphaSpendingLedger> mLedger;
    std::shared_ptr<AlphaSpendingPolicy> mPolicy;
    std::size_t mFirstTestIndex;
    std::shared_ptr<IMetricsSink> mMetrics;
    std::shared_ptr<RiskLogger> mLogger;
    SequentialTestState mState;
  };
}

#endif
