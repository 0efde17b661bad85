// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RISKGOV_POLICY_LIFECYCLE_MANAGER_H
#define __RISKGOV_POLICY_LIFECYCLE_MANAGER_H 1

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "AlphaSpendingLedger.h"
#include "AlphaSpendingPolicy.h"
#include "IMetricsSink.h"
#include "RiskLogger.h"
#include "SequentialGovernanceTester.h"

namespace mkc_riskgov
{
  enum class LifecycleStatus
  {
    Candidate,
    Canary,
    Shadow,
    Live,
    Deprecated,
    Failed
  };

  const char* toString(LifecycleStatus status);

  // @throws std::invalid_argument for an unknown name
  LifecycleStatus lifecycleStatusFromString(const std::string& name);

  /**
   * @brief Running mean and variance of a policy performance statistic
   * (Welford's update).
   */
  class RollingMetrics
  {
  public:
    RollingMetrics();
    RollingMetrics(std::size_t count, double mean, double sumSquaredDeviations);

    void add(double value);

    std::size_t getCount() const
    {
      return mCount;
    }

    double getMean() const
    {
      return mMean;
    }

    double getSumSquaredDeviations() const
    {
      return mSumSquaredDeviations;
    }

    // Sample standard deviation, 0 with fewer than two values
    double getStandardDeviation() const;

  private:
    std::size_t mCount;
    double mMean;
    double mSumSquaredDeviations;
  };

  struct PolicyRecord
  {
    std::string policyId;
    std::string version;
    LifecycleStatus status;
    RollingMetrics metrics;
    boost::posix_time::ptime createdAt;
    boost::posix_time::ptime promotedAt;	// not_a_date_time until first promotion
  };

  struct LifecycleTransition
  {
    std::string policyId;
    LifecycleStatus from;
    LifecycleStatus to;
    boost::posix_time::ptime timestamp;
    std::string reason;
  };

  struct LifecycleConfiguration
  {
    double defaultBaselineMean = 0.0;	// mu0 while the LIVE baseline has too little history
    double defaultSigma = 1.0;
    double minimumDetectableEffect = 0.1;	// mu1 = mu0 + effect
    std::size_t minBaselineSamples = 30;	// baseline mean/std used from this many samples
    double beta = 0.2;
    std::size_t minSamples = 20;
    std::size_t maxSamples = 0;
    std::size_t expectedTests = 10;
    LikelihoodModel model = LikelihoodModel::GaussianKnownVariance;

    std::vector<std::string> validationErrors() const;

    // @throws ConfigurationException
    void validate() const;
  };

  /**
   * @brief State of a stage tester, enough to rebuild it after a restart.
   */
  struct StageTestSnapshot
  {
    std::string policyId;
    std::string testId;
    SequentialTesterConfiguration config;
    std::size_t testIndex;
    SequentialTestState state;
  };

  struct LifecycleSnapshot
  {
    std::vector<PolicyRecord> records;
    std::vector<LifecycleTransition> auditTrail;
    std::vector<StageTestSnapshot> activeTests;
    std::size_t nextTestIndex;
  };

  /**
   * @brief Process-wide registry of policy variants and their promotion path
   *
   *   CANDIDATE -> CANARY -> SHADOW -> LIVE
   *
   * CANARY and SHADOW each run a dedicated SequentialGovernanceTester on the
   * candidate's performance feed, with hypotheses taken from the current LIVE
   * baseline when the stage starts. ACCEPT_H1 promotes one stage, ACCEPT_H0
   * marks the record FAILED. A promotion to LIVE moves the previous LIVE
   * record to DEPRECATED. Records are never removed.
   *
   * All operations serialize on one mutex; readers get copies.
   */
  class PolicyLifecycleManager
  {
  public:
    /**
     * @throws ConfigurationException if the configuration is invalid
     * @throws std::invalid_argument if ledger or policy is null
     */
    PolicyLifecycleManager(const LifecycleConfiguration& config,
			   std::shared_ptr<AlphaSpendingLedger> ledger,
			   std::shared_ptr<AlphaSpendingPolicy> spendingPolicy,
			   std::shared_ptr<IMetricsSink> metrics = nullptr,
			   std::shared_ptr<RiskLogger> logger = nullptr);

    PolicyLifecycleManager(const PolicyLifecycleManager&) = delete;
    PolicyLifecycleManager& operator=(const PolicyLifecycleManager&) = delete;

    /**
     * @brief Register the incumbent policy directly as LIVE.
     * @throws InvalidInputException if the id is empty or known, or a LIVE record exists
     */
    void registerBaseline(const std::string& policyId,
			  const std::string& version,
			  const boost::posix_time::ptime& timestamp);

    /**
     * @throws InvalidInputException if the id is empty or already registered
     */
    void registerCandidate(const std::string& policyId,
			   const std::string& version,
			   const boost::posix_time::ptime& timestamp);

    /**
     * @brief Move a CANDIDATE to CANARY and start its canary test.
     * @throws InvalidInputException if the policy is unknown or not a CANDIDATE
     */
    void startCanary(const std::string& policyId, const boost::posix_time::ptime& timestamp);

    /**
     * @brief Feed one performance observation.
     *
     * Always updates the record's rolling metrics. For a CANARY or SHADOW
     * record the observation also goes to the stage tester; its decision is
     * returned and applied.
     *
     * @throws InvalidInputException if the policy is unknown or value is not finite
     */
    std::optional<GovernanceDecision> recordMetric(const std::string& policyId,
						   double value,
						   const boost::posix_time::ptime& timestamp);

    std::optional<PolicyRecord> getRecord(const std::string& policyId) const;
    std::optional<PolicyRecord> getLiveRecord() const;
    std::vector<PolicyRecord> getRecords() const;

    std::vector<LifecycleTransition> getAuditTrail() const;
    std::vector<LifecycleTransition> getAuditTrail(const std::string& policyId) const;

    LifecycleSnapshot getSnapshot() const;

    /**
     * @brief Replace all records, audit trail and stage tests.
     * @throws PersistenceException if the snapshot is inconsistent
     */
    void restoreSnapshot(const LifecycleSnapshot& snapshot);

    const LifecycleConfiguration& getConfiguration() const
    {
      return mConfig;
    }

  private:
    PolicyRecord& findLocked(const std::string& policyId);
    const PolicyRecord* findLiveLocked() const;
    void transitionLocked(PolicyRecord& record,
			  LifecycleStatus to,
			  const boost::posix_time::ptime& timestamp,
			  const std::string& reason);
    void startStageTestLocked(const PolicyRecord& record, LifecycleStatus stage);
    void applyDecisionLocked(PolicyRecord& record,
			     const GovernanceDecision& decision,
			     const boost::posix_time::ptime& timestamp);
    SequentialTesterConfiguration stageTesterConfigurationLocked() const;

  private:
    LifecycleConfiguration mConfig;
    std::shared_ptr<AlphaSpendingLedger> mLedger;
    std::shared_ptr<AlphaSpendingPolicy> mSpendingPolicy;
    std::shared_ptr<IMetricsSink> mMetrics;
    std::shared_ptr<RiskLogger> mLogger;
    mutable std::mutex mMutex;
    std::vector<PolicyRecord> mRecords;		// registration order
    std::vector<LifecycleTransition> mAuditTrail;
    std::map<std::string, std::unique_ptr<SequentialGovernanceTester>> mStageTests;
    std::map<std::string, std::size_t> mStageTestIndex;
    std::size_t mNextTestIndex;
  };
}

#endif
