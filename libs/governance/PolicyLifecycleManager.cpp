// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "PolicyLifecycleManager.h"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <set>
#include <sstream>
#include <stdexcept>
#include "MetricNames.h"
#include "RiskGovernanceException.h"

namespace mkc_riskgov
{
  namespace
  {
    const char* const kComponent = "PolicyLifecycleManager";

    std::string stageTestId(const std::string& policyId, LifecycleStatus stage)
    {
      return policyId + (stage == LifecycleStatus::Canary ? "/canary" : "/shadow");
    }

    bool isTestedStage(LifecycleStatus status)
    {
      return status == LifecycleStatus::Canary || status == LifecycleStatus::Shadow;
    }
  }

  const char* toString(LifecycleStatus status)
  {
    switch (status)
      {
      case LifecycleStatus::Candidate:
	return "CANDIDATE";
      case LifecycleStatus::Canary:
	return "CANARY";
      case LifecycleStatus::Shadow:
	return "SHADOW";
      case LifecycleStatus::Live:
	return "LIVE";
      case LifecycleStatus::Deprecated:
	return "DEPRECATED";
      case LifecycleStatus::Failed:
	return "FAILED";
      }

    return "UNKNOWN";
  }

  LifecycleStatus lifecycleStatusFromString(const std::string& name)
  {
    static const LifecycleStatus all[] = {LifecycleStatus::Candidate, LifecycleStatus::Canary,
					  LifecycleStatus::Shadow, LifecycleStatus::Live,
					  LifecycleStatus::Deprecated, LifecycleStatus::Failed};

    for (LifecycleStatus status : all)
      if (name == toString(status))
	return status;

    throw std::invalid_argument("Unknown lifecycle status: " + name);
  }

  //
  // RollingMetrics
  //

  RollingMetrics::RollingMetrics()
    : mCount(0),
      mMean(0.0),
      mSumSquaredDeviations(0.0)
  {}

  RollingMetrics::RollingMetrics(std::size_t count, double mean, double sumSquaredDeviations)
    : mCount(count),
      mMean(mean),
      mSumSquaredDeviations(sumSquaredDeviations)
  {
    if (!std::isfinite(mean) || !std::isfinite(sumSquaredDeviations) || sumSquaredDeviations < 0.0)
      throw std::invalid_argument("RollingMetrics: mean and sum of squared deviations must be finite");
  }

  void RollingMetrics::add(double value)
  {
    ++mCount;
    const double delta = value - mMean;
    mMean += delta / static_cast<double>(mCount);
    mSumSquaredDeviations += delta * (value - mMean);
  }

  double RollingMetrics::getStandardDeviation() const
  {
    if (mCount < 2)
      return 0.0;

    return std::sqrt(mSumSquaredDeviations / static_cast<double>(mCount - 1));
  }

  //
  // LifecycleConfiguration
  //

  std::vector<std::string> LifecycleConfiguration::validationErrors() const
  {
    std::vector<std::string> errors;

    if (!std::isfinite(defaultBaselineMean))
      errors.push_back("defaultBaselineMean must be finite");

    if (!(defaultSigma > 0.0) || !std::isfinite(defaultSigma))
      errors.push_back("defaultSigma must be positive");

    if (!(minimumDetectableEffect != 0.0) || !std::isfinite(minimumDetectableEffect))
      errors.push_back("minimumDetectableEffect must be finite and non-zero");

    if (minBaselineSamples < 2)
      errors.push_back("minBaselineSamples must be >= 2");

    if (!(beta > 0.0 && beta < 1.0))
      errors.push_back("beta must be in (0, 1)");

    if (minSamples == 0)
      errors.push_back("minSamples must be >= 1");

    if (maxSamples != 0 && maxSamples < minSamples)
      errors.push_back("maxSamples must be 0 or >= minSamples");

    if (expectedTests == 0)
      errors.push_back("expectedTests must be >= 1");

    return errors;
  }

  void LifecycleConfiguration::validate() const
  {
    throwOnConfigurationErrors("PolicyLifecycle", validationErrors());
  }

  //
  // PolicyLifecycleManager
  //

  PolicyLifecycleManager::PolicyLifecycleManager(const LifecycleConfiguration& config,
						 std::shared_ptr<AlphaSpendingLedger> ledger,
						 std::shared_ptr<AlphaSpendingPolicy> spendingPolicy,
						 std::shared_ptr<IMetricsSink> metrics,
						 std::shared_ptr<RiskLogger> logger)
    : mConfig(config),
      mLedger(std::move(ledger)),
      mSpendingPolicy(std::move(spendingPolicy)),
      mMetrics(metrics ? std::move(metrics) : std::make_shared<NullMetricsSink>()),
      mLogger(std::move(logger)),
      mMutex(),
      mRecords(),
      mAuditTrail(),
      mStageTests(),
      mStageTestIndex(),
      mNextTestIndex(1)
  {
    if (!mLedger || !mSpendingPolicy)
      throw std::invalid_argument("PolicyLifecycleManager: ledger and spending policy are required");

    mConfig.validate();
  }

  void PolicyLifecycleManager::registerBaseline(const std::string& policyId,
						const std::string& version,
						const boost::posix_time::ptime& timestamp)
  {
    if (policyId.empty())
      throw InvalidInputException("PolicyLifecycleManager: policy id must not be empty");

    std::lock_guard<std::mutex> lock(mMutex);

    for (const auto& record : mRecords)
      {
	if (record.policyId == policyId)
	  throw InvalidInputException("PolicyLifecycleManager: policy already registered: " + policyId);
      }

    if (const PolicyRecord* live = findLiveLocked())
      throw InvalidInputException("PolicyLifecycleManager: LIVE policy already exists: " + live->policyId);

    mRecords.push_back(PolicyRecord{policyId, version, LifecycleStatus::Live, RollingMetrics(),
				    timestamp, timestamp});
    mAuditTrail.push_back(LifecycleTransition{policyId, LifecycleStatus::Live, LifecycleStatus::Live,
					      timestamp, "registered as baseline"});

    logTo(mLogger, LogLevel::Info, kComponent, "Registered baseline " + policyId + " " + version);
  }

  void PolicyLifecycleManager::registerCandidate(const std::string& policyId,
						 const std::string& version,
						 const boost::posix_time::ptime& timestamp)
  {
    if (policyId.empty())
      throw InvalidInputException("PolicyLifecycleManager: policy id must not be empty");

    std::lock_guard<std::mutex> lock(mMutex);

    for (const auto& record : mRecords)
      {
	if (record.policyId == policyId)
	  throw InvalidInputException("PolicyLifecycleManager: policy already registered: " + policyId);
      }

    mRecords.push_back(PolicyRecord{policyId, version, LifecycleStatus::Candidate, RollingMetrics(),
				    timestamp, boost::posix_time::ptime()});
    mAuditTrail.push_back(LifecycleTransition{policyId, LifecycleStatus::Candidate,
					      LifecycleStatus::Candidate, timestamp,
					      "registered as candidate"});

    logTo(mLogger, LogLevel::Info, kComponent, "Registered candidate " + policyId + " " + version);
  }

  void PolicyLifecycleManager::startCanary(const std::string& policyId,
					   const boost::posix_time::ptime& timestamp)
  {
    std::lock_guard<std::mutex> lock(mMutex);

    PolicyRecord& record = findLocked(policyId);
    if (record.status != LifecycleStatus::Candidate)
      throw InvalidInputException("PolicyLifecycleManager: " + policyId + " is " +
				  toString(record.status) + ", expected CANDIDATE");

    transitionLocked(record, LifecycleStatus::Canary, timestamp, "canary started");
    startStageTestLocked(record, LifecycleStatus::Canary);
  }

  std::optional<GovernanceDecision>
  PolicyLifecycleManager::recordMetric(const std::string& policyId,
				       double value,
				       const boost::posix_time::ptime& timestamp)
  {
    if (!std::isfinite(value))
      throw InvalidInputException("PolicyLifecycleManager: metric value must be finite");

    std::lock_guard<std::mutex> lock(mMutex);

    PolicyRecord& record = findLocked(policyId);
    record.metrics.add(value);

    auto it = mStageTests.find(policyId);
    if (!isTestedStage(record.status) || it == mStageTests.end())
      return std::nullopt;

    GovernanceDecision decision = it->second->observe(value, timestamp);
    applyDecisionLocked(record, decision, timestamp);

    return decision;
  }

  std::optional<PolicyRecord> PolicyLifecycleManager::getRecord(const std::string& policyId) const
  {
    std::lock_guard<std::mutex> lock(mMutex);

    for (const auto& record : mRecords)
      {
	if (record.policyId == policyId)
	  return record;
      }

    return std::nullopt;
  }

  std::optional<PolicyRecord> PolicyLifecycleManager::getLiveRecord() const
  {
    std::lock_guard<std::mutex> lock(mMutex);

    if (const PolicyRecord* live = findLiveLocked())
      return *live;

    return std::nullopt;
  }

  std::vector<PolicyRecord> PolicyLifecycleManager::getRecords() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mRecords;
  }

  std::vector<LifecycleTransition> PolicyLifecycleManager::getAuditTrail() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mAuditTrail;
  }

  std::vector<LifecycleTransition>
  PolicyLifecycleManager::getAuditTrail(const std::string& policyId) const
  {
    std::lock_guard<std::mutex> lock(mMutex);

    std::vector<LifecycleTransition> result;
    std::copy_if(mAuditTrail.begin(), mAuditTrail.end(), std::back_inserter(result),
		 [&policyId](const LifecycleTransition& t) { return t.policyId == policyId; });

    return result;
  }

  LifecycleSnapshot PolicyLifecycleManager::getSnapshot() const
  {
    std::lock_guard<std::mutex> lock(mMutex);

    LifecycleSnapshot snapshot;
    snapshot.records = mRecords;
    snapshot.auditTrail = mAuditTrail;
    snapshot.nextTestIndex = mNextTestIndex;

    for (const auto& entry : mStageTests)
      {
	const SequentialGovernanceTester& tester = *entry.second;
	snapshot.activeTests.push_back(StageTestSnapshot{entry.first,
							 tester.getTestId(),
							 tester.getConfiguration(),
							 mStageTestIndex.at(entry.first),
							 tester.getState()});
      }

    return snapshot;
  }

  void PolicyLifecycleManager::restoreSnapshot(const LifecycleSnapshot& snapshot)
  {
    std::set<std::string> ids;
    std::size_t liveCount = 0;

    for (const auto& record : snapshot.records)
      {
	if (record.policyId.empty() || !ids.insert(record.policyId).second)
	  throw PersistenceException("PolicyLifecycleManager: duplicate or empty policy id in snapshot");

	if (record.status == LifecycleStatus::Live)
	  ++liveCount;
      }

    if (liveCount > 1)
      throw PersistenceException("PolicyLifecycleManager: snapshot holds more than one LIVE record");

    if (snapshot.nextTestIndex == 0)
      throw PersistenceException("PolicyLifecycleManager: snapshot test index must be >= 1");

    std::map<std::string, std::unique_ptr<SequentialGovernanceTester>> tests;
    std::map<std::string, std::size_t> testIndex;

    for (const auto& active : snapshot.activeTests)
      {
	auto recordIt = std::find_if(snapshot.records.begin(), snapshot.records.end(),
				     [&active](const PolicyRecord& r) { return r.policyId == active.policyId; });

	if (recordIt == snapshot.records.end() || !isTestedStage(recordIt->status))
	  throw PersistenceException("PolicyLifecycleManager: stage test without a CANARY or SHADOW record: " +
				     active.policyId);

	try
	  {
	    auto tester = std::make_unique<SequentialGovernanceTester>(active.testId, active.config,
								       mLedger, mSpendingPolicy,
								       active.testIndex, mMetrics, mLogger);
	    tester->restoreState(active.state);
	    tests[active.policyId] = std::move(tester);
	    testIndex[active.policyId] = active.testIndex;
	  }
	catch (const std::invalid_argument& e)
	  {
	    throw PersistenceException(std::string("PolicyLifecycleManager: invalid stage test: ") + e.what());
	  }
	catch (const ConfigurationException& e)
	  {
	    throw PersistenceException(std::string("PolicyLifecycleManager: invalid stage test: ") + e.what());
	  }
      }

    for (const auto& record : snapshot.records)
      {
	if (isTestedStage(record.status) && tests.find(record.policyId) == tests.end())
	  throw PersistenceException("PolicyLifecycleManager: " + record.policyId + " is " +
				     toString(record.status) + " but has no stage test");
      }

    std::lock_guard<std::mutex> lock(mMutex);
    mRecords = snapshot.records;
    mAuditTrail = snapshot.auditTrail;
    mStageTests = std::move(tests);
    mStageTestIndex = std::move(testIndex);
    mNextTestIndex = snapshot.nextTestIndex;
  }

  PolicyRecord& PolicyLifecycleManager::findLocked(const std::string& policyId)
  {
    for (auto& record : mRecords)
      {
	if (record.policyId == policyId)
	  return record;
      }

    throw InvalidInputException("PolicyLifecycleManager: unknown policy " + policyId);
  }

  const PolicyRecord* PolicyLifecycleManager::findLiveLocked() const
  {
    for (const auto& record : mRecords)
      {
	if (record.status == LifecycleStatus::Live)
	  return &record;
      }

    return nullptr;
  }

  void PolicyLifecycleManager::transitionLocked(PolicyRecord& record,
						LifecycleStatus to,
						const boost::posix_time::ptime& timestamp,
						const std::string& reason)
  {
    const LifecycleStatus from = record.status;
    record.status = to;

    mAuditTrail.push_back(LifecycleTransition{record.policyId, from, to, timestamp, reason});
    mMetrics->incrementCounter(metric_names::kLifecycleTransitionsTotal,
			       {{"from", toString(from)}, {"to", toString(to)}});

    std::ostringstream msg;
    msg << record.policyId << ": " << toString(from) << " -> " << toString(to) << " (" << reason << ")";
    logTo(mLogger, LogLevel::Info, kComponent, msg.str());
  }

  SequentialTesterConfiguration PolicyLifecycleManager::stageTesterConfigurationLocked() const
  {
    SequentialTesterConfiguration config;
    config.mu0 = mConfig.defaultBaselineMean;
    config.sigma = mConfig.defaultSigma;

    const PolicyRecord* live = findLiveLocked();
    if (live && live->metrics.getCount() >= mConfig.minBaselineSamples)
      {
	config.mu0 = live->metrics.getMean();

	const double baselineSigma = live->metrics.getStandardDeviation();
	if (baselineSigma > 0.0)
	  config.sigma = baselineSigma;
      }

    config.mu1 = config.mu0 + mConfig.minimumDetectableEffect;
    config.beta = mConfig.beta;
    config.minSamples = mConfig.minSamples;
    config.maxSamples = mConfig.maxSamples;
    config.expectedTests = mConfig.expectedTests;
    config.model = mConfig.model;

    return config;
  }

  void PolicyLifecycleManager::startStageTestLocked(const PolicyRecord& record, LifecycleStatus stage)
  {
    const std::size_t index = mNextTestIndex++;
    const SequentialTesterConfiguration config = stageTesterConfigurationLocked();

    mStageTests[record.policyId] =
      std::make_unique<SequentialGovernanceTester>(stageTestId(record.policyId, stage), config,
						   mLedger, mSpendingPolicy, index, mMetrics, mLogger);
    mStageTestIndex[record.policyId] = index;

    std::ostringstream msg;
    msg << record.policyId << ": " << toString(stage) << " test #" << index
	<< " mu0=" << config.mu0 << " mu1=" << config.mu1 << " sigma=" << config.sigma;
    logTo(mLogger, LogLevel::Debug, kComponent, msg.str());
  }

  void PolicyLifecycleManager::applyDecisionLocked(PolicyRecord& record,
						   const GovernanceDecision& decision,
						   const boost::posix_time::ptime& timestamp)
  {
    if (decision.decision == SequentialDecision::Continue)
      return;

    const LifecycleStatus stage = record.status;
    mStageTests.erase(record.policyId);
    mStageTestIndex.erase(record.policyId);

    if (decision.decision == SequentialDecision::AcceptH0)
      {
	transitionLocked(record, LifecycleStatus::Failed, timestamp,
			 decision.truncated ? "ACCEPT_H0 (truncated)" : "ACCEPT_H0");
	return;
      }

    if (stage == LifecycleStatus::Canary)
      {
	record.promotedAt = timestamp;
	transitionLocked(record, LifecycleStatus::Shadow, timestamp, "ACCEPT_H1");
	startStageTestLocked(record, LifecycleStatus::Shadow);
	return;
      }

    // SHADOW promoted to LIVE; the incumbent is retired
    for (auto& other : mRecords)
      {
	if (other.status == LifecycleStatus::Live && other.policyId != record.policyId)
	  transitionLocked(other, LifecycleStatus::Deprecated, timestamp,
			   "superseded by " + record.policyId);
      }

    record.promotedAt = timestamp;
    transitionLocked(record, LifecycleStatus::Live, timestamp, "ACCEPT_H1");
  }
}
