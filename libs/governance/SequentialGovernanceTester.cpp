// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "SequentialGovernanceTester.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include "MetricNames.h"
#include "NormalQuantile.h"
#include "RiskGovernanceException.h"

namespace mkc_riskgov
{
  namespace
  {
    const char* const kComponent = "SequentialGovernanceTester";
  }

  const char* toString(SequentialDecision decision)
  {
    switch (decision)
      {
      case SequentialDecision::Continue:
	return "CONTINUE";
      case SequentialDecision::AcceptH1:
	return "ACCEPT_H1";
      case SequentialDecision::AcceptH0:
	return "ACCEPT_H0";
      }

    return "UNKNOWN";
  }

  SequentialDecision sequentialDecisionFromString(const std::string& name)
  {
    if (name == "CONTINUE")
      return SequentialDecision::Continue;
    if (name == "ACCEPT_H1")
      return SequentialDecision::AcceptH1;
    if (name == "ACCEPT_H0")
      return SequentialDecision::AcceptH0;

    throw std::invalid_argument("Unknown sequential decision: " + name);
  }

  const char* toString(LikelihoodModel model)
  {
    switch (model)
      {
      case LikelihoodModel::GaussianKnownVariance:
	return "gaussian";
      case LikelihoodModel::GaussianGlr:
	return "gaussian_glr";
      }

    return "unknown";
  }

  LikelihoodModel likelihoodModelFromString(const std::string& name)
  {
    if (name == "gaussian")
      return LikelihoodModel::GaussianKnownVariance;
    if (name == "gaussian_glr")
      return LikelihoodModel::GaussianGlr;

    throw ConfigurationException("Unknown likelihood model: " + name);
  }

  const char* toString(AllocationStatus status)
  {
    switch (status)
      {
      case AllocationStatus::Pending:
	return "pending";
      case AllocationStatus::Granted:
	return "granted";
      case AllocationStatus::Denied:
	return "denied";
      }

    return "unknown";
  }

  AllocationStatus allocationStatusFromString(const std::string& name)
  {
    if (name == "pending")
      return AllocationStatus::Pending;
    if (name == "granted")
      return AllocationStatus::Granted;
    if (name == "denied")
      return AllocationStatus::Denied;

    throw std::invalid_argument("Unknown allocation status: " + name);
  }

  std::vector<std::string> SequentialTesterConfiguration::validationErrors() const
  {
    std::vector<std::string> errors;

    if (!std::isfinite(mu0) || !std::isfinite(mu1))
      errors.push_back("mu0 and mu1 must be finite");
    else if (mu0 == mu1)
      errors.push_back("mu0 and mu1 must differ");

    if (!(sigma > 0.0) || !std::isfinite(sigma))
      errors.push_back("sigma must be positive");

    if (!(beta > 0.0 && beta < 1.0))
      errors.push_back("beta must be in (0, 1)");

    if (minSamples == 0)
      errors.push_back("minSamples must be >= 1");

    if (maxSamples != 0 && maxSamples < minSamples)
      errors.push_back("maxSamples must be 0 or >= minSamples");

    if (expectedTests == 0)
      errors.push_back("expectedTests must be >= 1");

    if (!(varianceFloor > 0.0))
      errors.push_back("varianceFloor must be positive");

    return errors;
  }

  void SequentialTesterConfiguration::validate() const
  {
    throwOnConfigurationErrors("SequentialTester", validationErrors());
  }

  SequentialGovernanceTester::SequentialGovernanceTester(const std::string& testId,
							 const SequentialTesterConfiguration& config,
							 std::shared_ptr<AlphaSpendingLedger> ledger,
							 std::shared_ptr<AlphaSpendingPolicy> policy,
							 std::size_t firstTestIndex,
							 std::shared_ptr<IMetricsSink> metrics,
							 std::shared_ptr<RiskLogger> logger)
    : mTestId(testId),
      mConfig(config),
      mLedger(std::move(ledger)),
      mPolicy(std::move(policy)),
      mFirstTestIndex(firstTestIndex == 0 ? 1 : firstTestIndex),
      mMetrics(metrics ? std::move(metrics) : std::make_shared<NullMetricsSink>()),
      mLogger(std::move(logger)),
      mState()
  {
    if (mTestId.empty())
      throw std::invalid_argument("SequentialGovernanceTester: test id must not be empty");

    if (!mLedger || !mPolicy)
      throw std::invalid_argument("SequentialGovernanceTester: ledger and spending policy are required");

    mConfig.validate();
  }

  double SequentialGovernanceTester::upperBoundary(double alphaTest, double beta)
  {
    return std::log((1.0 - beta) / alphaTest);
  }

  double SequentialGovernanceTester::lowerBoundary(double alphaTest, double beta)
  {
    return std::log(beta / (1.0 - alphaTest));
  }

  GovernanceDecision SequentialGovernanceTester::observe(double value,
							 const boost::posix_time::ptime& timestamp)
  {
    if (!std::isfinite(value))
      throw InvalidInputException("SequentialGovernanceTester: observation must be finite");

    if (mState.allocation == AllocationStatus::Pending)
      requestAllocation(timestamp);

    accumulate(value);

    GovernanceDecision result;
    result.policyId = mTestId;
    result.decision = SequentialDecision::Continue;
    result.llr = mState.logLikelihoodRatio;
    result.nSamples = mState.nSamples;
    result.alphaSpent = (mState.allocation == AllocationStatus::Granted) ? mState.alphaTest : 0.0;
    result.upperBoundary = std::numeric_limits<double>::quiet_NaN();
    result.lowerBoundary = std::numeric_limits<double>::quiet_NaN();
    result.pValue = currentPValue();
    result.budgetDenied = (mState.allocation == AllocationStatus::Denied);
    result.truncated = false;
    result.timestamp = timestamp;

    if (mState.allocation != AllocationStatus::Granted)
      return result;

    result.upperBoundary = upperBoundary(mState.alphaTest, mConfig.beta);
    result.lowerBoundary = lowerBoundary(mState.alphaTest, mConfig.beta);

    if (mState.nSamples < mConfig.minSamples)
      return result;

    if (mState.logLikelihoodRatio >= result.upperBoundary)
      result.decision = SequentialDecision::AcceptH1;
    else if (mState.logLikelihoodRatio <= result.lowerBoundary)
      result.decision = SequentialDecision::AcceptH0;
    else if (mConfig.maxSamples > 0 && mState.nSamples >= mConfig.maxSamples)
      {
	result.decision = SequentialDecision::AcceptH0;
	result.truncated = true;
      }

    mState.decision = result.decision;

    if (result.decision != SequentialDecision::Continue)
      {
	mMetrics->incrementCounter(metric_names::kGovernanceDecisionTotal,
				   {{"decision", toString(result.decision)}});

	std::ostringstream msg;
	msg << mTestId << " " << toString(result.decision)
	    << (result.truncated ? " (truncated)" : "")
	    << " llr=" << result.llr << " n=" << result.nSamples
	    << " alpha=" << result.alphaSpent;
	logTo(mLogger, LogLevel::Info, kComponent, msg.str());

	resetRun();
      }

    return result;
  }

  void SequentialGovernanceTester::restoreState(const SequentialTestState& state)
  {
    if (!std::isfinite(state.logLikelihoodRatio) || !std::isfinite(state.sum) ||
	!std::isfinite(state.sumOfSquares))
      throw std::invalid_argument("SequentialGovernanceTester: restored state is not finite");

    if (state.allocation == AllocationStatus::Granted &&
	!(state.alphaTest > 0.0 && state.alphaTest < 1.0))
      throw std::invalid_argument("SequentialGovernanceTester: restored alpha_test outside (0, 1)");

    mState = state;
  }

  void SequentialGovernanceTester::requestAllocation(const boost::posix_time::ptime& timestamp)
  {
    const SpendingContext context{mLedger->getTotalBudget(),
				  mConfig.expectedTests,
				  mFirstTestIndex + mState.runsCompleted,
				  mState.totalSteps};

    const double allowance = mPolicy->allowance(context);
    const LedgerEventType eventType = (mState.runsCompleted == 0) ?
      LedgerEventType::TestAllocation : LedgerEventType::TestRestart;

    const bool usable = std::isfinite(allowance) && allowance > 0.0 && allowance < 1.0;

    if (usable && mLedger->canSpend(allowance))
      {
	// trySpend counts its own denials
	if (mLedger->trySpend(mTestId, allowance, eventType, timestamp))
	  {
	    mState.allocation = AllocationStatus::Granted;
	    mState.alphaTest = allowance;
	    return;
	  }
      }
    else
      mMetrics->incrementCounter(metric_names::kAlphaSpendDeniedTotal, {});

    mState.allocation = AllocationStatus::Denied;
    mState.alphaTest = 0.0;

    std::ostringstream msg;
    msg << mTestId << ": alpha spend of " << allowance << " denied (cumulative "
	<< mLedger->getCumulativeAlpha() << " of " << mLedger->getTotalBudget()
	<< "); test forced to CONTINUE";
    logTo(mLogger, LogLevel::Warning, kComponent, msg.str());
  }

  void SequentialGovernanceTester::accumulate(double value)
  {
    ++mState.nSamples;
    ++mState.totalSteps;
    mState.sum += value;
    mState.sumOfSquares += value * value;

    const double mu0 = mConfig.mu0;
    const double mu1 = mConfig.mu1;

    switch (mConfig.model)
      {
      case LikelihoodModel::GaussianKnownVariance:
	{
	  const double variance = mConfig.sigma * mConfig.sigma;
	  mState.logLikelihoodRatio +=
	    ((value - mu0) * (value - mu0) - (value - mu1) * (value - mu1)) / (2.0 * variance);
	  break;
	}

      case LikelihoodModel::GaussianGlr:
	{
	  const double n = static_cast<double>(mState.nSamples);
	  if (mState.nSamples < 2)
	    {
	      mState.logLikelihoodRatio = 0.0;
	      break;
	    }

	  const double mean = mState.sum / n;
	  const double variance = std::max(mConfig.varianceFloor,
					   (mState.sumOfSquares - n * mean * mean) / (n - 1.0));
	  mState.logLikelihoodRatio =
	    n / (2.0 * variance) * ((mean - mu0) * (mean - mu0) - (mean - mu1) * (mean - mu1));
	  break;
	}
      }
  }

  double SequentialGovernanceTester::currentPValue() const
  {
    if (mState.nSamples == 0)
      return 1.0;

    const double n = static_cast<double>(mState.nSamples);
    const double mean = mState.sum / n;

    double sd = mConfig.sigma;
    if (mConfig.model == LikelihoodModel::GaussianGlr && mState.nSamples >= 2)
      sd = std::sqrt(std::max(mConfig.varianceFloor,
			      (mState.sumOfSquares - n * mean * mean) / (n - 1.0)));

    const double direction = (mConfig.mu1 > mConfig.mu0) ? 1.0 : -1.0;
    const double z = direction * (mean - mConfig.mu0) / (sd / std::sqrt(n));

    return 1.0 - detail::compute_normal_cdf(z);
  }

  void SequentialGovernanceTester::resetRun()
  {
    mState.logLikelihoodRatio = 0.0;
    mState.nSamples = 0;
    mState.decision = SequentialDecision::Continue;
    mState.alphaTest = 0.0;
    mState.allocation = AllocationStatus::Pending;
    mState.sum = 0.0;
    mState.sumOfSquares = 0.0;
    ++mState.runsCompleted;
  }
}
