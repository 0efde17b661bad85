// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "ExecutionRiskGate.h"
#include <algorithm>
#include <cmath>
#include "MetricNames.h"
#include "RiskGovernanceException.h"

namespace mkc_riskgov
{
  ExecutionGateConfiguration::ExecutionGateConfiguration()
    : profile("default"),
      scaleMap{{Posture::Pass, 1.0}, {Posture::Derisk, 0.5}, {Posture::Block, 0.0}}
  {}

  std::vector<std::string> ExecutionGateConfiguration::validationErrors() const
  {
    std::vector<std::string> errors;

    if (profile.empty())
      errors.push_back("profile must not be empty");

    for (Posture posture : {Posture::Pass, Posture::Derisk, Posture::Block})
      {
	const auto it = scaleMap.find(posture);
	if (it == scaleMap.end())
	  errors.push_back(std::string("missing scale for ") + toString(posture));
	else if (!(it->second >= 0.0 && it->second <= 1.0))
	  errors.push_back(std::string("scale for ") + toString(posture) + " must be in [0, 1]");
      }

    if (!std::isfinite(minNotional) || minNotional < 0.0)
      errors.push_back("minNotional must be finite and >= 0");

    if (!(maxNotional >= minNotional))
      errors.push_back("maxNotional must be >= minNotional");

    return errors;
  }

  void ExecutionGateConfiguration::validate() const
  {
    throwOnConfigurationErrors("ExecutionRiskGate", validationErrors());
  }

  ExecutionRiskGate::ExecutionRiskGate(const ExecutionGateConfiguration& config,
				       std::shared_ptr<IMetricsSink> metrics)
    : mConfig(config),
      mMetrics(metrics ? std::move(metrics) : std::make_shared<NullMetricsSink>()),
      mBlockCounts()
  {
    mConfig.validate();
  }

  ExecutionDecision ExecutionRiskGate::decide(Posture posture,
					      const std::vector<GuardEvaluation>& guards,
					      double baseNotional)
  {
    if (!std::isfinite(baseNotional) || baseNotional < 0.0)
      throw InvalidInputException("ExecutionRiskGate: base notional must be finite and >= 0");

    if (mConfig.hardBlockOnGuard)
      {
	const auto hard = std::find_if(guards.begin(), guards.end(),
				       [](const GuardEvaluation& g) { return g.breachedHard; });
	if (hard != guards.end())
	  return blocked(toString(hard->kind));
      }

    const double scale = mConfig.scaleMap.at(posture);
    if (posture == Posture::Block && scale == 0.0)
      return blocked(kPostureBlockReason);

    double notional = baseNotional * scale;

    // Zero stays zero: the minimum applies only to orders that will be sent
    if (notional > 0.0)
      notional = std::min(mConfig.maxNotional, std::max(mConfig.minNotional, notional));

    mMetrics->setGauge(metric_names::kExecutionRiskScale, {{"profile", mConfig.profile}}, scale);

    return ExecutionDecision{notional, scale, std::nullopt};
  }

  ExecutionDecision ExecutionRiskGate::decide(const AcceptanceDecision& decision, double baseNotional)
  {
    return decide(decision.posture, decision.guards, baseNotional);
  }

  std::uint64_t ExecutionRiskGate::getBlockCount(const std::string& reason) const
  {
    const auto it = mBlockCounts.find(reason);
    return (it != mBlockCounts.end()) ? it->second : 0;
  }

  ExecutionDecision ExecutionRiskGate::blocked(const std::string& reason)
  {
    ++mBlockCounts[reason];
    mMetrics->incrementCounter(metric_names::kExecutionBlockTotal,
			       {{"reason", reason}, {"profile", mConfig.profile}});
    mMetrics->setGauge(metric_names::kExecutionRiskScale, {{"profile", mConfig.profile}}, 0.0);

    return ExecutionDecision{0.0, 0.0, reason};
  }
}
