// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "AcceptanceOrchestrator.h"
#include <cmath>
#include <sstream>
#include <stdexcept>
#include "MetricNames.h"
#include "RiskGovernanceException.h"

namespace mkc_riskgov
{
  namespace
  {
    const char* const kComponent = "AcceptanceOrchestrator";

    const char* lowerName(Posture posture)
    {
      switch (posture)
	{
	case Posture::Pass:
	  return "pass";
	case Posture::Derisk:
	  return "derisk";
	case Posture::Block:
	  return "block";
	}

      return "unknown";
    }
  }

  const char* toString(Posture posture)
  {
    switch (posture)
      {
      case Posture::Pass:
	return "PASS";
      case Posture::Derisk:
	return "DERISK";
      case Posture::Block:
	return "BLOCK";
      }

    return "UNKNOWN";
  }

  Posture postureFromString(const std::string& name)
  {
    if (name == "PASS")
      return Posture::Pass;

    if (name == "DERISK")
      return Posture::Derisk;

    if (name == "BLOCK")
      return Posture::Block;

    throw std::invalid_argument("Unknown posture: " + name);
  }

  std::string transitionName(Posture from, Posture to)
  {
    return std::string(lowerName(from)) + "_to_" + lowerName(to);
  }

  AcceptanceConfiguration::AcceptanceConfiguration()
    : profile("default"),
      thresholds()
  {
    for (GuardKind kind : allGuardKinds())
      thresholds[kind] = defaultGuardThreshold(kind);
  }

  const GuardThreshold& AcceptanceConfiguration::threshold(GuardKind kind) const
  {
    const auto it = thresholds.find(kind);
    if (it == thresholds.end())
      throw ConfigurationException(std::string("Acceptance configuration has no threshold for ") +
				   toString(kind));

    return it->second;
  }

  std::vector<std::string> AcceptanceConfiguration::validationErrors() const
  {
    std::vector<std::string> errors;

    if (profile.empty())
      errors.push_back("profile must not be empty");

    for (GuardKind kind : allGuardKinds())
      {
	const auto it = thresholds.find(kind);
	if (it == thresholds.end())
	  {
	    errors.push_back(std::string("missing threshold for ") + toString(kind));
	    continue;
	  }

	const GuardThreshold& t = it->second;
	if (!t.enabled)
	  continue;

	if (!std::isfinite(t.soft) || !std::isfinite(t.hard))
	  errors.push_back(std::string(toString(kind)) + " thresholds must be finite");
	else if (isLowerBoundGuard(kind) && t.soft < t.hard)
	  errors.push_back(std::string(toString(kind)) + " soft threshold must be >= hard threshold");
	else if (!isLowerBoundGuard(kind) && t.soft > t.hard)
	  errors.push_back(std::string(toString(kind)) + " soft threshold must be <= hard threshold");
      }

    if (dwellMinDerisk == 0)
      errors.push_back("dwellMinDerisk must be >= 1");

    if (dwellMinRecovery == 0)
      errors.push_back("dwellMinRecovery must be >= 1");

    if (blockCooldownCycles == 0)
      errors.push_back("blockCooldownCycles must be >= 1");

    if (blockRecoveryWindow <= dwellMinRecovery)
      errors.push_back("blockRecoveryWindow must be greater than dwellMinRecovery");

    if (!(kappaPlusConfidenceFloor >= 0.0 && kappaPlusConfidenceFloor <= 1.0))
      errors.push_back("kappaPlusConfidenceFloor must be in [0, 1]");

    return errors;
  }

  void AcceptanceConfiguration::validate() const
  {
    throwOnConfigurationErrors("Acceptance", validationErrors());
  }

  std::uint64_t AcceptanceState::getTransitionTotal() const
  {
    std::uint64_t total = 0;
    for (const auto& entry : transitionCounts)
      total += entry.second;

    return total;
  }

  AcceptanceOrchestrator::AcceptanceOrchestrator(const AcceptanceConfiguration& config,
						 std::shared_ptr<IMetricsSink> metrics,
						 std::shared_ptr<RiskLogger> logger)
    : mConfig(config),
      mMetrics(metrics ? std::move(metrics) : std::make_shared<NullMetricsSink>()),
      mLogger(std::move(logger)),
      mState()
  {
    mConfig.validate();
  }

  AcceptanceStep AcceptanceOrchestrator::evaluate(const GuardMetrics& metrics,
						  const boost::posix_time::ptime& timestamp) const
  {
    AcceptanceState next(mState);

    std::vector<GuardEvaluation> guards;
    guards.reserve(kGuardKindCount);

    bool anySoft = false;
    bool anyHard = false;
    std::optional<GuardKind> firstHard;

    for (GuardKind kind : allGuardKinds())
      {
	const GuardEvaluation evaluation = evaluateGuard(kind, metrics.value(kind), mConfig.threshold(kind));
	guards.push_back(evaluation);

	if (evaluation.breachedSoft)
	  {
	    anySoft = true;
	    ++next.violationsByGuard[kind];
	  }

	if (evaluation.breachedHard)
	  {
	    anyHard = true;
	    ++next.hardViolationsByGuard[kind];
	    if (!firstHard)
	      firstHard = kind;
	  }
      }

    const bool kappaPlusLow = std::isfinite(metrics.kappaPlus) &&
      (1.0 - metrics.kappaPlus) < mConfig.kappaPlusConfidenceFloor;
    const bool clean = !anySoft && !kappaPlusLow;

    next.softBreachStreak = anySoft ? mState.softBreachStreak + 1 : 0;
    next.cleanStreak = clean ? mState.cleanStreak + 1 : 0;
    next.dwellCounter = mState.dwellCounter + 1;
    ++next.cycles;

    bool pending = false;
    const Posture target = nextPosture(next, anyHard, kappaPlusLow, clean, pending);

    if (pending)
      ++next.pendingCycles;

    if (target != mState.posture)
      {
	++next.transitionCounts[transitionName(mState.posture, target)];
	next.posture = target;
	next.dwellCounter = 0;
	next.softBreachStreak = 0;
	next.cleanStreak = 0;
	next.lastTransition = timestamp;
      }

    ++next.decisionsByPosture[next.posture];

    AcceptanceDecision decision{next.posture,
				mState.posture,
				next.posture != mState.posture,
				std::move(guards),
				firstHard,
				next.cycles,
				timestamp};

    return AcceptanceStep{mState.cycles, std::move(next), std::move(decision)};
  }

  Posture AcceptanceOrchestrator::nextPosture(const AcceptanceState& next,
					      bool anyHard,
					      bool kappaPlusLow,
					      bool clean,
					      bool& pending) const
  {
    switch (next.posture)
      {
      case Posture::Pass:
	pending = !clean;
	if (anyHard || kappaPlusLow || next.softBreachStreak >= mConfig.dwellMinDerisk)
	  return Posture::Derisk;
	return Posture::Pass;

      case Posture::Derisk:
	pending = anyHard || clean;
	if (anyHard)
	  return Posture::Block;
	if (next.cleanStreak >= mConfig.dwellMinRecovery)
	  return Posture::Pass;
	return Posture::Derisk;

      case Posture::Block:
	{
	  pending = !anyHard;
	  if (anyHard || next.dwellCounter < mConfig.blockCooldownCycles)
	    return Posture::Block;

	  if (mConfig.allowDirectBlockRecovery && next.cleanStreak >= mConfig.blockRecoveryWindow)
	    return Posture::Pass;

	  return Posture::Derisk;
	}
      }

    return next.posture;
  }

  AcceptanceDecision AcceptanceOrchestrator::commit(const AcceptanceStep& step)
  {
    if (step.baseCycle != mState.cycles)
      throw std::invalid_argument("AcceptanceOrchestrator: step was computed from a different cycle");

    mState = step.nextState;
    emitTelemetry(step.decision);

    return step.decision;
  }

  AcceptanceDecision AcceptanceOrchestrator::step(const GuardMetrics& metrics,
						  const boost::posix_time::ptime& timestamp)
  {
    return commit(evaluate(metrics, timestamp));
  }

  double AcceptanceOrchestrator::getChurnPer1k() const
  {
    if (mState.cycles == 0)
      return 0.0;

    return 1000.0 * static_cast<double>(mState.getTransitionTotal()) / static_cast<double>(mState.cycles);
  }

  double AcceptanceOrchestrator::getDwellEfficiency() const
  {
    if (mState.pendingCycles == 0)
      return 1.0;

    return static_cast<double>(mState.getTransitionTotal()) / static_cast<double>(mState.pendingCycles);
  }

  void AcceptanceOrchestrator::restoreState(const AcceptanceState& state)
  {
    const std::uint64_t transitions = state.getTransitionTotal();

    if (transitions > state.cycles || state.pendingCycles > state.cycles)
      throw std::invalid_argument("AcceptanceOrchestrator: restored counters exceed the cycle count");

    if (transitions > state.pendingCycles)
      throw std::invalid_argument("AcceptanceOrchestrator: restored transitions exceed pending cycles");

    if (state.dwellCounter > state.cycles || state.cleanStreak > state.cycles ||
	state.softBreachStreak > state.cycles)
      throw std::invalid_argument("AcceptanceOrchestrator: restored streaks exceed the cycle count");

    mState = state;

    std::ostringstream msg;
    msg << "restored posture " << toString(mState.posture) << " after " << mState.cycles << " cycles";
    logTo(mLogger, LogLevel::Info, kComponent, msg.str());
  }

  void AcceptanceOrchestrator::emitTelemetry(const AcceptanceDecision& decision)
  {
    const std::string& profile = mConfig.profile;

    mMetrics->incrementCounter(metric_names::kDecisionTotal,
			       {{"posture", toString(decision.posture)}, {"profile", profile}});

    for (const auto& guard : decision.guards)
      {
	if (guard.breachedSoft)
	  mMetrics->incrementCounter(metric_names::kViolationTotal,
				     {{"guard", toString(guard.kind)}, {"profile", profile}});

	if (guard.breachedHard)
	  mMetrics->incrementCounter(metric_names::kHardViolationTotal,
				     {{"guard", toString(guard.kind)}, {"profile", profile}});
      }

    if (decision.transitioned)
      {
	mMetrics->incrementCounter(metric_names::kStateTransitionsTotal,
				   {{"from", toString(decision.previousPosture)},
				    {"to", toString(decision.posture)},
				    {"profile", profile}});

	std::ostringstream msg;
	msg << "[" << profile << "] " << toString(decision.previousPosture) << " -> "
	    << toString(decision.posture) << " at cycle " << decision.cycle;
	if (decision.firstHardBreach)
	  msg << " (hard breach " << toString(*decision.firstHardBreach) << ")";

	logTo(mLogger, decision.posture == Posture::Block ? LogLevel::Warning : LogLevel::Info,
	      kComponent, msg.str());
      }

    mMetrics->setGauge(metric_names::kDecisionChurnPer1k, {{"profile", profile}}, getChurnPer1k());
    mMetrics->setGauge(metric_names::kDwellEfficiency, {{"profile", profile}}, getDwellEfficiency());
  }
}
