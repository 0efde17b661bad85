// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "GuardKind.h"
#include <cmath>
#include <stdexcept>

namespace mkc_riskgov
{
  const char* toString(GuardKind kind)
  {
    switch (kind)
      {
      case GuardKind::CoverageEma:
	return "coverage_ema";
      case GuardKind::CoverageMissStreak:
	return "coverage_miss_streak";
      case GuardKind::LatencyP95:
	return "latency_p95";
      case GuardKind::SurprisalP95:
	return "surprisal_p95";
      case GuardKind::RelativeIntervalWidth:
	return "relative_interval_width";
      case GuardKind::Kappa:
	return "kappa";
      case GuardKind::KappaPlus:
	return "kappa_plus";
      }

    return "unknown";
  }

  GuardKind guardKindFromString(const std::string& name)
  {
    for (GuardKind kind : allGuardKinds())
      if (name == toString(kind))
	return kind;

    throw std::invalid_argument("Unknown guard kind: " + name);
  }

  const std::array<GuardKind, kGuardKindCount>& allGuardKinds()
  {
    static const std::array<GuardKind, kGuardKindCount> kinds = {
      GuardKind::CoverageEma,
      GuardKind::CoverageMissStreak,
      GuardKind::LatencyP95,
      GuardKind::SurprisalP95,
      GuardKind::RelativeIntervalWidth,
      GuardKind::Kappa,
      GuardKind::KappaPlus
    };

    return kinds;
  }

  bool isLowerBoundGuard(GuardKind kind)
  {
    switch (kind)
      {
      case GuardKind::CoverageEma:
	return true;
      case GuardKind::CoverageMissStreak:
      case GuardKind::LatencyP95:
      case GuardKind::SurprisalP95:
      case GuardKind::RelativeIntervalWidth:
      case GuardKind::Kappa:
      case GuardKind::KappaPlus:
	return false;
      }

    return false;
  }

  GuardThreshold defaultGuardThreshold(GuardKind kind)
  {
    switch (kind)
      {
      case GuardKind::CoverageEma:
	return GuardThreshold{true, 0.85, 0.80};
      case GuardKind::CoverageMissStreak:
	return GuardThreshold{true, 5.0, 10.0};
      case GuardKind::LatencyP95:
	return GuardThreshold{true, 100.0, 150.0};
      case GuardKind::SurprisalP95:
	return GuardThreshold{true, 2.5, 3.5};
      case GuardKind::RelativeIntervalWidth:
	// Scale depends on the instrument, so it has to be set per profile
	return GuardThreshold{false, 0.5, 1.0};
      case GuardKind::Kappa:
	return GuardThreshold{true, 0.60, 0.85};
      case GuardKind::KappaPlus:
	return GuardThreshold{true, 0.60, 0.85};
      }

    return GuardThreshold{false, 0.0, 0.0};
  }

  double GuardMetrics::value(GuardKind kind) const
  {
    switch (kind)
      {
      case GuardKind::CoverageEma:
	return coverageEma;
      case GuardKind::CoverageMissStreak:
	return coverageMissStreak;
      case GuardKind::LatencyP95:
	return latencyP95;
      case GuardKind::SurprisalP95:
	return surprisalP95;
      case GuardKind::RelativeIntervalWidth:
	return relativeIntervalWidth;
      case GuardKind::Kappa:
	return kappa;
      case GuardKind::KappaPlus:
	return kappaPlus;
      }

    return std::numeric_limits<double>::quiet_NaN();
  }

  GuardEvaluation evaluateGuard(GuardKind kind, double value, const GuardThreshold& threshold)
  {
    GuardEvaluation evaluation{kind, value, threshold.soft, threshold.hard, false, false};

    if (!threshold.enabled || std::isnan(value))
      return evaluation;

    if (isLowerBoundGuard(kind))
      {
	evaluation.breachedHard = value < threshold.hard;
	evaluation.breachedSoft = value < threshold.soft || evaluation.breachedHard;
      }
    else
      {
	evaluation.breachedHard = value > threshold.hard;
	evaluation.breachedSoft = value > threshold.soft || evaluation.breachedHard;
      }

    return evaluation;
  }
}
