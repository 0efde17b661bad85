// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RISKGOV_GUARD_KIND_H
#define __RISKGOV_GUARD_KIND_H 1

#include <array>
#include <cstddef>
#include <limits>
#include <string>

namespace mkc_riskgov
{
  /**
   * @brief Acceptance guards in evaluation order.
   *
   * The order matters: the execution gate reports the first hard breach in
   * this order as its block reason.
   */
  enum class GuardKind
  {
    CoverageEma,
    CoverageMissStreak,
    LatencyP95,
    SurprisalP95,
    RelativeIntervalWidth,
    Kappa,
    KappaPlus
  };

  constexpr std::size_t kGuardKindCount = 7;

  const char* toString(GuardKind kind);

  // @throws std::invalid_argument for an unknown name
  GuardKind guardKindFromString(const std::string& name);

  const std::array<GuardKind, kGuardKindCount>& allGuardKinds();

  // True for guards that breach when the metric falls below the threshold
  bool isLowerBoundGuard(GuardKind kind);

  struct GuardThreshold
  {
    bool enabled;
    double soft;
    double hard;
  };

  GuardThreshold defaultGuardThreshold(GuardKind kind);

  /**
   * @brief Result of checking one metric against its thresholds.
   *
   * breachedSoft is also set on a hard breach, so "any soft breach" means
   * the metric is outside its soft bound.
   */
  struct GuardEvaluation
  {
    GuardKind kind;
    double value;
    double softThreshold;
    double hardThreshold;
    bool breachedSoft;
    bool breachedHard;
  };

  /**
   * @brief Metric values of one cycle. NaN means no data for the guard.
   */
  struct GuardMetrics
  {
    double coverageEma = std::numeric_limits<double>::quiet_NaN();
    double coverageMissStreak = std::numeric_limits<double>::quiet_NaN();
    double latencyP95 = std::numeric_limits<double>::quiet_NaN();
    double surprisalP95 = std::numeric_limits<double>::quiet_NaN();
    double relativeIntervalWidth = std::numeric_limits<double>::quiet_NaN();
    double kappa = std::numeric_limits<double>::quiet_NaN();
    double kappaPlus = std::numeric_limits<double>::quiet_NaN();

    double value(GuardKind kind) const;
  };

  // A NaN value or a disabled threshold never breaches
  GuardEvaluation evaluateGuard(GuardKind kind, double value, const GuardThreshold& threshold);
}

#endif
