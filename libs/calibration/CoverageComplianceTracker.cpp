// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "CoverageComplianceTracker.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include "RiskGovernanceException.h"

namespace mkc_riskgov
{
  std::vector<std::string> CoverageComplianceConfiguration::validationErrors() const
  {
    std::vector<std::string> errors;

    if (windowSize == 0)
      errors.push_back("windowSize must be >= 1");

    if (!(emaBeta > 0.0 && emaBeta <= 1.0))
      errors.push_back("emaBeta must be in (0, 1]");

    if (!(blend >= 0.0 && blend <= 1.0))
      errors.push_back("blend must be in [0, 1]");

    if (!(deficitTolerance > 0.0) || !(excessTolerance > 0.0))
      errors.push_back("tolerances must be positive");

    return errors;
  }

  void CoverageComplianceConfiguration::validate() const
  {
    throwOnConfigurationErrors("CoverageCompliance", validationErrors());
  }

  CoverageComplianceTracker::CoverageComplianceTracker(const CoverageComplianceConfiguration& config)
    : mConfig(config),
      mWindow(),
      mWindowHits(0),
      mEmaCoverage(std::numeric_limits<double>::quiet_NaN()),
      mLastTarget(std::numeric_limits<double>::quiet_NaN()),
      mCount(0)
  {
    mConfig.validate();
    mWindow.set_capacity(mConfig.windowSize);
  }

  void CoverageComplianceTracker::update(bool hit, double targetCoverage)
  {
    if (!(targetCoverage > 0.0 && targetCoverage < 1.0))
      throw InvalidInputException("CoverageComplianceTracker: target coverage must be in (0, 1)");

    if (mWindow.full() && mWindow.front())
      --mWindowHits;

    mWindow.push_back(hit);
    if (hit)
      ++mWindowHits;

    const double h = hit ? 1.0 : 0.0;
    if (mCount == 0)
      mEmaCoverage = targetCoverage;

    mEmaCoverage = (1.0 - mConfig.emaBeta) * mEmaCoverage + mConfig.emaBeta * h;
    mLastTarget = targetCoverage;
    ++mCount;
  }

  double CoverageComplianceTracker::getEstimate() const
  {
    if (mCount == 0)
      return 1.0;

    const double windowCompliance = compliance(getWindowCoverage(), mLastTarget,
					       mConfig.deficitTolerance, mConfig.excessTolerance);
    const double emaCompliance = compliance(mEmaCoverage, mLastTarget,
					    mConfig.deficitTolerance, mConfig.excessTolerance);

    return mConfig.blend * windowCompliance + (1.0 - mConfig.blend) * emaCompliance;
  }

  double CoverageComplianceTracker::getWindowCoverage() const
  {
    if (mWindow.empty())
      return std::numeric_limits<double>::quiet_NaN();

    return static_cast<double>(mWindowHits) / static_cast<double>(mWindow.size());
  }

  double CoverageComplianceTracker::getEmaCoverage() const
  {
    return mEmaCoverage;
  }

  double CoverageComplianceTracker::compliance(double coverage,
					       double target,
					       double deficitTolerance,
					       double excessTolerance)
  {
    const double penalty = std::max(0.0, target - coverage) / deficitTolerance +
      std::max(0.0, coverage - target) / excessTolerance;

    return 1.0 - std::min(1.0, penalty);
  }

  CoverageComplianceState CoverageComplianceTracker::getState() const
  {
    return CoverageComplianceState{std::vector<bool>(mWindow.begin(), mWindow.end()),
				   mEmaCoverage, mLastTarget, mCount};
  }

  void CoverageComplianceTracker::restoreState(const CoverageComplianceState& state)
  {
    if (state.windowHits.size() > mConfig.windowSize)
      throw std::invalid_argument("CoverageComplianceTracker: restored window exceeds capacity");

    if (state.count < state.windowHits.size())
      throw std::invalid_argument("CoverageComplianceTracker: restored count smaller than window");

    if (state.count > 0)
      {
	if (state.windowHits.empty())
	  throw std::invalid_argument("CoverageComplianceTracker: restored window is empty");

	if (!(state.emaCoverage >= 0.0 && state.emaCoverage <= 1.0))
	  throw std::invalid_argument("CoverageComplianceTracker: restored EMA outside [0, 1]");

	if (!(state.lastTargetCoverage > 0.0 && state.lastTargetCoverage < 1.0))
	  throw std::invalid_argument("CoverageComplianceTracker: restored target outside (0, 1)");
      }

    mWindow.clear();
    mWindowHits = 0;
    for (bool hit : state.windowHits)
      {
	mWindow.push_back(hit);
	if (hit)
	  ++mWindowHits;
      }

    mEmaCoverage = (state.count > 0) ? state.emaCoverage : std::numeric_limits<double>::quiet_NaN();
    mLastTarget = (state.count > 0) ? state.lastTargetCoverage : std::numeric_limits<double>::quiet_NaN();
    mCount = state.count;
  }
}
