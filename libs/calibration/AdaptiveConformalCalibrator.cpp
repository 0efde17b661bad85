// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "AdaptiveConformalCalibrator.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include "NormalQuantile.h"
#include "RiskGovernanceException.h"

namespace mkc_riskgov
{
  namespace
  {
    constexpr double kMaxQuantileLevel = 0.999;
  }

  std::vector<std::string> CalibratorConfiguration::validationErrors() const
  {
    std::vector<std::string> errors;

    if (!(alphaMin > 0.0 && alphaMin < 1.0) || !(alphaMax > 0.0 && alphaMax < 1.0))
      errors.push_back("alphaMin and alphaMax must be in (0, 1)");
    else if (alphaMin > alphaMax)
      errors.push_back("alphaMin must not exceed alphaMax");

    if (alphaBase < alphaMin || alphaBase > alphaMax)
      errors.push_back("alphaBase must lie in [alphaMin, alphaMax]");

    if (transitionAlphaLift < 0.0 || instabilityAlphaLift < 0.0)
      errors.push_back("alpha lifts must be >= 0");

    if (!(etaBase > 0.0) || !(etaTransition > 0.0))
      errors.push_back("learning rates must be positive");

    if (!(coverageEmaBeta > 0.0 && coverageEmaBeta <= 1.0))
      errors.push_back("coverageEmaBeta must be in (0, 1]");

    if (minCalibrationSize < 5)
      errors.push_back("minCalibrationSize must be >= 5");

    if (scoreWindowSize < minCalibrationSize)
      errors.push_back("scoreWindowSize must be >= minCalibrationSize");

    if (!(inflationCeiling > 1.0))
      errors.push_back("inflationCeiling must be > 1");

    if (cooldownCycles == 0)
      errors.push_back("cooldownCycles must be >= 1");

    if (!(transitionScoreMultiple > 1.0))
      errors.push_back("transitionScoreMultiple must be > 1");

    if (recentScoreWindow == 0 || minRecentScores == 0 || minRecentScores > recentScoreWindow)
      errors.push_back("minRecentScores must be in [1, recentScoreWindow]");

    if (refreshInterval == 0)
      errors.push_back("refreshInterval must be >= 1");

    if (retargetTolerance < 0.0)
      errors.push_back("retargetTolerance must be >= 0");

    if (!(instabilityEmaBeta > 0.0 && instabilityEmaBeta <= 1.0))
      errors.push_back("instabilityEmaBeta must be in (0, 1]");

    if (aciThreshold < 0.0)
      errors.push_back("aciThreshold must be >= 0");

    return errors;
  }

  void CalibratorConfiguration::validate() const
  {
    throwOnConfigurationErrors("Calibrator", validationErrors());
  }

  AdaptiveConformalCalibrator::AdaptiveConformalCalibrator(const CalibratorConfiguration& config)
    : mConfig(config),
      mCurrentAlpha(config.alphaBase),
      mAlphaTarget(config.alphaBase),
      mCoverageEma(1.0 - config.alphaBase),
      mMissStreak(0),
      mInflation(1.0),
      mCooldown(0),
      mInstabilityEma(0.0),
      mObservations(0),
      mEstimator(),
      mScoreWindow(),
      mRecentScores()
  {
    mConfig.validate();

    mScoreWindow.set_capacity(mConfig.scoreWindowSize);
    mRecentScores.set_capacity(mConfig.recentScoreWindow);
    mEstimator = std::make_unique<QuantileEstimator>(1.0 - mAlphaTarget, mConfig.minCalibrationSize,
						     detail::compute_normal_critical_value(1.0 - mAlphaTarget));
  }

  IntervalPrediction AdaptiveConformalCalibrator::predictInterval(double point,
								  double sigma,
								  bool isTransition,
								  double aciEma)
  {
    if (!std::isfinite(point))
      throw InvalidInputException("AdaptiveConformalCalibrator: point forecast must be finite");

    if (!std::isfinite(sigma) || !(sigma > 0.0))
      throw InvalidInputException("AdaptiveConformalCalibrator: sigma must be finite and positive");

    const double instability = std::isfinite(aciEma) ? std::max(0.0, aciEma) : 0.0;
    const double targetClipped = clipAlpha(mAlphaTarget);
    const double alpha = clipAlpha(mAlphaTarget +
				   mConfig.transitionAlphaLift * (isTransition ? 1.0 : 0.0) +
				   mConfig.instabilityAlphaLift * instability);

    const double level = std::min(kMaxQuantileLevel, 1.0 - targetClipped + (alpha - targetClipped));
    const double q = scoreQuantile(level);
    const double halfWidth = q * mInflation * sigma;

    mCurrentAlpha = alpha;

    return IntervalPrediction{point - halfWidth, point + halfWidth, alpha, point, sigma, q,
			      mInflation, isTransition};
  }

  CalibrationUpdate AdaptiveConformalCalibrator::onObservation(double groundTruth,
							       const IntervalPrediction& prediction)
  {
    if (!std::isfinite(groundTruth))
      throw InvalidInputException("AdaptiveConformalCalibrator: ground truth must be finite");

    if (!std::isfinite(prediction.lower) || !std::isfinite(prediction.upper) ||
	!std::isfinite(prediction.point) || !std::isfinite(prediction.sigmaEffective) ||
	!(prediction.sigmaEffective > 0.0))
      throw InvalidInputException("AdaptiveConformalCalibrator: prediction is not finite");

    CalibrationUpdate update;
    update.hit = (prediction.lower <= groundTruth && groundTruth <= prediction.upper);
    update.score = std::fabs(groundTruth - prediction.point) / prediction.sigmaEffective;
    update.coverageError = (update.hit ? 1.0 : 0.0) - (1.0 - mAlphaTarget);
    update.spikeDetected = false;

    // Covered forecasts raise alpha_target (tighten), misses lower it (widen)
    const double eta = prediction.isTransition ? mConfig.etaTransition : mConfig.etaBase;
    mAlphaTarget = clipAlpha(mAlphaTarget + eta * update.coverageError);

    const double beta = mConfig.coverageEmaBeta;
    mCoverageEma = (1.0 - beta) * mCoverageEma + beta * (update.hit ? 1.0 : 0.0);
    mCoverageEma = std::min(1.0, std::max(0.0, mCoverageEma));

    mMissStreak = update.hit ? 0 : mMissStreak + 1;

    const std::size_t cooldownBefore = mCooldown;
    updateTransitionInflation(update.score);
    update.spikeDetected = (cooldownBefore == 0 && mCooldown > 0);

    mEstimator->observe(update.score);
    mScoreWindow.push_back(update.score);
    mRecentScores.push_back(update.score);
    ++mObservations;

    if (mObservations % mConfig.refreshInterval == 0)
      refreshEstimator();

    const double ib = mConfig.instabilityEmaBeta;
    mInstabilityEma = (1.0 - ib) * mInstabilityEma + ib * update.score;

    return update;
  }

  double AdaptiveConformalCalibrator::getInstabilityExcess() const
  {
    return std::max(0.0, mInstabilityEma - mConfig.aciThreshold);
  }

  CalibrationState AdaptiveConformalCalibrator::getState() const
  {
    return CalibrationState{mCurrentAlpha,
			    mAlphaTarget,
			    mCoverageEma,
			    mMissStreak,
			    mEstimator->getState(),
			    mInflation,
			    mCooldown,
			    std::vector<double>(mScoreWindow.begin(), mScoreWindow.end()),
			    std::vector<double>(mRecentScores.begin(), mRecentScores.end()),
			    mInstabilityEma,
			    mObservations};
  }

  void AdaptiveConformalCalibrator::restoreState(const CalibrationState& state)
  {
    auto inRange = [](double v, double lo, double hi) {
      return std::isfinite(v) && v >= lo && v <= hi;
    };

    if (!inRange(state.currentAlpha, mConfig.alphaMin, mConfig.alphaMax) ||
	!inRange(state.alphaTarget, mConfig.alphaMin, mConfig.alphaMax))
      throw std::invalid_argument("AdaptiveConformalCalibrator: restored alpha outside [alphaMin, alphaMax]");

    if (!inRange(state.coverageEma, 0.0, 1.0))
      throw std::invalid_argument("AdaptiveConformalCalibrator: restored coverage EMA outside [0, 1]");

    if (!inRange(state.inflationFactor, 1.0, mConfig.inflationCeiling))
      throw std::invalid_argument("AdaptiveConformalCalibrator: restored inflation outside [1, ceiling]");

    if (state.cooldownCounter > mConfig.cooldownCycles)
      throw std::invalid_argument("AdaptiveConformalCalibrator: restored cooldown exceeds configured cycles");

    if (state.scoreWindow.size() > mConfig.scoreWindowSize ||
	state.recentScores.size() > mConfig.recentScoreWindow)
      throw std::invalid_argument("AdaptiveConformalCalibrator: restored score buffers exceed capacity");

    if (!std::isfinite(state.instabilityEma) || state.instabilityEma < 0.0)
      throw std::invalid_argument("AdaptiveConformalCalibrator: restored instability EMA is invalid");

    const QuantileEstimatorState& qs = state.quantileEstimatorState;
    auto estimator = std::make_unique<QuantileEstimator>(qs.probability, qs.warmupSize, qs.safeDefault);
    estimator->restoreState(qs);

    mCurrentAlpha = state.currentAlpha;
    mAlphaTarget = state.alphaTarget;
    mCoverageEma = state.coverageEma;
    mMissStreak = state.missStreak;
    mInflation = state.inflationFactor;
    mCooldown = state.cooldownCounter;
    mInstabilityEma = state.instabilityEma;
    mObservations = state.nObservations;
    mEstimator = std::move(estimator);

    mScoreWindow.clear();
    mScoreWindow.insert(mScoreWindow.end(), state.scoreWindow.begin(), state.scoreWindow.end());
    mRecentScores.clear();
    mRecentScores.insert(mRecentScores.end(), state.recentScores.begin(), state.recentScores.end());
  }

  double AdaptiveConformalCalibrator::clipAlpha(double alpha) const
  {
    return std::min(mConfig.alphaMax, std::max(mConfig.alphaMin, alpha));
  }

  double AdaptiveConformalCalibrator::scoreQuantile(double level) const
  {
    if (mScoreWindow.size() < mConfig.minCalibrationSize)
      return detail::compute_normal_critical_value(level);

    return mEstimator->estimate(level);
  }

  void AdaptiveConformalCalibrator::updateTransitionInflation(double score)
  {
    // Threshold from the scores seen before this one
    if (mRecentScores.size() >= mConfig.minRecentScores && mCooldown == 0)
      {
	const double mean = std::accumulate(mRecentScores.begin(), mRecentScores.end(), 0.0) /
	  static_cast<double>(mRecentScores.size());
	const double threshold = mConfig.transitionScoreMultiple * mean;

	if (threshold > 0.0 && score > threshold)
	  {
	    const double excess = 0.5 * std::max(0.0, score / threshold - 1.0);
	    mInflation = std::min(mConfig.inflationCeiling, std::max(mInflation, 1.0 + excess));
	    mCooldown = mConfig.cooldownCycles;
	    return;
	  }
      }

    if (mCooldown > 0)
      {
	--mCooldown;
	if (mCooldown == 0)
	  mInflation = 1.0;
      }
  }

  void AdaptiveConformalCalibrator::refreshEstimator()
  {
    const double target = 1.0 - mAlphaTarget;
    if (std::fabs(mEstimator->getProbability() - target) <= mConfig.retargetTolerance)
      return;

    auto rebuilt = std::make_unique<QuantileEstimator>(target, mConfig.minCalibrationSize,
						       detail::compute_normal_critical_value(target));
    for (double score : mScoreWindow)
      rebuilt->observe(score);

    mEstimator = std::move(rebuilt);
  }
}
