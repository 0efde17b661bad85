// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RISKGOV_ADAPTIVE_CONFORMAL_CALIBRATOR_H
#define __RISKGOV_ADAPTIVE_CONFORMAL_CALIBRATOR_H 1

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <boost/circular_buffer.hpp>
#include "QuantileEstimator.h"

namespace mkc_riskgov
{
  struct CalibratorConfiguration
  {
    double alphaBase = 0.10;			// initial alpha_target
    double alphaMin = 0.02;
    double alphaMax = 0.30;
    double transitionAlphaLift = 0.02;		// a1
    double instabilityAlphaLift = 0.05;		// a2
    double etaBase = 0.002;
    double etaTransition = 0.01;
    double coverageEmaBeta = 0.005;
    std::size_t minCalibrationSize = 100;	// scores before the estimator replaces the normal reference
    double inflationCeiling = 1.25;
    std::size_t cooldownCycles = 25;
    double transitionScoreMultiple = 4.0;
    std::size_t recentScoreWindow = 30;
    std::size_t minRecentScores = 10;		// spike detection needs this many recent scores
    std::size_t scoreWindowSize = 1000;
    std::size_t refreshInterval = 40;
    double retargetTolerance = 0.005;
    double instabilityEmaBeta = 0.2;
    double aciThreshold = 1.25;

    std::vector<std::string> validationErrors() const;

    // @throws ConfigurationException
    void validate() const;
  };

  /**
   * @brief A calibrated interval together with what is needed to score it.
   */
  struct IntervalPrediction
  {
    double lower;
    double upper;
    double alphaUsed;
    double point;
    double sigmaEffective;	// scale the residual score is standardized by
    double quantile;		// q before inflation
    double inflation;
    bool isTransition;

    double width() const
    {
      return upper - lower;
    }
  };

  struct CalibrationState
  {
    double currentAlpha;
    double alphaTarget;
    double coverageEma;
    std::size_t missStreak;
    QuantileEstimatorState quantileEstimatorState;
    double inflationFactor;
    std::size_t cooldownCounter;
    std::vector<double> scoreWindow;	// oldest first
    std::vector<double> recentScores;	// oldest first
    double instabilityEma;
    std::uint64_t nObservations;
  };

  struct CalibrationUpdate
  {
    bool hit;
    double score;		// |y - point| / sigmaEffective
    double coverageError;	// hit - (1 - alpha_target) before the update
    bool spikeDetected;
  };

  /**
   * @brief Adaptive split conformal interval calibrator.
   *
   * Standardized residual scores |y - yhat| / sigma are tracked by a
   * QuantileEstimator. The interval for a forecast is
   *
   *   point +/- q * inflation * sigma
   *
   * where q is the score quantile at level 1 - alpha_target + (alpha -
   * alpha_target) and alpha = clip(alpha_target + a1 * is_transition +
   * a2 * aci, alpha_min, alpha_max). The lift only ever widens the interval.
   *
   * On each ground truth the signed controller
   *
   *   alpha_target += eta * (hit - (1 - alpha_target))
   *
   * raises alpha_target (narrower intervals) while forecasts are covered and
   * lowers it on misses, so realized coverage tracks 1 - alpha_target.
   *
   * A score far above the recent mean arms a bounded inflation that is held
   * for a cooldown and then released.
   *
   * Not thread-safe: one calibrator belongs to one decision stream.
   */
  class AdaptiveConformalCalibrator
  {
  public:
    // @throws ConfigurationException if the configuration is invalid
    explicit AdaptiveConformalCalibrator(const CalibratorConfiguration& config = CalibratorConfiguration());

    /**
     * @brief Calibrated interval for a forecast. Updates the current alpha.
     * @param aciEma instability excess, >= 0 (negative values count as 0)
     * @throws InvalidInputException if point is not finite or sigma is not finite and positive
     */
    IntervalPrediction predictInterval(double point, double sigma, bool isTransition, double aciEma);

    /**
     * @brief Score a resolved prediction and adapt.
     * @throws InvalidInputException if groundTruth or the prediction is not finite
     */
    CalibrationUpdate onObservation(double groundTruth, const IntervalPrediction& prediction);

    double getCurrentAlpha() const
    {
      return mCurrentAlpha;
    }

    double getAlphaTarget() const
    {
      return mAlphaTarget;
    }

    double getCoverageTarget() const
    {
      return 1.0 - mAlphaTarget;
    }

    double getCoverageEma() const
    {
      return mCoverageEma;
    }

    std::size_t getMissStreak() const
    {
      return mMissStreak;
    }

    double getInflationFactor() const
    {
      return mInflation;
    }

    std::size_t getCooldownCounter() const
    {
      return mCooldown;
    }

    // max(0, instability_ema - aci_threshold)
    double getInstabilityExcess() const;

    std::size_t getScoreCount() const
    {
      return mScoreWindow.size();
    }

    std::uint64_t getObservationCount() const
    {
      return mObservations;
    }

    const CalibratorConfiguration& getConfiguration() const
    {
      return mConfig;
    }

    CalibrationState getState() const;

    /**
     * @brief Replace the calibrator state; on failure the current state is kept.
     * @throws std::invalid_argument if the state violates the configured bounds
     */
    void restoreState(const CalibrationState& state);

  private:
    double clipAlpha(double alpha) const;
    double scoreQuantile(double level) const;
    void updateTransitionInflation(double score);
    void refreshEstimator();

  private:
    CalibratorConfiguration mConfig;
    double mCurrentAlpha;
    double mAlphaTarget;
    double mCoverageEma;
    std::size_t mMissStreak;
    double mInflation;
    std::size_t mCooldown;
    double mInstabilityEma;
    std::uint64_t mObservations;
    std::unique_ptr<QuantileEstimator> mEstimator;
    boost::circular_buffer<double> mScoreWindow;
    boost::circular_buffer<double> mRecentScores;
  };
}

#endif
