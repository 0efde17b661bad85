// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RISKGOV_UNCERTAINTY_AGGREGATOR_H
#define __RISKGOV_UNCERTAINTY_AGGREGATOR_H 1

#include <string>
#include <vector>

namespace mkc_riskgov
{
  struct AggregatorConfiguration
  {
    double stateWeight = 0.4;
    double modelWeight = 0.3;
    double forecastWeight = 0.3;
    double deficitScale = 0.10;			// coverage deficit mapped to state_u = 1
    double missingModelUncertainty = 0.5;	// model_u when no usable distribution is given
    double sigmaMin = 1e-6;
    double cRef = 0.01;				// reference width per unit of |point|
    double betaRef = 0.0;
    double inflationCeiling = 1.25;
    double gamma = 0.7;				// kappa weight in kappa_plus

    std::vector<std::string> validationErrors() const;

    // @throws ConfigurationException
    void validate() const;
  };

  /**
   * @brief Risk scores of one cycle, all in [0, 1]. Higher means riskier.
   */
  struct UncertaintyScore
  {
    double kappa;
    double kappaPlus;
    double stateU;
    double modelU;
    double forecastU;
    double bccEstimate;
  };

  /**
   * @brief Calibration health the aggregator reads from the calibrator.
   */
  struct CalibrationSignal
  {
    double alphaTarget;
    double coverageEma;
    double inflationFactor;
  };

  /**
   * @brief Folds calibration state, model disagreement and interval width
   * into kappa, and blends kappa with coverage compliance into kappa_plus.
   *
   *   kappa      = clip(w_s * state_u + w_m * model_u + w_f * forecast_u, 0, 1)
   *   kappa_plus = gamma * kappa + (1 - gamma) * (1 - bcc)
   *
   * Stateless; safe to share between streams.
   */
  class UncertaintyAggregator
  {
  public:
    // @throws ConfigurationException if the configuration is invalid
    explicit UncertaintyAggregator(const AggregatorConfiguration& config = AggregatorConfiguration());

    /**
     * @param modelConfidence Probability-like weights of the model's
     *        alternatives; they are normalized. May be empty.
     * @throws InvalidInputException if modelConfidence holds a negative or
     *         non-finite entry, or width or point is not finite
     */
    UncertaintyScore aggregate(const CalibrationSignal& calibration,
			       const std::vector<double>& modelConfidence,
			       double intervalWidth,
			       double point,
			       double bccEstimate) const;

    double stateUncertainty(const CalibrationSignal& calibration) const;

    // Normalized Shannon entropy in [0, 1]
    double modelUncertainty(const std::vector<double>& modelConfidence) const;

    double forecastUncertainty(double intervalWidth, double point) const;

    // Interval width relative to max(sigmaMin, |point|)
    double relativeWidth(double intervalWidth, double point) const;

    const AggregatorConfiguration& getConfiguration() const
    {
      return mConfig;
    }

  private:
    AggregatorConfiguration mConfig;
  };
}

#endif
