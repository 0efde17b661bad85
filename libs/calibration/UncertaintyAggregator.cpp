// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "UncertaintyAggregator.h"
#include <algorithm>
#include <cmath>
#include "RiskGovernanceException.h"

namespace mkc_riskgov
{
  namespace
  {
    double clip01(double x)
    {
      return std::min(1.0, std::max(0.0, x));
    }
  }

  std::vector<std::string> AggregatorConfiguration::validationErrors() const
  {
    std::vector<std::string> errors;

    if (stateWeight < 0.0 || modelWeight < 0.0 || forecastWeight < 0.0)
      errors.push_back("kappa weights must be >= 0");
    else if (!(stateWeight + modelWeight + forecastWeight > 0.0))
      errors.push_back("kappa weights must not all be zero");

    if (!(deficitScale > 0.0))
      errors.push_back("deficitScale must be positive");

    if (!(missingModelUncertainty >= 0.0 && missingModelUncertainty <= 1.0))
      errors.push_back("missingModelUncertainty must be in [0, 1]");

    if (!(sigmaMin > 0.0))
      errors.push_back("sigmaMin must be positive");

    if (cRef < 0.0 || betaRef < 0.0)
      errors.push_back("cRef and betaRef must be >= 0");

    if (!(inflationCeiling > 1.0))
      errors.push_back("inflationCeiling must be > 1");

    if (!(gamma >= 0.0 && gamma <= 1.0))
      errors.push_back("gamma must be in [0, 1]");

    return errors;
  }

  void AggregatorConfiguration::validate() const
  {
    throwOnConfigurationErrors("UncertaintyAggregator", validationErrors());
  }

  UncertaintyAggregator::UncertaintyAggregator(const AggregatorConfiguration& config)
    : mConfig(config)
  {
    mConfig.validate();
  }

  UncertaintyScore UncertaintyAggregator::aggregate(const CalibrationSignal& calibration,
						    const std::vector<double>& modelConfidence,
						    double intervalWidth,
						    double point,
						    double bccEstimate) const
  {
    UncertaintyScore score;
    score.stateU = stateUncertainty(calibration);
    score.modelU = modelUncertainty(modelConfidence);
    score.forecastU = forecastUncertainty(intervalWidth, point);
    score.bccEstimate = std::isfinite(bccEstimate) ? clip01(bccEstimate) : 1.0;

    score.kappa = clip01(mConfig.stateWeight * score.stateU +
			 mConfig.modelWeight * score.modelU +
			 mConfig.forecastWeight * score.forecastU);
    score.kappaPlus = clip01(mConfig.gamma * score.kappa +
			     (1.0 - mConfig.gamma) * (1.0 - score.bccEstimate));

    return score;
  }

  double UncertaintyAggregator::stateUncertainty(const CalibrationSignal& calibration) const
  {
    const double deficit = std::max(0.0, (1.0 - calibration.alphaTarget) - calibration.coverageEma);
    const double coverageTerm = std::isfinite(deficit) ? clip01(deficit / mConfig.deficitScale) : 1.0;
    const double inflationTerm = clip01((calibration.inflationFactor - 1.0) /
					(mConfig.inflationCeiling - 1.0));

    return std::max(coverageTerm, inflationTerm);
  }

  double UncertaintyAggregator::modelUncertainty(const std::vector<double>& modelConfidence) const
  {
    double total = 0.0;
    for (double p : modelConfidence)
      {
	if (!std::isfinite(p) || p < 0.0)
	  throw InvalidInputException("UncertaintyAggregator: model confidence entries must be finite and >= 0");

	total += p;
      }

    if (modelConfidence.empty() || !(total > 0.0))
      return mConfig.missingModelUncertainty;

    if (modelConfidence.size() == 1)
      return 0.0;

    double entropy = 0.0;
    for (double p : modelConfidence)
      {
	const double q = p / total;
	if (q > 0.0)
	  entropy -= q * std::log(q);
      }

    return clip01(entropy / std::log(static_cast<double>(modelConfidence.size())));
  }

  double UncertaintyAggregator::forecastUncertainty(double intervalWidth, double point) const
  {
    if (!std::isfinite(intervalWidth) || !std::isfinite(point))
      throw InvalidInputException("UncertaintyAggregator: interval width and point must be finite");

    const double reference = std::max(mConfig.sigmaMin,
				      mConfig.cRef * std::max(std::fabs(point), 1.0) + mConfig.betaRef);

    return std::min(1.0, std::max(0.0, intervalWidth) / reference);
  }

  double UncertaintyAggregator::relativeWidth(double intervalWidth, double point) const
  {
    return intervalWidth / std::max(mConfig.sigmaMin, std::fabs(point));
  }
}
