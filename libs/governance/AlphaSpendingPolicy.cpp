// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "AlphaSpendingPolicy.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include "RiskGovernanceException.h"

namespace mkc_riskgov
{
  namespace
  {
    void validateContext(const SpendingContext& context, const char* policyName)
    {
      if (context.expectedTests == 0)
	throw std::invalid_argument(std::string(policyName) + ": expected test count must be > 0");

      if (!(context.totalBudget > 0.0) || !std::isfinite(context.totalBudget))
	throw std::invalid_argument(std::string(policyName) + ": total budget must be positive");
    }
  }

  double UniformSpendingPolicy::allowance(const SpendingContext& context) const
  {
    validateContext(context, "UniformSpendingPolicy");
    return context.totalBudget / static_cast<double>(context.expectedTests);
  }

  std::string UniformSpendingPolicy::getName() const
  {
    return "uniform";
  }

  AlphaDecreasingSpendingPolicy::AlphaDecreasingSpendingPolicy(double halfLifeSteps)
    : mHalfLifeSteps(halfLifeSteps)
  {
    if (!(halfLifeSteps > 0.0) || !std::isfinite(halfLifeSteps))
      throw std::invalid_argument("AlphaDecreasingSpendingPolicy: half life must be > 0");
  }

  double AlphaDecreasingSpendingPolicy::allowance(const SpendingContext& context) const
  {
    validateContext(context, "AlphaDecreasingSpendingPolicy");

    const double base = context.totalBudget / static_cast<double>(context.expectedTests);
    return base * std::exp2(-static_cast<double>(context.elapsedSteps) / mHalfLifeSteps);
  }

  std::string AlphaDecreasingSpendingPolicy::getName() const
  {
    return "alpha_decreasing";
  }

  double FdrLinearSpendingPolicy::allowance(const SpendingContext& context) const
  {
    validateContext(context, "FdrLinearSpendingPolicy");

    const double m = static_cast<double>(context.expectedTests);
    const double i = static_cast<double>(std::min(std::max<std::size_t>(context.testIndex, 1),
						  context.expectedTests));

    return context.totalBudget * 2.0 * i / (m * (m + 1.0));
  }

  std::string FdrLinearSpendingPolicy::getName() const
  {
    return "fdr_linear";
  }

  std::shared_ptr<AlphaSpendingPolicy> createSpendingPolicy(const std::string& name,
							    double halfLifeSteps)
  {
    if (name == "uniform")
      return std::make_shared<UniformSpendingPolicy>();

    if (name == "alpha_decreasing")
      {
	if (!(halfLifeSteps > 0.0) || !std::isfinite(halfLifeSteps))
	  throw ConfigurationException("alpha_decreasing spending policy requires a positive half life");

	return std::make_shared<AlphaDecreasingSpendingPolicy>(halfLifeSteps);
      }

    if (name == "fdr_linear")
      return std::make_shared<FdrLinearSpendingPolicy>();

    throw ConfigurationException("Unknown alpha spending policy: " + name);
  }
}
