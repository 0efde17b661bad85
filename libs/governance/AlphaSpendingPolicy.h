// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RISKGOV_ALPHA_SPENDING_POLICY_H
#define __RISKGOV_ALPHA_SPENDING_POLICY_H 1

#include <cstddef>
#include <memory>
#include <string>

namespace mkc_riskgov
{
  /**
   * @brief Inputs a spending policy may use to size one test's allowance.
   */
  struct SpendingContext
  {
    double totalBudget;
    std::size_t expectedTests;	// m, > 0
    std::size_t testIndex;	// 1-based index of the test being started
    std::size_t elapsedSteps;	// sequential observations consumed before this test
  };

  /**
   * @brief Determines the per-test alpha allowance.
   *
   * A policy never touches the ledger. Whether the allowance may actually be
   * spent is decided by AlphaSpendingLedger::canSpend.
   */
  class AlphaSpendingPolicy
  {
  public:
    virtual ~AlphaSpendingPolicy() = default;

    /**
     * @throws std::invalid_argument if expectedTests == 0 or the budget is
     *         not positive
     */
    virtual double allowance(const SpendingContext& context) const = 0;

    virtual std::string getName() const = 0;
  };

  // budget / m
  class UniformSpendingPolicy : public AlphaSpendingPolicy
  {
  public:
    double allowance(const SpendingContext& context) const override;
    std::string getName() const override;
  };

  // (budget / m) * 2^(-elapsedSteps / halfLifeSteps)
  class AlphaDecreasingSpendingPolicy : public AlphaSpendingPolicy
  {
  public:
    explicit AlphaDecreasingSpendingPolicy(double halfLifeSteps);

    double allowance(const SpendingContext& context) const override;
    std::string getName() const override;

    double getHalfLifeSteps() const
    {
      return mHalfLifeSteps;
    }

  private:
    double mHalfLifeSteps;
  };

  // budget * 2i / (m (m + 1)), i clipped to m. Allowances over i = 1..m sum to the budget.
  class FdrLinearSpendingPolicy : public AlphaSpendingPolicy
  {
  public:
    double allowance(const SpendingContext& context) const override;
    std::string getName() const override;
  };

  /**
   * @brief Create a policy from its configuration name: "uniform",
   * "alpha_decreasing" or "fdr_linear".
   *
   * @throws ConfigurationException for an unknown name or a non-positive half life
   */
  std::shared_ptr<AlphaSpendingPolicy> createSpendingPolicy(const std::string& name,
							    double halfLifeSteps = 200.0);
}

#endif
