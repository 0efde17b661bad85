// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RISKGOV_EXCEPTION_H
#define __RISKGOV_EXCEPTION_H 1

#include <stdexcept>
#include <string>
#include <vector>

namespace mkc_riskgov
{
  // Base class for every domain failure raised by the risk governance libraries
  class RiskGovernanceException : public std::runtime_error
  {
  public:
    RiskGovernanceException(const std::string msg)
      : std::runtime_error(msg)
    {}

    virtual ~RiskGovernanceException() = default;
  };

  // Malformed observation rejected at the boundary (non-positive sigma,
  // non-finite values, out-of-order timestamps). State is left unchanged.
  class InvalidInputException : public RiskGovernanceException
  {
  public:
    explicit InvalidInputException(const std::string& msg)
      : RiskGovernanceException(msg) {}
  };

  // Alpha spend attempted without budget
  class BudgetExceededException : public RiskGovernanceException
  {
  public:
    explicit BudgetExceededException(const std::string& msg)
      : RiskGovernanceException(msg) {}
  };

  class PersistenceException : public RiskGovernanceException
  {
  public:
    explicit PersistenceException(const std::string& msg)
      : RiskGovernanceException(msg) {}
  };

  // Raised at startup. The process must not serve decisions after this.
  class ConfigurationException : public RiskGovernanceException
  {
  public:
    explicit ConfigurationException(const std::string& msg)
      : RiskGovernanceException(msg) {}
  };

  /**
   * @brief Throws a ConfigurationException listing every violation found by a
   * configuration validate() pass. Does nothing when the list is empty.
   */
  inline void throwOnConfigurationErrors(const std::string& component,
					 const std::vector<std::string>& errors)
  {
    if (errors.empty())
      return;

    std::string msg(component + " configuration invalid:");
    for (const auto& e : errors)
      msg += " [" + e + "]";

    throw ConfigurationException(msg);
  }

} // namespace mkc_riskgov

#endif // __RISKGOV_EXCEPTION_H
