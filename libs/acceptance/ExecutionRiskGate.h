// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RISKGOV_EXECUTION_RISK_GATE_H
#define __RISKGOV_EXECUTION_RISK_GATE_H 1

#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "AcceptanceOrchestrator.h"
#include "GuardKind.h"
#include "IMetricsSink.h"

namespace mkc_riskgov
{
  struct ExecutionGateConfiguration
  {
    ExecutionGateConfiguration();

    std::string profile;
    std::map<Posture, double> scaleMap;		// PASS 1.0, DERISK 0.5, BLOCK 0.0
    double minNotional = 0.0;
    double maxNotional = std::numeric_limits<double>::max();
    bool hardBlockOnGuard = true;

    std::vector<std::string> validationErrors() const;

    // @throws ConfigurationException
    void validate() const;
  };

  struct ExecutionDecision
  {
    double recommendedNotional;
    double riskScale;
    std::optional<std::string> blockReason;	// guard name, or "posture_block" when BLOCK scales to 0
  };

  /**
   * @brief Maps an acceptance posture to the size an order may take.
   *
   * The gate is stateless apart from its per-reason block counters and never
   * reads back from the orchestrator.
   */
  class ExecutionRiskGate
  {
  public:
    static constexpr const char* kPostureBlockReason = "posture_block";

    // @throws ConfigurationException if the configuration is invalid
    explicit ExecutionRiskGate(const ExecutionGateConfiguration& config = ExecutionGateConfiguration(),
			       std::shared_ptr<IMetricsSink> metrics = nullptr);

    /**
     * @param guards guard evaluations of the cycle in GuardKind order
     * @throws InvalidInputException if baseNotional is negative or not finite
     */
    ExecutionDecision decide(Posture posture,
			     const std::vector<GuardEvaluation>& guards,
			     double baseNotional);

    // decide() with the posture and guards of an acceptance decision
    ExecutionDecision decide(const AcceptanceDecision& decision, double baseNotional);

    std::uint64_t getBlockCount(const std::string& reason) const;

    const ExecutionGateConfiguration& getConfiguration() const
    {
      return mConfig;
    }

  private:
    ExecutionDecision blocked(const std::string& reason);

  private:
    ExecutionGateConfiguration mConfig;
    std::shared_ptr<IMetricsSink> mMetrics;
    std::map<std::string, std::uint64_t> mBlockCounts;
  };
}

#endif
