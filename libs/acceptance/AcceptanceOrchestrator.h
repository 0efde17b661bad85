// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RISKGOV_ACCEPTANCE_ORCHESTRATOR_H
#define __RISKGOV_ACCEPTANCE_ORCHESTRATOR_H 1

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "GuardKind.h"
#include "IMetricsSink.h"
#include "RiskLogger.h"

namespace mkc_riskgov
{
  enum class Posture
  {
    Pass,
    Derisk,
    Block
  };

  const char* toString(Posture posture);

  // @throws std::invalid_argument for an unknown name
  Posture postureFromString(const std::string& name);

  // "pass_to_derisk", "block_to_pass", ...
  std::string transitionName(Posture from, Posture to);

  struct AcceptanceConfiguration
  {
    AcceptanceConfiguration();

    std::string profile;
    std::map<GuardKind, GuardThreshold> thresholds;	// one entry per GuardKind
    std::size_t dwellMinDerisk = 3;			// consecutive soft breach cycles before DERISK
    std::size_t dwellMinRecovery = 10;			// clean cycles before DERISK -> PASS
    std::size_t blockCooldownCycles = 5;		// minimum cycles held in BLOCK
    std::size_t blockRecoveryWindow = 30;		// clean cycles before BLOCK -> PASS
    bool allowDirectBlockRecovery = true;
    double kappaPlusConfidenceFloor = 0.2;		// DERISK when 1 - kappa_plus drops below

    const GuardThreshold& threshold(GuardKind kind) const;

    std::vector<std::string> validationErrors() const;

    // @throws ConfigurationException
    void validate() const;
  };

  /**
   * @brief Durable state of the posture state machine.
   */
  struct AcceptanceState
  {
    Posture posture = Posture::Pass;
    std::size_t dwellCounter = 0;		// cycles held since the last transition
    boost::posix_time::ptime lastTransition;	// not_a_date_time before the first transition
    std::size_t softBreachStreak = 0;
    std::size_t cleanStreak = 0;
    std::map<GuardKind, std::uint64_t> violationsByGuard;
    std::map<GuardKind, std::uint64_t> hardViolationsByGuard;
    std::map<std::string, std::uint64_t> transitionCounts;
    std::map<Posture, std::uint64_t> decisionsByPosture;
    std::uint64_t cycles = 0;
    std::uint64_t pendingCycles = 0;		// cycles in which some transition condition held

    std::uint64_t getTransitionTotal() const;
  };

  /**
   * @brief Immutable outcome of one acceptance cycle, handed to the execution
   * gate and the telemetry path.
   */
  struct AcceptanceDecision
  {
    Posture posture;
    Posture previousPosture;
    bool transitioned;
    std::vector<GuardEvaluation> guards;	// in GuardKind order
    std::optional<GuardKind> firstHardBreach;
    std::uint64_t cycle;
    boost::posix_time::ptime timestamp;
  };

  /**
   * @brief A computed but not yet applied cycle. Produced by evaluate(),
   * applied by commit(); dropping it discards the cycle.
   */
  struct AcceptanceStep
  {
    std::uint64_t baseCycle;	// state.cycles the step was computed from
    AcceptanceState nextState;
    AcceptanceDecision decision;
  };

  /**
   * @brief Hysteretic PASS / DERISK / BLOCK state machine over the acceptance
   * guards.
   *
   *   PASS   -> DERISK  soft breach for dwellMinDerisk cycles, a hard breach,
   *                     or kappa_plus confidence below the floor
   *   DERISK -> BLOCK   any hard breach
   *   DERISK -> PASS    dwellMinRecovery clean cycles
   *   BLOCK  -> PASS    cooldown elapsed and blockRecoveryWindow clean cycles,
   *                     only while direct recovery is allowed
   *   BLOCK  -> DERISK  cooldown elapsed and nothing above a hard threshold
   *
   * A clean cycle has no soft breach and kappa_plus confidence above the
   * floor. BLOCK -> PASS is checked first; otherwise the first cycle after
   * the cooldown with no hard breach moves to DERISK, clean or not. Direct
   * recovery therefore needs the clean streak to reach the window before the
   * cooldown ends.
   *
   * Every transition resets the dwell, soft and clean streaks, so a hard
   * breach in PASS reaches BLOCK on the next cycle at the latest.
   *
   * Not thread-safe: one orchestrator belongs to one decision stream.
   */
  class AcceptanceOrchestrator
  {
  public:
    // @throws ConfigurationException if the configuration is invalid
    explicit AcceptanceOrchestrator(const AcceptanceConfiguration& config = AcceptanceConfiguration(),
				    std::shared_ptr<IMetricsSink> metrics = nullptr,
				    std::shared_ptr<RiskLogger> logger = nullptr);

    /**
     * @brief Compute the next cycle without changing any state.
     */
    AcceptanceStep evaluate(const GuardMetrics& metrics,
			    const boost::posix_time::ptime& timestamp) const;

    /**
     * @brief Apply a step computed by evaluate() and emit its telemetry.
     * @throws std::invalid_argument if the step was computed from another state
     */
    AcceptanceDecision commit(const AcceptanceStep& step);

    // evaluate() followed by commit()
    AcceptanceDecision step(const GuardMetrics& metrics, const boost::posix_time::ptime& timestamp);

    Posture getPosture() const
    {
      return mState.posture;
    }

    const AcceptanceState& getState() const
    {
      return mState;
    }

    // Transitions per 1000 cycles
    double getChurnPer1k() const;

    // Fraction of cycles with a pending transition condition that transitioned
    double getDwellEfficiency() const;

    /**
     * @brief Replace the state machine state without replaying history.
     * @throws std::invalid_argument if the state is inconsistent
     */
    void restoreState(const AcceptanceState& state);

    const AcceptanceConfiguration& getConfiguration() const
    {
      return mConfig;
    }

  private:
    Posture nextPosture(const AcceptanceState& next,
			bool anyHard,
			bool kappaPlusLow,
			bool clean,
			bool& pending) const;
    void emitTelemetry(const AcceptanceDecision& decision);

  private:
    AcceptanceConfiguration mConfig;
    std::shared_ptr<IMetricsSink> mMetrics;
    std::shared_ptr<RiskLogger> mLogger;
    AcceptanceState mState;
  };
}

#endif
