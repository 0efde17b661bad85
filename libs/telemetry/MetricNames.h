// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RISKGOV_METRIC_NAMES_H
#define __RISKGOV_METRIC_NAMES_H 1

namespace mkc_riskgov
{
  namespace metric_names
  {
    // Acceptance
    constexpr const char* kDecisionTotal = "riskgov_acceptance_decision_total";
    constexpr const char* kViolationTotal = "riskgov_acceptance_violation_total";
    constexpr const char* kHardViolationTotal = "riskgov_acceptance_hard_violation_total";
    constexpr const char* kStateTransitionsTotal = "riskgov_acceptance_state_transitions_total";
    constexpr const char* kDecisionChurnPer1k = "riskgov_decision_churn_per_1k";
    constexpr const char* kDwellEfficiency = "riskgov_dwell_efficiency";
    constexpr const char* kStaleDecisionTotal = "riskgov_stale_decision_total";

    // Calibration and uncertainty
    constexpr const char* kIcpAlpha = "riskgov_icp_alpha";
    constexpr const char* kIcpAlphaTarget = "riskgov_icp_alpha_target";
    constexpr const char* kIcpCoverageEma = "riskgov_icp_coverage_ema";
    constexpr const char* kKappa = "riskgov_kappa";
    constexpr const char* kKappaPlus = "riskgov_kappa_plus";

    // Execution
    constexpr const char* kExecutionRiskScale = "riskgov_execution_risk_scale";
    constexpr const char* kExecutionBlockTotal = "riskgov_execution_block_total";

    // Distributions
    constexpr const char* kLatencyMs = "riskgov_latency_ms";
    constexpr const char* kSurprisal = "riskgov_surprisal";
    constexpr const char* kRelativeIntervalWidth = "riskgov_relative_interval_width";

    // Governance
    constexpr const char* kGovernanceDecisionTotal = "riskgov_governance_decision_total";
    constexpr const char* kAlphaSpentTotal = "riskgov_alpha_spent_total";
    constexpr const char* kAlphaSpendDeniedTotal = "riskgov_alpha_spend_denied_total";
    constexpr const char* kLifecycleTransitionsTotal = "riskgov_lifecycle_transitions_total";

    // Persistence
    constexpr const char* kPersistenceFailureTotal = "riskgov_persistence_failure_total";
    constexpr const char* kSnapshotWriteTotal = "riskgov_snapshot_write_total";
    constexpr const char* kGovernanceSnapshotTotal = "riskgov_governance_snapshot_total";
  }
}

#endif
