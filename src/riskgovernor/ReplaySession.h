#pragma once

#include <cstddef>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include "FeedReader.h"
#include "GovernanceEngine.h"
#include "RiskGovernorConfiguration.h"
#include "RiskLogger.h"

namespace riskgovernor {

struct ReplaySummary {
    std::size_t forecasts = 0;
    std::size_t groundTruths = 0;
    std::size_t policyMetrics = 0;
    std::size_t rejected = 0;       // events the engine refused (bad input, unknown policy)
    std::size_t staleDecisions = 0;
    std::size_t governanceDecisions = 0;
    std::map<mkc_riskgov::Posture, std::size_t> decisionsByPosture;
};

/**
 * @brief Replays recorded feeds through a GovernanceEngine.
 *
 * The three feeds are merged by timestamp. At equal timestamps forecasts go
 * first, then ground truth, then policy metrics, so a ground truth row
 * resolves the forecast made at the same instant.
 *
 * Stream events are submitted without waiting; results are collected in
 * submission order once more than maxInFlight are outstanding and at the
 * end. A rejected event is logged and counted, the replay continues.
 *
 * With a decisions stream every cycle decision is written as one CSV row.
 */
class ReplaySession {
public:
    static constexpr std::size_t kDefaultMaxInFlight = 1024;

    ReplaySession(mkc_riskgov::GovernanceEngine& engine,
                  std::shared_ptr<mkc_riskgov::RiskLogger> logger,
                  std::ostream* decisionsOut = nullptr,
                  std::size_t maxInFlight = kDefaultMaxInFlight);

    /**
     * @brief Register configured policies not already known to the lifecycle
     * manager (restored policies are left alone).
     */
    void registerPolicies(const std::vector<PolicyEntry>& policies,
                          const boost::posix_time::ptime& timestamp);

    ReplaySummary run(const std::vector<ForecastRecord>& forecasts,
                      const std::vector<GroundTruthRecord>& groundTruth,
                      const std::vector<PolicyMetricRecord>& policyFeed);

    static const char* decisionsHeader();
    static std::string formatDecision(const std::string& streamId,
                                      const mkc_riskgov::CycleDecision& decision);

private:
    struct PendingForecast {
        std::string streamId;
        boost::posix_time::ptime timestamp;
        std::future<mkc_riskgov::CycleDecision> result;
    };

    struct PendingGroundTruth {
        std::string streamId;
        boost::posix_time::ptime timestamp;
        std::future<mkc_riskgov::GroundTruthResult> result;
    };

    void collect(std::size_t keep);
    void collectForecast(PendingForecast& pending);
    void collectGroundTruth(PendingGroundTruth& pending);
    void reject(const std::string& what, const std::exception& e);

    mkc_riskgov::GovernanceEngine& engine_;
    std::shared_ptr<mkc_riskgov::RiskLogger> logger_;
    std::ostream* decisionsOut_;
    std::size_t maxInFlight_;
    std::deque<PendingForecast> pendingForecasts_;
    std::deque<PendingGroundTruth> pendingGroundTruth_;
    ReplaySummary summary_;
};

} // namespace riskgovernor
