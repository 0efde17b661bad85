#include "ReplaySession.h"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <tuple>
#include "RiskGovernanceException.h"

using namespace mkc_riskgov;
using boost::posix_time::ptime;

namespace riskgovernor {

namespace {

const char* const kComponent = "Replay";

enum class FeedKind { Forecast = 0, GroundTruth = 1, PolicyMetric = 2 };

struct ReplayItem {
    ptime timestamp;
    FeedKind kind;
    std::size_t index;
};

} // namespace

ReplaySession::ReplaySession(GovernanceEngine& engine,
                             std::shared_ptr<RiskLogger> logger,
                             std::ostream* decisionsOut,
                             std::size_t maxInFlight)
    : engine_(engine),
      logger_(std::move(logger)),
      decisionsOut_(decisionsOut),
      maxInFlight_(std::max<std::size_t>(1, maxInFlight)),
      pendingForecasts_(),
      pendingGroundTruth_(),
      summary_() {}

void ReplaySession::registerPolicies(const std::vector<PolicyEntry>& policies, const ptime& timestamp) {
    PolicyLifecycleManager& lifecycle = engine_.getLifecycleManager();

    // Baseline first: a canary's hypotheses are taken from the LIVE record
    std::vector<PolicyEntry> ordered(policies);
    std::stable_partition(ordered.begin(), ordered.end(),
                          [](const PolicyEntry& p) { return p.baseline; });

    for (const auto& policy : ordered) {
        if (lifecycle.getRecord(policy.id)) {
            logTo(logger_, LogLevel::Debug, kComponent, "Policy " + policy.id + " already known");
            continue;
        }

        if (policy.baseline && lifecycle.getLiveRecord()) {
            logTo(logger_, LogLevel::Info, kComponent,
                  "Baseline " + policy.id + " skipped, " + lifecycle.getLiveRecord()->policyId + " is LIVE");
            continue;
        }

        if (policy.baseline) {
            lifecycle.registerBaseline(policy.id, policy.version, timestamp);
        } else {
            lifecycle.registerCandidate(policy.id, policy.version, timestamp);
            if (policy.startCanary) {
                lifecycle.startCanary(policy.id, timestamp);
            }
        }
        logTo(logger_, LogLevel::Info, kComponent,
              "Registered " + std::string(policy.baseline ? "baseline " : "candidate ") + policy.id);
    }
}

ReplaySummary ReplaySession::run(const std::vector<ForecastRecord>& forecasts,
                                 const std::vector<GroundTruthRecord>& groundTruth,
                                 const std::vector<PolicyMetricRecord>& policyFeed) {
    std::vector<ReplayItem> items;
    items.reserve(forecasts.size() + groundTruth.size() + policyFeed.size());

    for (std::size_t i = 0; i < forecasts.size(); ++i) {
        items.push_back({forecasts[i].event.timestamp, FeedKind::Forecast, i});
    }
    for (std::size_t i = 0; i < groundTruth.size(); ++i) {
        items.push_back({groundTruth[i].event.timestamp, FeedKind::GroundTruth, i});
    }
    for (std::size_t i = 0; i < policyFeed.size(); ++i) {
        items.push_back({policyFeed[i].timestamp, FeedKind::PolicyMetric, i});
    }

    std::stable_sort(items.begin(), items.end(), [](const ReplayItem& a, const ReplayItem& b) {
        return std::make_tuple(a.timestamp, static_cast<int>(a.kind)) <
               std::make_tuple(b.timestamp, static_cast<int>(b.kind));
    });

    if (decisionsOut_) {
        (*decisionsOut_) << decisionsHeader() << '\n';
    }

    for (const auto& item : items) {
        switch (item.kind) {
        case FeedKind::Forecast: {
            const ForecastRecord& record = forecasts[item.index];
            ++summary_.forecasts;
            try {
                pendingForecasts_.push_back({record.streamId, record.event.timestamp,
                                             engine_.submitForecast(record.streamId, record.event)});
            } catch (const RiskGovernanceException& e) {
                reject("forecast for stream '" + record.streamId + "'", e);
            }
            break;
        }
        case FeedKind::GroundTruth: {
            const GroundTruthRecord& record = groundTruth[item.index];
            ++summary_.groundTruths;
            try {
                pendingGroundTruth_.push_back({record.streamId, record.event.timestamp,
                                               engine_.submitGroundTruth(record.streamId, record.event)});
            } catch (const RiskGovernanceException& e) {
                reject("ground truth for stream '" + record.streamId + "'", e);
            }
            break;
        }
        case FeedKind::PolicyMetric: {
            const PolicyMetricRecord& record = policyFeed[item.index];
            ++summary_.policyMetrics;
            try {
                const auto decision = engine_.recordPolicyMetric(record.policyId, record.value, record.timestamp);
                if (decision && decision->decision != SequentialDecision::Continue) {
                    ++summary_.governanceDecisions;
                    logTo(logger_, LogLevel::Info, kComponent,
                          "Policy " + record.policyId + ": " + toString(decision->decision) +
                          " after " + std::to_string(decision->nSamples) + " samples");
                }
            } catch (const RiskGovernanceException& e) {
                reject("policy metric for " + record.policyId, e);
            }
            break;
        }
        }

        if (pendingForecasts_.size() + pendingGroundTruth_.size() > maxInFlight_) {
            collect(maxInFlight_ / 2);
        }
    }

    collect(0);

    if (decisionsOut_) {
        decisionsOut_->flush();
    }
    return summary_;
}

void ReplaySession::collect(std::size_t keep) {
    while (pendingForecasts_.size() + pendingGroundTruth_.size() > keep) {
        // Oldest first across both queues keeps the decisions file in feed order
        const bool takeForecast = pendingGroundTruth_.empty() ||
            (!pendingForecasts_.empty() &&
             pendingForecasts_.front().timestamp <= pendingGroundTruth_.front().timestamp);

        if (takeForecast) {
            collectForecast(pendingForecasts_.front());
            pendingForecasts_.pop_front();
        } else {
            collectGroundTruth(pendingGroundTruth_.front());
            pendingGroundTruth_.pop_front();
        }
    }
}

void ReplaySession::collectForecast(PendingForecast& pending) {
    try {
        const CycleDecision decision = pending.result.get();
        ++summary_.decisionsByPosture[decision.posture];
        if (decision.stale) {
            ++summary_.staleDecisions;
        }
        if (decisionsOut_) {
            (*decisionsOut_) << formatDecision(pending.streamId, decision) << '\n';
        }
    } catch (const RiskGovernanceException& e) {
        reject("forecast " + pending.streamId + "@" +
               boost::posix_time::to_iso_extended_string(pending.timestamp), e);
    }
}

void ReplaySession::collectGroundTruth(PendingGroundTruth& pending) {
    try {
        pending.result.get();
    } catch (const RiskGovernanceException& e) {
        reject("ground truth " + pending.streamId + "@" +
               boost::posix_time::to_iso_extended_string(pending.timestamp), e);
    }
}

void ReplaySession::reject(const std::string& what, const std::exception& e) {
    ++summary_.rejected;
    logTo(logger_, LogLevel::Warning, kComponent, "Rejected " + what + ": " + e.what());
}

const char* ReplaySession::decisionsHeader() {
    return "timestamp,stream,posture,risk_scale,recommended_notional,block_reason,"
           "kappa,kappa_plus,alpha,coverage_ema,stale,lower,upper";
}

std::string ReplaySession::formatDecision(const std::string& streamId, const CycleDecision& decision) {
    std::ostringstream row;
    row << std::setprecision(10)
        << boost::posix_time::to_iso_extended_string(decision.timestamp) << ','
        << streamId << ','
        << toString(decision.posture) << ','
        << decision.riskScale << ','
        << decision.recommendedNotional << ','
        << decision.blockReason.value_or("") << ','
        << decision.kappa << ','
        << decision.kappaPlus << ','
        << decision.alphaCurrent << ','
        << decision.coverageEma << ','
        << (decision.stale ? 1 : 0) << ','
        << decision.interval.lower << ','
        << decision.interval.upper;
    return row.str();
}

} // namespace riskgovernor
