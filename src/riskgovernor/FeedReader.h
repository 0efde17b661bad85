#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "DecisionStream.h"

namespace riskgovernor {

class FeedReaderException : public std::runtime_error {
public:
    explicit FeedReaderException(const std::string& msg)
        : std::runtime_error(msg) {}
};

struct ForecastRecord {
    std::string streamId;
    mkc_riskgov::ForecastEvent event;
};

struct GroundTruthRecord {
    std::string streamId;
    mkc_riskgov::GroundTruthEvent event;
};

struct PolicyMetricRecord {
    std::string policyId;
    boost::posix_time::ptime timestamp;
    double value;
};

/**
 * @brief Reads the replay feeds of the riskgovernor CLI.
 *
 * All feeds are CSV files with a header row; columns are matched by name so
 * their order is free and extra columns are ignored.
 *
 * Forecasts:     timestamp, stream, point, sigma_hat
 *                optional: regime_transition (0/1/true/false),
 *                model_confidence (";" separated weights), latency_ms,
 *                base_notional
 * Ground truth:  timestamp, stream, observed
 * Policy feed:   timestamp, policy_id, value
 *
 * Timestamps are UTC, "2024-03-01T09:30:00" or "2024-03-01 09:30:00", with
 * optional fractional seconds. An empty optional field keeps its default.
 *
 * Rows are returned in file order; values are not range checked here, the
 * decision stream rejects what it cannot use.
 */
class FeedReader {
public:
    // @throws FeedReaderException naming the file and line of the first bad row
    static std::vector<ForecastRecord> readForecasts(const std::string& filePath);

    static std::vector<GroundTruthRecord> readGroundTruth(const std::string& filePath);

    static std::vector<PolicyMetricRecord> readPolicyFeed(const std::string& filePath);

    // @throws FeedReaderException
    static boost::posix_time::ptime parseTimestamp(const std::string& text);
};

} // namespace riskgovernor
