#pragma once

#include <string>
#include <vector>
#include "GovernanceEngine.h"
#include "RiskLogger.h"

namespace riskgovernor {

/**
 * @brief A policy registered with the lifecycle manager at startup.
 *
 * A baseline is registered directly as LIVE. A candidate is registered as
 * CANDIDATE and, with startCanary set, moved to CANARY right away.
 */
struct PolicyEntry {
    std::string id;
    std::string version;
    bool baseline = false;
    bool startCanary = true;
};

struct LoggingSettings {
    mkc_riskgov::LogLevel level = mkc_riskgov::LogLevel::Info;
    std::string file;   // empty = console only
};

/**
 * @brief Complete configuration of the riskgovernor replay process.
 *
 * Read from a JSON document with the sections
 *
 *   engine, snapshots, lifecycle, stream_defaults, streams, policies, logging
 *
 * Every key is optional; a missing key keeps its default. Entries of
 * "streams" start from stream_defaults and override what they name, so a
 * stream entry usually carries only "id" and "profile".
 */
class RiskGovernorConfiguration {
public:
    RiskGovernorConfiguration();

    // Starting point for a new deployment: defaults with snapshots under ./snapshots
    static RiskGovernorConfiguration createDefault();

    /**
     * @throws mkc_riskgov::ConfigurationException if the file cannot be read,
     *         is not valid JSON, a value has the wrong type or the result is invalid
     */
    static RiskGovernorConfiguration loadFromFile(const std::string& filePath);

    // @throws mkc_riskgov::ConfigurationException (see loadFromFile)
    static RiskGovernorConfiguration loadFromString(const std::string& json);

    // @throws mkc_riskgov::ConfigurationException if the file cannot be written
    void saveToFile(const std::string& filePath) const;

    // Pretty printed document holding every setting
    std::string toJson() const;

    // Engine, stream and policy checks combined
    std::vector<std::string> validationErrors() const;

    // @throws mkc_riskgov::ConfigurationException
    void validate() const;

    const mkc_riskgov::EngineConfiguration& getEngineConfiguration() const { return engine_; }
    mkc_riskgov::EngineConfiguration& getEngineConfiguration() { return engine_; }

    const std::vector<mkc_riskgov::StreamConfiguration>& getStreams() const { return streams_; }
    std::vector<mkc_riskgov::StreamConfiguration>& getStreams() { return streams_; }

    const std::vector<PolicyEntry>& getPolicies() const { return policies_; }
    std::vector<PolicyEntry>& getPolicies() { return policies_; }

    const LoggingSettings& getLogging() const { return logging_; }
    LoggingSettings& getLogging() { return logging_; }

private:
    mkc_riskgov::EngineConfiguration engine_;
    std::vector<mkc_riskgov::StreamConfiguration> streams_;
    std::vector<PolicyEntry> policies_;
    LoggingSettings logging_;
};

} // namespace riskgovernor
