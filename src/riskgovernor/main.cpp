#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/program_options.hpp>
#include "FeedReader.h"
#include "GovernanceEngine.h"
#include "InMemoryMetricsSink.h"
#include "PrometheusTextFormatter.h"
#include "ReplaySession.h"
#include "RiskGovernanceException.h"
#include "RiskGovernorConfiguration.h"
#include "RiskLogger.h"

namespace po = boost::program_options;

using namespace mkc_riskgov;
using riskgovernor::FeedReader;
using riskgovernor::FeedReaderException;
using riskgovernor::ReplaySession;
using riskgovernor::ReplaySummary;
using riskgovernor::RiskGovernorConfiguration;

namespace {

const int kExitConfiguration = 1;
const int kExitInput = 2;

const char* const kComponent = "riskgovernor";

void printUsage(const po::options_description& desc) {
    std::cout << "riskgovernor - replay forecast feeds through the risk governance engine\n\n";
    std::cout << "Usage: riskgovernor --config <json> --forecasts <csv> [options]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nExit codes: 0 success, 1 configuration error, 2 unreadable feed or output\n";
    std::cout << "\nExamples:\n";
    std::cout << "  # Replay one day of forecasts and outcomes\n";
    std::cout << "  riskgovernor --config config/riskgovernor.json --forecasts es_forecasts.csv \\\n";
    std::cout << "               --ground-truth es_outcomes.csv --decisions-out decisions.csv\n\n";
    std::cout << "  # Write a configuration template\n";
    std::cout << "  riskgovernor --write-default-config riskgovernor.json\n";
}

// Earliest timestamp of any feed, used to stamp policy registration
boost::posix_time::ptime replayStart(const std::vector<riskgovernor::ForecastRecord>& forecasts,
                                     const std::vector<riskgovernor::GroundTruthRecord>& groundTruth,
                                     const std::vector<riskgovernor::PolicyMetricRecord>& policyFeed) {
    boost::posix_time::ptime start(boost::posix_time::not_a_date_time);
    auto consider = [&start](const boost::posix_time::ptime& t) {
        if (start.is_special() || t < start) {
            start = t;
        }
    };

    for (const auto& r : forecasts) consider(r.event.timestamp);
    for (const auto& r : groundTruth) consider(r.event.timestamp);
    for (const auto& r : policyFeed) consider(r.timestamp);

    return start.is_special() ? boost::posix_time::microsec_clock::universal_time() : start;
}

void printSummary(const ReplaySummary& summary, std::size_t failedSnapshots) {
    std::cout << "Replay complete\n";
    std::cout << "  forecasts:            " << summary.forecasts << "\n";
    std::cout << "  ground truth:         " << summary.groundTruths << "\n";
    std::cout << "  policy metrics:       " << summary.policyMetrics << "\n";
    std::cout << "  rejected events:      " << summary.rejected << "\n";
    std::cout << "  stale decisions:      " << summary.staleDecisions << "\n";
    std::cout << "  governance decisions: " << summary.governanceDecisions << "\n";
    for (const auto& entry : summary.decisionsByPosture) {
        std::cout << "  " << toString(entry.first) << ": " << entry.second << "\n";
    }
    if (failedSnapshots > 0) {
        std::cout << "  snapshots not written: " << failedSnapshots << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show help message")
        ("config,c", po::value<std::string>(), "Engine configuration (JSON)")
        ("forecasts,f", po::value<std::string>(), "Forecast feed (CSV)")
        ("ground-truth,g", po::value<std::string>(), "Ground truth feed (CSV)")
        ("policy-feed,p", po::value<std::string>(), "Policy performance feed (CSV)")
        ("snapshot-dir,s", po::value<std::string>(), "Snapshot directory, overrides engine.snapshot_directory")
        ("metrics-out,m", po::value<std::string>(), "Write metrics in Prometheus text format at exit")
        ("log-file,l", po::value<std::string>(), "Mirror log lines to this file, overrides logging.file")
        ("log-level", po::value<std::string>(), "debug, info, warning or error; overrides logging.level")
        ("decisions-out,o", po::value<std::string>(), "Write every cycle decision (CSV)")
        ("write-default-config", po::value<std::string>(), "Write a configuration template and exit");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage(desc);
        return kExitConfiguration;
    }

    if (vm.count("help")) {
        printUsage(desc);
        return 0;
    }

    if (vm.count("write-default-config")) {
        try {
            RiskGovernorConfiguration::createDefault().saveToFile(vm["write-default-config"].as<std::string>());
            std::cout << "Configuration template written to "
                      << vm["write-default-config"].as<std::string>() << std::endl;
            return 0;
        } catch (const ConfigurationException& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return kExitInput;
        }
    }

    if (!vm.count("config") || !vm.count("forecasts")) {
        std::cerr << "Error: --config and --forecasts are required\n\n";
        printUsage(desc);
        return kExitConfiguration;
    }

    RiskGovernorConfiguration config;
    try {
        config = RiskGovernorConfiguration::loadFromFile(vm["config"].as<std::string>());

        if (vm.count("snapshot-dir")) {
            config.getEngineConfiguration().snapshotDirectory = vm["snapshot-dir"].as<std::string>();
        }
        if (vm.count("log-file")) {
            config.getLogging().file = vm["log-file"].as<std::string>();
        }
        if (vm.count("log-level")) {
            try {
                config.getLogging().level = logLevelFromString(vm["log-level"].as<std::string>());
            } catch (const std::invalid_argument& e) {
                throw ConfigurationException(e.what());
            }
        }
        config.validate();
    } catch (const ConfigurationException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitConfiguration;
    }

    std::shared_ptr<RiskLogger> logger;
    try {
        if (config.getLogging().file.empty()) {
            logger = std::make_shared<RiskLogger>(std::cout, config.getLogging().level);
        } else {
            logger = std::make_shared<RiskLogger>(std::cout, config.getLogging().file, config.getLogging().level);
        }
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitConfiguration;
    }

    std::vector<riskgovernor::ForecastRecord> forecasts;
    std::vector<riskgovernor::GroundTruthRecord> groundTruth;
    std::vector<riskgovernor::PolicyMetricRecord> policyFeed;
    try {
        forecasts = FeedReader::readForecasts(vm["forecasts"].as<std::string>());
        if (vm.count("ground-truth")) {
            groundTruth = FeedReader::readGroundTruth(vm["ground-truth"].as<std::string>());
        }
        if (vm.count("policy-feed")) {
            policyFeed = FeedReader::readPolicyFeed(vm["policy-feed"].as<std::string>());
        }
    } catch (const FeedReaderException& e) {
        logger->error(kComponent, e.what());
        return kExitInput;
    }

    logger->info(kComponent, "Loaded " + std::to_string(forecasts.size()) + " forecasts, " +
                 std::to_string(groundTruth.size()) + " ground truth rows, " +
                 std::to_string(policyFeed.size()) + " policy metrics");

    std::ofstream decisionsFile;
    if (vm.count("decisions-out")) {
        decisionsFile.open(vm["decisions-out"].as<std::string>());
        if (!decisionsFile.is_open()) {
            logger->error(kComponent, "Cannot open " + vm["decisions-out"].as<std::string>());
            return kExitInput;
        }
    }

    auto metrics = std::make_shared<InMemoryMetricsSink>();
    ReplaySummary summary;
    std::size_t failedSnapshots = 0;

    try {
        GovernanceEngine engine(config.getEngineConfiguration(), metrics, logger);

        for (const auto& stream : config.getStreams()) {
            engine.addStream(stream);
        }

        ReplaySession session(engine, logger, decisionsFile.is_open() ? &decisionsFile : nullptr);
        session.registerPolicies(config.getPolicies(), replayStart(forecasts, groundTruth, policyFeed));
        summary = session.run(forecasts, groundTruth, policyFeed);

        failedSnapshots = engine.checkpoint();
        engine.shutdown();
    } catch (const ConfigurationException& e) {
        logger->error(kComponent, e.what());
        return kExitConfiguration;
    } catch (const RiskGovernanceException& e) {
        logger->error(kComponent, e.what());
        return kExitInput;
    }

    if (vm.count("metrics-out")) {
        const std::string path = vm["metrics-out"].as<std::string>();
        std::ofstream metricsFile(path);
        if (!metricsFile.is_open()) {
            logger->error(kComponent, "Cannot open " + path);
            return kExitInput;
        }
        metricsFile << PrometheusTextFormatter::render(*metrics);
        logger->info(kComponent, "Metrics written to " + path);
    }

    printSummary(summary, failedSnapshots);
    return 0;
}
