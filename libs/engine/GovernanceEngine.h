// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RISKGOV_GOVERNANCE_ENGINE_H
#define __RISKGOV_GOVERNANCE_ENGINE_H 1

#include <cstddef>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem.hpp>
#include <boost/thread/mutex.hpp>
#include "AlphaSpendingLedger.h"
#include "AlphaSpendingPolicy.h"
#include "DecisionStream.h"
#include "IMetricsSink.h"
#include "PolicyLifecycleManager.h"
#include "RiskLogger.h"
#include "SnapshotScheduler.h"
#include "StreamExecutor.h"

namespace mkc_riskgov
{
  struct EngineConfiguration
  {
    std::size_t workerThreads = 0;		// 0 = hardware concurrency
    double alphaBudget = 0.05;			// family-wise budget of the ledger
    std::string spendingPolicy = "alpha_decreasing";
    double spendingHalfLife = 200.0;
    LifecycleConfiguration lifecycle;
    StreamConfiguration streamDefaults;		// used for streams first seen in a feed
    std::string snapshotDirectory;		// empty disables persistence
    SnapshotSchedulerConfiguration snapshots;
    std::size_t snapshotEveryEvents = 10;	// per stream
    bool quarantineCorruptSnapshots = true;	// false makes a corrupt stream snapshot fatal

    std::vector<std::string> validationErrors() const;

    // @throws ConfigurationException
    void validate() const;
  };

  /**
   * @brief Process-wide owner of the decision streams and the governance
   * components.
   *
   * Stream events run on a StreamExecutor, so every stream keeps a single
   * writer while different streams proceed in parallel. The alpha ledger and
   * the policy lifecycle manager are shared by all callers.
   *
   * With a snapshot directory configured the engine restores the ledger and
   * the lifecycle manager on construction and each stream when it is created.
   * Every snapshotEveryEvents events a stream hands a serialized snapshot to
   * the SnapshotScheduler. Governance state is handed over after a
   * governance decision or a new ledger entry, and otherwise every
   * snapshotEveryEvents policy metrics.
   *
   * An unreadable stream snapshot is moved aside (<file>.corrupt-<epoch>)
   * and the stream starts fresh, unless quarantineCorruptSnapshots is off.
   * An unreadable ledger or lifecycle snapshot is always fatal: starting
   * either fresh would release alpha that has already been spent.
   */
  class GovernanceEngine
  {
  public:
    static constexpr const char* kLedgerFile = "alpha_ledger.json";
    static constexpr const char* kLifecycleFile = "policy_lifecycle.json";
    static constexpr const char* kStreamFileSuffix = ".stream.json";

    /**
     * @throws ConfigurationException if the configuration is invalid
     * @throws PersistenceException if the ledger or lifecycle snapshot is corrupt, or a
     *         stream snapshot is corrupt and quarantine is disabled
     */
    GovernanceEngine(const EngineConfiguration& config,
		     std::shared_ptr<IMetricsSink> metrics = nullptr,
		     std::shared_ptr<RiskLogger> logger = nullptr,
		     DecisionStream::SteadyClock clock = DecisionStream::SteadyClock());

    GovernanceEngine(const GovernanceEngine&) = delete;
    GovernanceEngine& operator=(const GovernanceEngine&) = delete;

    // shutdown()
    ~GovernanceEngine();

    /**
     * @brief Create a stream with an explicit configuration.
     * @throws InvalidInputException if the id is unusable or already taken
     * @throws ConfigurationException if the configuration is invalid
     */
    void addStream(const StreamConfiguration& config);

    bool hasStream(const std::string& streamId) const;
    std::vector<std::string> getStreamIds() const;

    /**
     * @brief Queue a forecast on its stream's worker. A stream not added
     * before is created from streamDefaults.
     *
     * Errors of the cycle (InvalidInputException, ...) arrive through the future.
     */
    std::future<CycleDecision> submitForecast(const std::string& streamId, const ForecastEvent& event);

    std::future<GroundTruthResult> submitGroundTruth(const std::string& streamId,
						     const GroundTruthEvent& event);

    // Runs on the stream's worker after every event already queued for it
    std::future<StreamSnapshot> requestSnapshot(const std::string& streamId);

    /**
     * @brief Feed the policy performance feed into the lifecycle manager.
     * @throws InvalidInputException from PolicyLifecycleManager::recordMetric
     */
    std::optional<GovernanceDecision> recordPolicyMetric(const std::string& policyId,
							 double value,
							 const boost::posix_time::ptime& timestamp);

    PolicyLifecycleManager& getLifecycleManager()
    {
      return *mLifecycle;
    }

    const AlphaSpendingLedger& getLedger() const
    {
      return *mLedger;
    }

    const EngineConfiguration& getConfiguration() const
    {
      return mConfig;
    }

    /**
     * @brief Snapshot every stream and the governance state and write them.
     * @return number of snapshots that could not be written; 0 without persistence
     */
    std::size_t checkpoint();

    // checkpoint() and stop the snapshot scheduler; further checkpoints are no-ops
    void shutdown();

  private:
    struct StreamSlot
    {
      std::unique_ptr<DecisionStream> stream;
      std::size_t eventsSinceSnapshot;
    };

    StreamSlot& slotFor(const std::string& streamId);
    StreamSlot& createSlotLocked(const StreamConfiguration& config);
    void afterStreamEvent(StreamSlot& slot);
    void submitStreamSnapshot(const DecisionStream& stream);
    void submitGovernanceSnapshot();
    void restoreGovernance();
    void restoreStream(DecisionStream& stream);
    bool persistenceEnabled() const
    {
      return static_cast<bool>(mScheduler);
    }

    // Reads a snapshot file and hands the content to restore(); on failure
    // quarantines the file or throws PersistenceException
    template <typename Restore>
    void restoreFile(const std::string& fileName, bool quarantine, Restore restore);

  private:
    EngineConfiguration mConfig;
    std::shared_ptr<IMetricsSink> mMetrics;
    std::shared_ptr<RiskLogger> mLogger;
    DecisionStream::SteadyClock mClock;
    std::shared_ptr<AlphaSpendingLedger> mLedger;
    std::shared_ptr<AlphaSpendingPolicy> mSpendingPolicy;
    std::unique_ptr<PolicyLifecycleManager> mLifecycle;
    boost::mutex mGovernanceSnapshotMutex;
    std::size_t mPolicyMetricsSinceSnapshot;	// guarded by mGovernanceSnapshotMutex
    std::size_t mLedgerEntriesAtSnapshot;	// guarded by mGovernanceSnapshotMutex
    std::unique_ptr<SnapshotScheduler> mScheduler;
    mutable boost::mutex mStreamsMutex;
    std::map<std::string, std::unique_ptr<StreamSlot>> mStreams;
    bool mShutdown;
    // Declared last: its workers are joined before the streams go away
    concurrency::StreamExecutor mExecutor;
  };
}

#endif
