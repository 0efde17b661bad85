// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "GovernanceEngine.h"
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>
#include "AtomicFileWriter.h"
#include "MetricNames.h"
#include "RiskGovernanceException.h"
#include "SnapshotCodec.h"

namespace mkc_riskgov
{
  namespace fs = boost::filesystem;

  namespace
  {
    const char* const kComponent = "GovernanceEngine";

    const EngineConfiguration& checked(const EngineConfiguration& config)
    {
      config.validate();
      return config;
    }

    // Stream ids become file names
    bool isUsableStreamId(const std::string& id)
    {
      if (id.empty() || id[0] == '.')
	return false;

      for (char c : id)
	if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.')
	  return false;

      return true;
    }
  }

  std::vector<std::string> EngineConfiguration::validationErrors() const
  {
    std::vector<std::string> errors;

    if (!(alphaBudget > 0.0 && alphaBudget < 1.0))
      errors.push_back("alphaBudget must be in (0, 1)");

    if (spendingPolicy != "uniform" && spendingPolicy != "alpha_decreasing" &&
	spendingPolicy != "fdr_linear")
      errors.push_back("spendingPolicy must be uniform, alpha_decreasing or fdr_linear");

    if (!std::isfinite(spendingHalfLife) || !(spendingHalfLife > 0.0))
      errors.push_back("spendingHalfLife must be positive");

    if (snapshotEveryEvents == 0)
      errors.push_back("snapshotEveryEvents must be >= 1");

    for (const auto& e : lifecycle.validationErrors())
      errors.push_back("lifecycle: " + e);

    // The id is filled in per stream
    StreamConfiguration defaults(streamDefaults);
    if (defaults.streamId.empty())
      defaults.streamId = "defaults";
    for (const auto& e : defaults.validationErrors())
      errors.push_back("streamDefaults: " + e);

    for (const auto& e : snapshots.validationErrors())
      errors.push_back("snapshots: " + e);

    return errors;
  }

  void EngineConfiguration::validate() const
  {
    throwOnConfigurationErrors("Engine", validationErrors());
  }

  GovernanceEngine::GovernanceEngine(const EngineConfiguration& config,
				     std::shared_ptr<IMetricsSink> metrics,
				     std::shared_ptr<RiskLogger> logger,
				     DecisionStream::SteadyClock clock)
    : mConfig(checked(config)),
      mMetrics(metrics ? std::move(metrics) : std::make_shared<NullMetricsSink>()),
      mLogger(std::move(logger)),
      mClock(std::move(clock)),
      mLedger(std::make_shared<AlphaSpendingLedger>(mConfig.alphaBudget, mMetrics, mLogger)),
      mSpendingPolicy(createSpendingPolicy(mConfig.spendingPolicy, mConfig.spendingHalfLife)),
      mLifecycle(std::make_unique<PolicyLifecycleManager>(mConfig.lifecycle, mLedger, mSpendingPolicy,
							  mMetrics, mLogger)),
      mGovernanceSnapshotMutex(),
      mPolicyMetricsSinceSnapshot(0),
      mLedgerEntriesAtSnapshot(0),
      mScheduler(),
      mStreamsMutex(),
      mStreams(),
      mShutdown(false),
      mExecutor(mConfig.workerThreads)
  {
    if (!mConfig.snapshotDirectory.empty())
      {
	mScheduler = std::make_unique<SnapshotScheduler>(fs::path(mConfig.snapshotDirectory),
							 mConfig.snapshots, mMetrics, mLogger);
	restoreGovernance();
	mLedgerEntriesAtSnapshot = mLedger->getEntryCount();
      }

    std::ostringstream msg;
    msg << "started with " << mExecutor.size() << " worker(s), alpha budget " << mConfig.alphaBudget
	<< " (" << mSpendingPolicy->getName() << "), persistence "
	<< (persistenceEnabled() ? mConfig.snapshotDirectory : std::string("off"));
    logTo(mLogger, LogLevel::Info, kComponent, msg.str());
  }

  GovernanceEngine::~GovernanceEngine()
  {
    try
      {
	shutdown();
      }
    catch (const std::exception& e)
      {
	logTo(mLogger, LogLevel::Error, kComponent, std::string("shutdown failed: ") + e.what());
      }
  }

  void GovernanceEngine::addStream(const StreamConfiguration& config)
  {
    boost::mutex::scoped_lock lock(mStreamsMutex);
    if (mStreams.count(config.streamId) > 0)
      throw InvalidInputException("GovernanceEngine: stream " + config.streamId + " already exists");

    createSlotLocked(config);
  }

  bool GovernanceEngine::hasStream(const std::string& streamId) const
  {
    boost::mutex::scoped_lock lock(mStreamsMutex);
    return mStreams.count(streamId) > 0;
  }

  std::vector<std::string> GovernanceEngine::getStreamIds() const
  {
    boost::mutex::scoped_lock lock(mStreamsMutex);

    std::vector<std::string> ids;
    for (const auto& s : mStreams)
      ids.push_back(s.first);

    return ids;
  }

  std::future<CycleDecision> GovernanceEngine::submitForecast(const std::string& streamId,
							      const ForecastEvent& event)
  {
    StreamSlot* slot = &slotFor(streamId);
    return mExecutor.submit(streamId, [this, slot, event]() {
      CycleDecision decision = slot->stream->onForecast(event);
      afterStreamEvent(*slot);
      return decision;
    });
  }

  std::future<GroundTruthResult> GovernanceEngine::submitGroundTruth(const std::string& streamId,
								     const GroundTruthEvent& event)
  {
    StreamSlot* slot = &slotFor(streamId);
    return mExecutor.submit(streamId, [this, slot, event]() {
      GroundTruthResult result = slot->stream->onGroundTruth(event);
      afterStreamEvent(*slot);
      return result;
    });
  }

  std::future<StreamSnapshot> GovernanceEngine::requestSnapshot(const std::string& streamId)
  {
    StreamSlot* slot = nullptr;
    {
      boost::mutex::scoped_lock lock(mStreamsMutex);
      auto it = mStreams.find(streamId);
      if (it == mStreams.end())
	throw InvalidInputException("GovernanceEngine: unknown stream " + streamId);
      slot = it->second.get();
    }

    return mExecutor.submit(streamId, [slot]() { return slot->stream->getSnapshot(); });
  }

  std::optional<GovernanceDecision> GovernanceEngine::recordPolicyMetric(const std::string& policyId,
									 double value,
									 const boost::posix_time::ptime& timestamp)
  {
    std::optional<GovernanceDecision> decision = mLifecycle->recordMetric(policyId, value, timestamp);

    if (!persistenceEnabled())
      return decision;

    // Decisions and new alpha spends are written at once, plain metrics in batches
    bool due = false;
    {
      boost::mutex::scoped_lock lock(mGovernanceSnapshotMutex);
      ++mPolicyMetricsSinceSnapshot;
      due = (decision && decision->decision != SequentialDecision::Continue) ||
	mLedger->getEntryCount() != mLedgerEntriesAtSnapshot ||
	mPolicyMetricsSinceSnapshot >= mConfig.snapshotEveryEvents;
    }

    if (due)
      submitGovernanceSnapshot();

    return decision;
  }

  std::size_t GovernanceEngine::checkpoint()
  {
    if (!persistenceEnabled())
      return 0;

    std::vector<std::future<void>> written;
    {
      boost::mutex::scoped_lock lock(mStreamsMutex);
      if (mShutdown)
	return 0;

      for (auto& s : mStreams)
	{
	  StreamSlot* slot = s.second.get();
	  written.push_back(mExecutor.submit(s.first, [this, slot]() {
	    submitStreamSnapshot(*slot->stream);
	    slot->eventsSinceSnapshot = 0;
	  }));
	}
    }

    for (auto& f : written)
      f.get();

    submitGovernanceSnapshot();
    return mScheduler->flush();
  }

  void GovernanceEngine::shutdown()
  {
    {
      boost::mutex::scoped_lock lock(mStreamsMutex);
      if (mShutdown)
	return;
    }

    const std::size_t unwritten = checkpoint();

    {
      boost::mutex::scoped_lock lock(mStreamsMutex);
      mShutdown = true;
    }

    if (mScheduler)
      mScheduler->stop();

    std::ostringstream msg;
    msg << "shut down, " << unwritten << " snapshot(s) unwritten";
    logTo(mLogger, unwritten > 0 ? LogLevel::Error : LogLevel::Info, kComponent, msg.str());
  }

  GovernanceEngine::StreamSlot& GovernanceEngine::slotFor(const std::string& streamId)
  {
    boost::mutex::scoped_lock lock(mStreamsMutex);

    auto it = mStreams.find(streamId);
    if (it != mStreams.end())
      return *it->second;

    StreamConfiguration config(mConfig.streamDefaults);
    config.streamId = streamId;
    return createSlotLocked(config);
  }

  GovernanceEngine::StreamSlot& GovernanceEngine::createSlotLocked(const StreamConfiguration& config)
  {
    if (!isUsableStreamId(config.streamId))
      throw InvalidInputException("GovernanceEngine: unusable stream id '" + config.streamId + "'");

    auto slot = std::make_unique<StreamSlot>();
    slot->stream = std::make_unique<DecisionStream>(config, mMetrics, mLogger, mClock);
    slot->eventsSinceSnapshot = 0;

    if (persistenceEnabled())
      restoreStream(*slot->stream);

    StreamSlot& created = *slot;
    mStreams.emplace(config.streamId, std::move(slot));

    logTo(mLogger, LogLevel::Debug, kComponent,
	  "stream " + config.streamId + " created with profile " + config.profile);
    return created;
  }

  void GovernanceEngine::afterStreamEvent(StreamSlot& slot)
  {
    if (!persistenceEnabled())
      return;

    if (++slot.eventsSinceSnapshot >= mConfig.snapshotEveryEvents)
      {
	submitStreamSnapshot(*slot.stream);
	slot.eventsSinceSnapshot = 0;
      }
  }

  void GovernanceEngine::submitStreamSnapshot(const DecisionStream& stream)
  {
    mScheduler->submit(stream.getStreamId() + kStreamFileSuffix,
		       SnapshotCodec::encodeStream(stream.getSnapshot()));
  }

  void GovernanceEngine::submitGovernanceSnapshot()
  {
    if (!persistenceEnabled())
      return;

    boost::mutex::scoped_lock lock(mGovernanceSnapshotMutex);

    // Lifecycle first: a ledger read afterwards holds every spend the lifecycle refers to
    const LifecycleSnapshot lifecycle = mLifecycle->getSnapshot();
    const LedgerSnapshot ledger{mLedger->getTotalBudget(), mLedger->getEntries()};

    mScheduler->submit(kLifecycleFile, SnapshotCodec::encodeLifecycle(lifecycle));
    mScheduler->submit(kLedgerFile, SnapshotCodec::encodeLedger(ledger));

    mPolicyMetricsSinceSnapshot = 0;
    mLedgerEntriesAtSnapshot = ledger.entries.size();
    mMetrics->incrementCounter(metric_names::kGovernanceSnapshotTotal, {});
  }

  void GovernanceEngine::restoreGovernance()
  {
    // A lost ledger would hand the spent alpha budget out again: no quarantine
    restoreFile(kLedgerFile, false, [this](const std::string& json) {
      const LedgerSnapshot snapshot = SnapshotCodec::decodeLedger(json);
      if (snapshot.totalBudget != mLedger->getTotalBudget())
	{
	  std::ostringstream msg;
	  msg << "ledger snapshot was written with budget " << snapshot.totalBudget
	      << ", continuing with " << mLedger->getTotalBudget();
	  logTo(mLogger, LogLevel::Warning, kComponent, msg.str());
	}

      mLedger->restoreEntries(snapshot.entries);

      std::ostringstream msg;
      msg << "restored " << snapshot.entries.size() << " ledger entries, cumulative alpha "
	  << mLedger->getCumulativeAlpha();
      logTo(mLogger, LogLevel::Info, kComponent, msg.str());
    });

    restoreFile(kLifecycleFile, false, [this](const std::string& json) {
      const LifecycleSnapshot snapshot = SnapshotCodec::decodeLifecycle(json);
      mLifecycle->restoreSnapshot(snapshot);

      std::ostringstream msg;
      msg << "restored " << snapshot.records.size() << " policy records and "
	  << snapshot.activeTests.size() << " active stage test(s)";
      logTo(mLogger, LogLevel::Info, kComponent, msg.str());
    });
  }

  void GovernanceEngine::restoreStream(DecisionStream& stream)
  {
    restoreFile(stream.getStreamId() + kStreamFileSuffix, mConfig.quarantineCorruptSnapshots,
		[&stream](const std::string& json) {
      stream.restoreSnapshot(SnapshotCodec::decodeStream(json));
    });
  }

  template <typename Restore>
  void GovernanceEngine::restoreFile(const std::string& fileName, bool quarantine, Restore restore)
  {
    const fs::path path = fs::path(mConfig.snapshotDirectory) / fileName;

    std::string failure;
    try
      {
	const std::optional<std::string> content = AtomicFileWriter::read(path);
	if (!content)
	  return;

	restore(*content);
	return;
      }
    catch (const PersistenceException& e)
      {
	failure = e.what();
      }
    catch (const std::invalid_argument& e)
      {
	failure = e.what();
      }

    mMetrics->incrementCounter(metric_names::kPersistenceFailureTotal, {});

    if (!quarantine)
      throw PersistenceException("GovernanceEngine: cannot restore " + path.string() + ": " + failure);

    const fs::path moved = AtomicFileWriter::quarantine(path);
    logTo(mLogger, LogLevel::Error, kComponent,
	  "cannot restore " + path.string() + " (" + failure + "), moved to " + moved.string() +
	  ", starting fresh");
  }
}
