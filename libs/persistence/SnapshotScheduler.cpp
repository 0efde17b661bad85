// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "SnapshotScheduler.h"
#include <algorithm>
#include <sstream>
#include <boost/thread/future.hpp>
#include "AtomicFileWriter.h"
#include "MetricNames.h"
#include "RiskGovernanceException.h"

namespace mkc_riskgov
{
  namespace
  {
    const char* const kComponent = "SnapshotScheduler";
  }

  std::vector<std::string> SnapshotSchedulerConfiguration::validationErrors() const
  {
    std::vector<std::string> errors;

    if (flushIntervalMs == 0)
      errors.push_back("flushIntervalMs must be >= 1");

    if (initialBackoffMs == 0)
      errors.push_back("initialBackoffMs must be >= 1");

    if (maxBackoffMs < initialBackoffMs)
      errors.push_back("maxBackoffMs must be >= initialBackoffMs");

    return errors;
  }

  void SnapshotSchedulerConfiguration::validate() const
  {
    throwOnConfigurationErrors("SnapshotScheduler", validationErrors());
  }

  SnapshotScheduler::SnapshotScheduler(const boost::filesystem::path& directory,
				       const SnapshotSchedulerConfiguration& config,
				       std::shared_ptr<IMetricsSink> metrics,
				       std::shared_ptr<RiskLogger> logger,
				       FileWriter writer)
    : mDirectory(directory),
      mConfig(config),
      mMetrics(metrics ? std::move(metrics) : std::make_shared<NullMetricsSink>()),
      mLogger(std::move(logger)),
      mWriter(writer ? std::move(writer) : FileWriter(&AtomicFileWriter::write)),
      mIo(),
      mWork(boost::asio::make_work_guard(mIo)),
      mTimer(mIo),
      mPending(),
      mStopMutex(),
      mStopped(false),
      mThread()
  {
    mConfig.validate();

    scheduleTick();
    mThread = boost::thread([this]() { mIo.run(); });
  }

  SnapshotScheduler::~SnapshotScheduler()
  {
    stop();
  }

  void SnapshotScheduler::submit(const std::string& key, std::string content)
  {
    boost::mutex::scoped_lock lock(mStopMutex);
    if (mStopped)
      {
	logTo(mLogger, LogLevel::Warning, kComponent, "dropping snapshot " + key + " submitted after stop");
	return;
      }

    boost::asio::post(mIo, [this, key, content = std::move(content)]() mutable {
      PendingRecord& record = mPending[key];
      record.content = std::move(content);
      record.failures = 0;
      record.nextAttempt = Clock::now();
    });
  }

  std::size_t SnapshotScheduler::flush()
  {
    {
      boost::mutex::scoped_lock lock(mStopMutex);
      if (mStopped)
	return 0;
    }

    auto promise = std::make_shared<boost::promise<std::size_t>>();
    boost::unique_future<std::size_t> remaining = promise->get_future();
    boost::asio::post(mIo, [this, promise]() { promise->set_value(writePending(true)); });

    return remaining.get();
  }

  void SnapshotScheduler::stop()
  {
    {
      boost::mutex::scoped_lock lock(mStopMutex);
      if (mStopped)
	return;
      mStopped = true;
    }

    // Submits queued before the flag was set still run before the drain
    auto promise = std::make_shared<boost::promise<std::size_t>>();
    boost::unique_future<std::size_t> remaining = promise->get_future();
    boost::asio::post(mIo, [this, promise]() {
      promise->set_value(writePending(true));
      mTimer.cancel();
    });

    const std::size_t unwritten = remaining.get();
    if (unwritten > 0)
      {
	std::ostringstream msg;
	msg << unwritten << " snapshot(s) could not be written at shutdown";
	logTo(mLogger, LogLevel::Error, kComponent, msg.str());
      }

    mWork.reset();
    if (mThread.joinable())
      mThread.join();
  }

  void SnapshotScheduler::scheduleTick()
  {
    mTimer.expires_after(std::chrono::milliseconds(mConfig.flushIntervalMs));
    mTimer.async_wait([this](const boost::system::error_code& ec) { onTick(ec); });
  }

  void SnapshotScheduler::onTick(const boost::system::error_code& ec)
  {
    if (ec == boost::asio::error::operation_aborted)
      return;

    writePending(false);
    scheduleTick();
  }

  std::size_t SnapshotScheduler::writePending(bool force)
  {
    const Clock::time_point now = Clock::now();

    for (auto it = mPending.begin(); it != mPending.end();)
      {
	PendingRecord& record = it->second;
	if (!force && record.nextAttempt > now)
	  {
	    ++it;
	    continue;
	  }

	try
	  {
	    mWriter(mDirectory / it->first, record.content);
	    mMetrics->incrementCounter(metric_names::kSnapshotWriteTotal, {});
	    it = mPending.erase(it);
	  }
	catch (const std::exception& e)
	  {
	    ++record.failures;
	    record.nextAttempt = now + backoff(record.failures);
	    mMetrics->incrementCounter(metric_names::kPersistenceFailureTotal, {});

	    std::ostringstream msg;
	    msg << "write of " << it->first << " failed (attempt " << record.failures
		<< ", retry in " << backoff(record.failures).count() << " ms): " << e.what();
	    logTo(mLogger, LogLevel::Warning, kComponent, msg.str());
	    ++it;
	  }
      }

    return mPending.size();
  }

  std::chrono::milliseconds SnapshotScheduler::backoff(std::size_t failures) const
  {
    std::size_t delay = mConfig.initialBackoffMs;
    for (std::size_t i = 1; i < failures && delay < mConfig.maxBackoffMs; ++i)
      delay *= 2;

    return std::chrono::milliseconds(std::min(delay, mConfig.maxBackoffMs));
  }
}
