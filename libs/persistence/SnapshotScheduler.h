// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RISKGOV_SNAPSHOT_SCHEDULER_H
#define __RISKGOV_SNAPSHOT_SCHEDULER_H 1

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include <boost/filesystem.hpp>
#include <boost/thread.hpp>
#include "IMetricsSink.h"
#include "RiskLogger.h"

namespace mkc_riskgov
{
  struct SnapshotSchedulerConfiguration
  {
    std::size_t flushIntervalMs = 1000;
    std::size_t initialBackoffMs = 100;
    std::size_t maxBackoffMs = 30000;

    std::vector<std::string> validationErrors() const;

    // @throws ConfigurationException
    void validate() const;
  };

  /**
   * @brief Write-behind persistence for serialized snapshots.
   *
   * Producers hand over an immutable serialized record with submit(); the
   * record travels to the scheduler's own io_context thread, where only the
   * latest record per key is kept. A periodic timer writes the pending
   * records through the file writer (AtomicFileWriter::write by default).
   *
   * A failed write is logged, counted in riskgov_persistence_failure_total
   * and retried with exponential backoff. A newer record for the same key
   * replaces the failing one and resets its backoff. Write failures never
   * reach the producer.
   */
  class SnapshotScheduler
  {
  public:
    using FileWriter = std::function<void(const boost::filesystem::path&, const std::string&)>;

    /**
     * @param directory  snapshots are written to directory / key
     * @param writer     empty selects AtomicFileWriter::write
     * @throws ConfigurationException if the configuration is invalid
     */
    SnapshotScheduler(const boost::filesystem::path& directory,
		      const SnapshotSchedulerConfiguration& config = SnapshotSchedulerConfiguration(),
		      std::shared_ptr<IMetricsSink> metrics = nullptr,
		      std::shared_ptr<RiskLogger> logger = nullptr,
		      FileWriter writer = FileWriter());

    SnapshotScheduler(const SnapshotScheduler&) = delete;
    SnapshotScheduler& operator=(const SnapshotScheduler&) = delete;

    // Flushes what is pending, then stops the thread
    ~SnapshotScheduler();

    // Non-blocking; safe from any thread
    void submit(const std::string& key, std::string content);

    /**
     * @brief Write every pending record now, ignoring backoff, and wait.
     * Must not be called from the scheduler thread.
     * @return number of records still pending because their write failed
     */
    std::size_t flush();

    // Flush and join. Further submits are dropped.
    void stop();

    const boost::filesystem::path& getDirectory() const
    {
      return mDirectory;
    }

  private:
    using Clock = std::chrono::steady_clock;

    struct PendingRecord
    {
      std::string content;
      std::size_t failures;
      Clock::time_point nextAttempt;
    };

    void scheduleTick();
    void onTick(const boost::system::error_code& ec);
    std::size_t writePending(bool force);
    std::chrono::milliseconds backoff(std::size_t failures) const;

  private:
    boost::filesystem::path mDirectory;
    SnapshotSchedulerConfiguration mConfig;
    std::shared_ptr<IMetricsSink> mMetrics;
    std::shared_ptr<RiskLogger> mLogger;
    FileWriter mWriter;
    boost::asio::io_context mIo;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> mWork;
    boost::asio::steady_timer mTimer;
    std::map<std::string, PendingRecord> mPending;	// touched only on the scheduler thread
    boost::mutex mStopMutex;
    bool mStopped;
    boost::thread mThread;
  };
}

#endif
