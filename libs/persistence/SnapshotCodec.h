// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RISKGOV_SNAPSHOT_CODEC_H
#define __RISKGOV_SNAPSHOT_CODEC_H 1

#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "AcceptanceOrchestrator.h"
#include "AdaptiveConformalCalibrator.h"
#include "AlphaSpendingLedger.h"
#include "CoverageComplianceTracker.h"
#include "PolicyLifecycleManager.h"

namespace mkc_riskgov
{
  // A forecast whose ground truth has not arrived yet
  struct PendingPrediction
  {
    boost::posix_time::ptime timestamp;
    IntervalPrediction prediction;
  };

  /**
   * @brief Everything a decision stream needs to continue after a restart.
   */
  struct StreamSnapshot
  {
    int version = 2;				// schema version the snapshot was read from
    std::string streamId;
    std::string profile;
    boost::posix_time::ptime lastForecast;	// not_a_date_time before the first forecast
    boost::posix_time::ptime lastGroundTruth;
    CalibrationState calibration;
    CoverageComplianceState compliance;
    AcceptanceState acceptance;
    std::vector<double> latencyWindow;		// oldest first
    std::vector<double> surprisalWindow;
    std::vector<PendingPrediction> pending;	// ordered by timestamp
  };

  struct LedgerSnapshot
  {
    double totalBudget;
    std::vector<AlphaLedgerEntry> entries;
  };

  /**
   * @brief JSON encoding of the durable state, tagged with "schema" and
   * "version".
   *
   *   riskgov.stream     version 2; version 1 (no compliance tracker, no
   *                      percentile windows) loads with empty defaults
   *   riskgov.ledger     version 1
   *   riskgov.lifecycle  version 1
   *
   * Doubles are written in shortest round-trip form so a decoded snapshot
   * reproduces the encoded state exactly. Non-finite doubles are written as
   * null.
   */
  class SnapshotCodec
  {
  public:
    static constexpr const char* kStreamSchema = "riskgov.stream";
    static constexpr int kStreamVersion = 2;
    static constexpr const char* kLedgerSchema = "riskgov.ledger";
    static constexpr int kLedgerVersion = 1;
    static constexpr const char* kLifecycleSchema = "riskgov.lifecycle";
    static constexpr int kLifecycleVersion = 1;

    static std::string encodeStream(const StreamSnapshot& snapshot);

    // @throws PersistenceException on a parse error, a schema mismatch or a missing field
    static StreamSnapshot decodeStream(const std::string& json);

    static std::string encodeLedger(const LedgerSnapshot& snapshot);

    // @throws PersistenceException
    static LedgerSnapshot decodeLedger(const std::string& json);

    static std::string encodeLifecycle(const LifecycleSnapshot& snapshot);

    // @throws PersistenceException
    static LifecycleSnapshot decodeLifecycle(const std::string& json);
  };
}

#endif
