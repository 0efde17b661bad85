// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RISKGOV_DECISION_STREAM_H
#define __RISKGOV_DECISION_STREAM_H 1

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "AcceptanceOrchestrator.h"
#include "AdaptiveConformalCalibrator.h"
#include "CoverageComplianceTracker.h"
#include "ExecutionRiskGate.h"
#include "IMetricsSink.h"
#include "RiskLogger.h"
#include "RollingPercentileWindow.h"
#include "SnapshotCodec.h"
#include "UncertaintyAggregator.h"

namespace mkc_riskgov
{
  /**
   * @brief Configuration of one instrument/profile decision stream.
   */
  struct StreamConfiguration
  {
    std::string streamId;
    std::string profile = "default";		// telemetry label, copied into acceptance and gate
    CalibratorConfiguration calibrator;
    CoverageComplianceConfiguration compliance;
    AggregatorConfiguration aggregator;
    AcceptanceConfiguration acceptance;
    ExecutionGateConfiguration gate;
    std::size_t latencyWindow = 100;
    std::size_t surprisalWindow = 200;
    double cycleBudgetMs = 10.0;		// 0 disables the stale check
    double sigmaMin = 1e-6;
    double huberDelta = 1.345;
    std::size_t maxPending = 10000;		// unresolved forecasts kept for ground truth

    std::vector<std::string> validationErrors() const;

    // @throws ConfigurationException
    void validate() const;
  };

  struct ForecastEvent
  {
    boost::posix_time::ptime timestamp;
    double point;
    double sigmaHat;
    bool regimeTransition;
    std::vector<double> modelConfidence;	// may be empty
    std::optional<double> latencyMs;		// upstream end-to-end latency
    double baseNotional = 1.0;
  };

  // Resolves the forecast made at the same timestamp
  struct GroundTruthEvent
  {
    boost::posix_time::ptime timestamp;
    double observed;
  };

  /**
   * @brief What the execution layer receives for one forecast.
   */
  struct CycleDecision
  {
    boost::posix_time::ptime timestamp;
    Posture posture;
    double riskScale;
    double recommendedNotional;
    std::optional<std::string> blockReason;
    double kappa;
    double kappaPlus;
    double alphaCurrent;
    double coverageEma;
    bool stale;
    IntervalPrediction interval;
  };

  struct GroundTruthResult
  {
    CalibrationUpdate calibration;
    double surprisal;
    double bccEstimate;
  };

  /**
   * @brief One forecast-to-decision pipeline.
   *
   * A forecast runs calibrator, aggregator, acceptance state machine and
   * execution gate in that order. Ground truth arriving later resolves the
   * pending prediction with the same timestamp and feeds the calibrator, the
   * coverage compliance tracker and the surprisal window.
   *
   * When a forecast cycle takes longer than cycleBudgetMs the acceptance step
   * is discarded and the previous decision is returned flagged stale.
   *
   * Not thread-safe: a stream has exactly one writer.
   */
  class DecisionStream
  {
  public:
    using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

    static constexpr const char* kStaleReason = "stale";

    /**
     * @param clock  cycle budget clock; empty selects std::chrono::steady_clock
     * @throws ConfigurationException if the configuration is invalid
     */
    DecisionStream(const StreamConfiguration& config,
		   std::shared_ptr<IMetricsSink> metrics = nullptr,
		   std::shared_ptr<RiskLogger> logger = nullptr,
		   SteadyClock clock = SteadyClock());

    /**
     * @throws InvalidInputException if the timestamp does not move forward or
     *         the event is not finite; the stream is left unchanged
     */
    CycleDecision onForecast(const ForecastEvent& event);

    /**
     * @throws InvalidInputException if the timestamp does not move forward,
     *         no forecast is pending at that timestamp or the value is not finite
     */
    GroundTruthResult onGroundTruth(const GroundTruthEvent& event);

    const std::string& getStreamId() const
    {
      return mConfig.streamId;
    }

    const StreamConfiguration& getConfiguration() const
    {
      return mConfig;
    }

    Posture getPosture() const
    {
      return mOrchestrator.getPosture();
    }

    const std::optional<CycleDecision>& getLastDecision() const
    {
      return mLastDecision;
    }

    std::size_t getPendingCount() const
    {
      return mPending.size();
    }

    const AdaptiveConformalCalibrator& getCalibrator() const
    {
      return mCalibrator;
    }

    const CoverageComplianceTracker& getComplianceTracker() const
    {
      return mCompliance;
    }

    const AcceptanceOrchestrator& getOrchestrator() const
    {
      return mOrchestrator;
    }

    const ExecutionRiskGate& getGate() const
    {
      return mGate;
    }

    double getLatencyP95() const;
    double getSurprisalP95() const;

    StreamSnapshot getSnapshot() const;

    /**
     * @brief Replace the stream state. Either every component is restored
     * or the stream is left unchanged.
     * @throws std::invalid_argument if the snapshot belongs to another stream
     *         or holds state the configured components reject
     */
    void restoreSnapshot(const StreamSnapshot& snapshot);

    // 0.5 r^2 below delta, linear above
    static double huber(double r, double delta);

  private:
    CycleDecision staleDecision(const AcceptanceStep& step,
				const UncertaintyScore& score,
				const IntervalPrediction& prediction);
    void publishCalibration(const UncertaintyScore& score);
    MetricLabels profileLabels() const;

  private:
    StreamConfiguration mConfig;
    std::shared_ptr<IMetricsSink> mMetrics;
    std::shared_ptr<RiskLogger> mLogger;
    SteadyClock mClock;
    AdaptiveConformalCalibrator mCalibrator;
    CoverageComplianceTracker mCompliance;
    UncertaintyAggregator mAggregator;
    AcceptanceOrchestrator mOrchestrator;
    ExecutionRiskGate mGate;
    RollingPercentileWindow mLatencyWindow;
    RollingPercentileWindow mSurprisalWindow;
    std::map<boost::posix_time::ptime, IntervalPrediction> mPending;
    boost::posix_time::ptime mLastForecast;
    boost::posix_time::ptime mLastGroundTruth;
    std::optional<CycleDecision> mLastDecision;
  };
}

#endif
