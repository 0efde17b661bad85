// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "DecisionStream.h"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>
#include "MetricNames.h"
#include "RiskGovernanceException.h"

namespace mkc_riskgov
{
  using boost::posix_time::ptime;

  namespace
  {
    const char* const kComponent = "DecisionStream";

    void appendPrefixed(std::vector<std::string>& errors,
			const std::string& prefix,
			const std::vector<std::string>& nested)
    {
      for (const auto& e : nested)
	errors.push_back(prefix + ": " + e);
    }

    const StreamConfiguration& checked(const StreamConfiguration& config)
    {
      config.validate();
      return config;
    }

    AcceptanceConfiguration acceptanceFor(const StreamConfiguration& config)
    {
      AcceptanceConfiguration acceptance(config.acceptance);
      acceptance.profile = config.profile;
      return acceptance;
    }

    ExecutionGateConfiguration gateFor(const StreamConfiguration& config)
    {
      ExecutionGateConfiguration gate(config.gate);
      gate.profile = config.profile;
      return gate;
    }

    std::string describe(const ptime& t)
    {
      return boost::posix_time::to_iso_extended_string(t);
    }
  }

  std::vector<std::string> StreamConfiguration::validationErrors() const
  {
    std::vector<std::string> errors;

    if (streamId.empty())
      errors.push_back("streamId must not be empty");

    if (profile.empty())
      errors.push_back("profile must not be empty");

    if (latencyWindow == 0 || surprisalWindow == 0)
      errors.push_back("percentile windows must hold at least one value");

    if (!std::isfinite(cycleBudgetMs) || cycleBudgetMs < 0.0)
      errors.push_back("cycleBudgetMs must be finite and >= 0");

    if (!std::isfinite(sigmaMin) || !(sigmaMin > 0.0))
      errors.push_back("sigmaMin must be positive");

    if (!std::isfinite(huberDelta) || !(huberDelta > 0.0))
      errors.push_back("huberDelta must be positive");

    if (maxPending == 0)
      errors.push_back("maxPending must be >= 1");

    appendPrefixed(errors, "calibrator", calibrator.validationErrors());
    appendPrefixed(errors, "compliance", compliance.validationErrors());
    appendPrefixed(errors, "aggregator", aggregator.validationErrors());
    appendPrefixed(errors, "acceptance", acceptance.validationErrors());
    appendPrefixed(errors, "gate", gate.validationErrors());

    return errors;
  }

  void StreamConfiguration::validate() const
  {
    throwOnConfigurationErrors("Stream " + streamId, validationErrors());
  }

  DecisionStream::DecisionStream(const StreamConfiguration& config,
				 std::shared_ptr<IMetricsSink> metrics,
				 std::shared_ptr<RiskLogger> logger,
				 SteadyClock clock)
    : mConfig(checked(config)),
      mMetrics(metrics ? std::move(metrics) : std::make_shared<NullMetricsSink>()),
      mLogger(std::move(logger)),
      mClock(clock ? std::move(clock) : SteadyClock([]() { return std::chrono::steady_clock::now(); })),
      mCalibrator(mConfig.calibrator),
      mCompliance(mConfig.compliance),
      mAggregator(mConfig.aggregator),
      mOrchestrator(acceptanceFor(mConfig), mMetrics, mLogger),
      mGate(gateFor(mConfig), mMetrics),
      mLatencyWindow(mConfig.latencyWindow),
      mSurprisalWindow(mConfig.surprisalWindow),
      mPending(),
      mLastForecast(),
      mLastGroundTruth(),
      mLastDecision()
  {
  }

  CycleDecision DecisionStream::onForecast(const ForecastEvent& event)
  {
    if (event.timestamp.is_special())
      throw InvalidInputException("DecisionStream " + mConfig.streamId + ": forecast without a timestamp");

    if (!mLastForecast.is_special() && event.timestamp <= mLastForecast)
      throw InvalidInputException("DecisionStream " + mConfig.streamId + ": forecast at " +
				  describe(event.timestamp) + " does not follow " +
				  describe(mLastForecast));

    if (!std::isfinite(event.point) || !std::isfinite(event.sigmaHat) || !(event.sigmaHat > 0.0))
      throw InvalidInputException("DecisionStream " + mConfig.streamId +
				  ": point must be finite and sigma finite and positive");

    for (double w : event.modelConfidence)
      if (!std::isfinite(w) || w < 0.0)
	throw InvalidInputException("DecisionStream " + mConfig.streamId +
				    ": model confidence entries must be finite and >= 0");

    if (event.latencyMs && (!std::isfinite(*event.latencyMs) || *event.latencyMs < 0.0))
      throw InvalidInputException("DecisionStream " + mConfig.streamId + ": latency must be finite and >= 0");

    if (!std::isfinite(event.baseNotional) || event.baseNotional < 0.0)
      throw InvalidInputException("DecisionStream " + mConfig.streamId +
				  ": base notional must be finite and >= 0");

    const auto started = mClock();
    const MetricLabels labels = profileLabels();

    const IntervalPrediction prediction =
      mCalibrator.predictInterval(event.point, event.sigmaHat, event.regimeTransition,
				  mCalibrator.getInstabilityExcess());

    if (mPending.size() >= mConfig.maxPending)
      {
	logTo(mLogger, LogLevel::Warning, kComponent,
	      mConfig.streamId + ": dropping unresolved forecast at " + describe(mPending.begin()->first));
	mPending.erase(mPending.begin());
      }
    mPending.emplace(event.timestamp, prediction);
    mLastForecast = event.timestamp;

    if (event.latencyMs)
      {
	mLatencyWindow.add(*event.latencyMs);
	mMetrics->observeHistogram(metric_names::kLatencyMs, labels, *event.latencyMs);
      }

    const double width = prediction.upper - prediction.lower;
    const double relativeWidth = width / std::max(mConfig.sigmaMin, std::fabs(event.point));
    mMetrics->observeHistogram(metric_names::kRelativeIntervalWidth, labels, relativeWidth);

    const CalibrationSignal signal{mCalibrator.getAlphaTarget(),
				   mCalibrator.getCoverageEma(),
				   mCalibrator.getInflationFactor()};
    const UncertaintyScore score = mAggregator.aggregate(signal, event.modelConfidence, width,
							 event.point, mCompliance.getEstimate());

    GuardMetrics guards;
    guards.coverageEma = mCalibrator.getCoverageEma();
    guards.coverageMissStreak = static_cast<double>(mCalibrator.getMissStreak());
    guards.latencyP95 = getLatencyP95();
    guards.surprisalP95 = getSurprisalP95();
    guards.relativeIntervalWidth = relativeWidth;
    guards.kappa = score.kappa;
    guards.kappaPlus = score.kappaPlus;

    const AcceptanceStep step = mOrchestrator.evaluate(guards, event.timestamp);

    if (mConfig.cycleBudgetMs > 0.0)
      {
	const std::chrono::duration<double, std::milli> elapsed = mClock() - started;
	if (elapsed.count() > mConfig.cycleBudgetMs)
	  {
	    mMetrics->incrementCounter(metric_names::kStaleDecisionTotal, labels);

	    std::ostringstream msg;
	    msg << mConfig.streamId << ": cycle at " << describe(event.timestamp) << " took "
		<< elapsed.count() << " ms (budget " << mConfig.cycleBudgetMs << " ms), decision is stale";
	    logTo(mLogger, LogLevel::Warning, kComponent, msg.str());

	    return staleDecision(step, score, prediction);
	  }
      }

    const AcceptanceDecision acceptance = mOrchestrator.commit(step);
    const ExecutionDecision execution = mGate.decide(acceptance, event.baseNotional);
    publishCalibration(score);

    CycleDecision decision{event.timestamp,
			   acceptance.posture,
			   execution.riskScale,
			   execution.recommendedNotional,
			   execution.blockReason,
			   score.kappa,
			   score.kappaPlus,
			   mCalibrator.getCurrentAlpha(),
			   mCalibrator.getCoverageEma(),
			   false,
			   prediction};
    mLastDecision = decision;
    return decision;
  }

  CycleDecision DecisionStream::staleDecision(const AcceptanceStep& step,
					      const UncertaintyScore& score,
					      const IntervalPrediction& prediction)
  {
    if (mLastDecision)
      {
	CycleDecision last(*mLastDecision);
	last.stale = true;
	return last;
      }

    // Nothing trustworthy to repeat yet: hold the current posture at zero size
    return CycleDecision{step.decision.timestamp,
			 mOrchestrator.getPosture(),
			 0.0,
			 0.0,
			 std::string(kStaleReason),
			 score.kappa,
			 score.kappaPlus,
			 mCalibrator.getCurrentAlpha(),
			 mCalibrator.getCoverageEma(),
			 true,
			 prediction};
  }

  GroundTruthResult DecisionStream::onGroundTruth(const GroundTruthEvent& event)
  {
    if (event.timestamp.is_special())
      throw InvalidInputException("DecisionStream " + mConfig.streamId + ": ground truth without a timestamp");

    if (!mLastGroundTruth.is_special() && event.timestamp <= mLastGroundTruth)
      throw InvalidInputException("DecisionStream " + mConfig.streamId + ": ground truth at " +
				  describe(event.timestamp) + " does not follow " +
				  describe(mLastGroundTruth));

    if (!std::isfinite(event.observed))
      throw InvalidInputException("DecisionStream " + mConfig.streamId + ": observed value must be finite");

    auto it = mPending.find(event.timestamp);
    if (it == mPending.end())
      throw InvalidInputException("DecisionStream " + mConfig.streamId + ": no pending forecast at " +
				  describe(event.timestamp));

    const IntervalPrediction prediction = it->second;
    const double targetCoverage = mCalibrator.getCoverageTarget();

    GroundTruthResult result;
    result.calibration = mCalibrator.onObservation(event.observed, prediction);
    mCompliance.update(result.calibration.hit, targetCoverage);
    result.bccEstimate = mCompliance.getEstimate();

    const double sigmaEffective = std::max(prediction.sigmaEffective,
					   mConfig.sigmaMin * std::max(1.0, std::fabs(prediction.point)));
    const double r = std::fabs(event.observed - prediction.point) / (sigmaEffective + 1e-9);
    result.surprisal = std::log1p(3.0 * huber(r, mConfig.huberDelta));
    mSurprisalWindow.add(result.surprisal);
    mMetrics->observeHistogram(metric_names::kSurprisal, profileLabels(), result.surprisal);

    // Older forecasts can no longer be resolved
    const std::size_t expired = static_cast<std::size_t>(std::distance(mPending.begin(), it));
    mPending.erase(mPending.begin(), std::next(it));
    if (expired > 0)
      {
	std::ostringstream msg;
	msg << mConfig.streamId << ": " << expired << " forecast(s) before "
	    << describe(event.timestamp) << " expired without ground truth";
	logTo(mLogger, LogLevel::Debug, kComponent, msg.str());
      }

    mLastGroundTruth = event.timestamp;

    if (result.calibration.spikeDetected)
      logTo(mLogger, LogLevel::Info, kComponent,
	    mConfig.streamId + ": residual spike at " + describe(event.timestamp) + ", interval inflated");

    return result;
  }

  double DecisionStream::getLatencyP95() const
  {
    return mLatencyWindow.winsorizedPercentile(0.95);
  }

  double DecisionStream::getSurprisalP95() const
  {
    return mSurprisalWindow.winsorizedPercentile(0.95);
  }

  StreamSnapshot DecisionStream::getSnapshot() const
  {
    StreamSnapshot snapshot;
    snapshot.version = SnapshotCodec::kStreamVersion;
    snapshot.streamId = mConfig.streamId;
    snapshot.profile = mConfig.profile;
    snapshot.lastForecast = mLastForecast;
    snapshot.lastGroundTruth = mLastGroundTruth;
    snapshot.calibration = mCalibrator.getState();
    snapshot.compliance = mCompliance.getState();
    snapshot.acceptance = mOrchestrator.getState();
    snapshot.latencyWindow = mLatencyWindow.values();
    snapshot.surprisalWindow = mSurprisalWindow.values();

    for (const auto& p : mPending)
      snapshot.pending.push_back(PendingPrediction{p.first, p.second});

    return snapshot;
  }

  void DecisionStream::restoreSnapshot(const StreamSnapshot& snapshot)
  {
    if (snapshot.streamId != mConfig.streamId)
      throw std::invalid_argument("DecisionStream " + mConfig.streamId + ": snapshot belongs to stream " +
				  snapshot.streamId);

    if (snapshot.profile != mConfig.profile)
      logTo(mLogger, LogLevel::Warning, kComponent,
	    mConfig.streamId + ": restoring a snapshot taken under profile " + snapshot.profile);

    AdaptiveConformalCalibrator calibrator(mConfig.calibrator);
    calibrator.restoreState(snapshot.calibration);

    CoverageComplianceTracker compliance(mConfig.compliance);
    compliance.restoreState(snapshot.compliance);

    AcceptanceOrchestrator orchestrator(acceptanceFor(mConfig), mMetrics, mLogger);
    orchestrator.restoreState(snapshot.acceptance);

    RollingPercentileWindow latency(mConfig.latencyWindow);
    latency.assign(snapshot.latencyWindow);

    RollingPercentileWindow surprisal(mConfig.surprisalWindow);
    surprisal.assign(snapshot.surprisalWindow);

    std::map<ptime, IntervalPrediction> pending;
    for (const auto& p : snapshot.pending)
      if (p.timestamp.is_special() || !pending.emplace(p.timestamp, p.prediction).second)
	throw std::invalid_argument("DecisionStream " + mConfig.streamId +
				    ": snapshot holds an invalid or duplicate pending forecast");

    mCalibrator = std::move(calibrator);
    mCompliance = std::move(compliance);
    mOrchestrator = std::move(orchestrator);
    mLatencyWindow = std::move(latency);
    mSurprisalWindow = std::move(surprisal);
    mPending = std::move(pending);
    mLastForecast = snapshot.lastForecast;
    mLastGroundTruth = snapshot.lastGroundTruth;
    mLastDecision.reset();

    std::ostringstream msg;
    msg << mConfig.streamId << ": restored at cycle " << snapshot.acceptance.cycles << " in posture "
	<< toString(snapshot.acceptance.posture) << " with " << mPending.size() << " pending forecast(s)";
    logTo(mLogger, LogLevel::Info, kComponent, msg.str());
  }

  double DecisionStream::huber(double r, double delta)
  {
    return (r <= delta) ? 0.5 * r * r : delta * (r - 0.5 * delta);
  }

  void DecisionStream::publishCalibration(const UncertaintyScore& score)
  {
    const MetricLabels labels = profileLabels();
    mMetrics->setGauge(metric_names::kIcpAlpha, labels, mCalibrator.getCurrentAlpha());
    mMetrics->setGauge(metric_names::kIcpAlphaTarget, labels, mCalibrator.getAlphaTarget());
    mMetrics->setGauge(metric_names::kIcpCoverageEma, labels, mCalibrator.getCoverageEma());
    mMetrics->setGauge(metric_names::kKappa, labels, score.kappa);
    mMetrics->setGauge(metric_names::kKappaPlus, labels, score.kappaPlus);
  }

  MetricLabels DecisionStream::profileLabels() const
  {
    return MetricLabels{{"profile", mConfig.profile}};
  }
}
