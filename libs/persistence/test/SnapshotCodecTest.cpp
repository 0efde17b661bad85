// SnapshotCodecTest.cpp
//
// Unit tests for the JSON snapshot codec: exact state round trips, schema
// and version checks, version 1 stream snapshots and malformed documents.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <memory>
#include <string>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "AcceptanceOrchestrator.h"
#include "AdaptiveConformalCalibrator.h"
#include "AlphaSpendingLedger.h"
#include "AlphaSpendingPolicy.h"
#include "CoverageComplianceTracker.h"
#include "PolicyLifecycleManager.h"
#include "RiskGovernanceException.h"
#include "SnapshotCodec.h"
#include "TestUtils.h"

using namespace mkc_riskgov;
using Catch::Approx;

namespace
{
  StreamSnapshot buildStreamSnapshot()
  {
    CalibratorConfiguration calibratorConfig;
    calibratorConfig.minCalibrationSize = 20;
    calibratorConfig.scoreWindowSize = 50;
    AdaptiveConformalCalibrator calibrator(calibratorConfig);
    CoverageComplianceTracker compliance;
    AcceptanceOrchestrator orchestrator;

    const auto series = generateRegimeShiftAr1(11, 120, 60);
    for (std::size_t i = 0; i < series.size(); ++i)
      {
	const SyntheticForecast& f = series[i];
	const IntervalPrediction p = calibrator.predictInterval(f.point, f.sigma, f.transition,
								calibrator.getInstabilityExcess());
	const double target = calibrator.getCoverageTarget();
	const CalibrationUpdate u = calibrator.onObservation(f.observed, p);
	compliance.update(u.hit, target);

	GuardMetrics m;
	m.coverageEma = calibrator.getCoverageEma();
	m.latencyP95 = (i % 7 == 0) ? 180.0 : 40.0;
	orchestrator.step(m, timestampAt(i + 1));
      }

    StreamSnapshot snapshot;
    snapshot.streamId = "ES";
    snapshot.profile = "default";
    snapshot.lastForecast = timestampAt(121);
    snapshot.lastGroundTruth = timestampAt(120);
    snapshot.calibration = calibrator.getState();
    snapshot.compliance = compliance.getState();
    snapshot.acceptance = orchestrator.getState();
    snapshot.latencyWindow = {40.0, 180.0, 0.1 + 0.2};
    snapshot.surprisalWindow = {0.25, 1.0 / 3.0};
    snapshot.pending.push_back(PendingPrediction{timestampAt(121),
						 calibrator.predictInterval(0.5, 1.5, false, 0.0)});
    return snapshot;
  }

  std::string rewrite(const std::string& json, void (*edit)(rapidjson::Document&))
  {
    rapidjson::Document doc;
    doc.Parse<rapidjson::kParseFullPrecisionFlag>(json.c_str());
    edit(doc);

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return buffer.GetString();
  }
}

TEST_CASE("SnapshotCodec: stream round trip is exact", "[SnapshotCodec][Stream]")
{
  const StreamSnapshot original = buildStreamSnapshot();
  const std::string json = SnapshotCodec::encodeStream(original);

  REQUIRE(json.find("\"riskgov.stream\"") != std::string::npos);

  const StreamSnapshot decoded = SnapshotCodec::decodeStream(json);

  REQUIRE(decoded.version == 2);
  REQUIRE(decoded.streamId == "ES");
  REQUIRE(decoded.lastForecast == original.lastForecast);
  REQUIRE(decoded.lastGroundTruth == original.lastGroundTruth);

  const CalibrationState& a = original.calibration;
  const CalibrationState& b = decoded.calibration;
  REQUIRE(b.currentAlpha == a.currentAlpha);
  REQUIRE(b.alphaTarget == a.alphaTarget);
  REQUIRE(b.coverageEma == a.coverageEma);
  REQUIRE(b.missStreak == a.missStreak);
  REQUIRE(b.inflationFactor == a.inflationFactor);
  REQUIRE(b.cooldownCounter == a.cooldownCounter);
  REQUIRE(b.scoreWindow == a.scoreWindow);
  REQUIRE(b.recentScores == a.recentScores);
  REQUIRE(b.instabilityEma == a.instabilityEma);
  REQUIRE(b.nObservations == a.nObservations);
  REQUIRE(b.quantileEstimatorState.heights == a.quantileEstimatorState.heights);
  REQUIRE(b.quantileEstimatorState.positions == a.quantileEstimatorState.positions);
  REQUIRE(b.quantileEstimatorState.desiredPositions == a.quantileEstimatorState.desiredPositions);
  REQUIRE(b.quantileEstimatorState.count == a.quantileEstimatorState.count);
  REQUIRE(b.quantileEstimatorState.markersInitialized == a.quantileEstimatorState.markersInitialized);

  REQUIRE(decoded.compliance.windowHits == original.compliance.windowHits);
  REQUIRE(decoded.compliance.emaCoverage == original.compliance.emaCoverage);
  REQUIRE(decoded.compliance.count == original.compliance.count);

  REQUIRE(decoded.acceptance.posture == original.acceptance.posture);
  REQUIRE(decoded.acceptance.cycles == original.acceptance.cycles);
  REQUIRE(decoded.acceptance.cleanStreak == original.acceptance.cleanStreak);
  REQUIRE(decoded.acceptance.violationsByGuard == original.acceptance.violationsByGuard);
  REQUIRE(decoded.acceptance.hardViolationsByGuard == original.acceptance.hardViolationsByGuard);
  REQUIRE(decoded.acceptance.transitionCounts == original.acceptance.transitionCounts);
  REQUIRE(decoded.acceptance.decisionsByPosture == original.acceptance.decisionsByPosture);
  REQUIRE(decoded.acceptance.lastTransition == original.acceptance.lastTransition);

  REQUIRE(decoded.latencyWindow == original.latencyWindow);
  REQUIRE(decoded.surprisalWindow == original.surprisalWindow);

  REQUIRE(decoded.pending.size() == 1);
  REQUIRE(decoded.pending[0].timestamp == timestampAt(121));
  REQUIRE(decoded.pending[0].prediction.upper == original.pending[0].prediction.upper);

  SECTION("a decoded state drives a calibrator identically")
    {
      CalibratorConfiguration config;
      config.minCalibrationSize = 20;
      config.scoreWindowSize = 50;

      AdaptiveConformalCalibrator first(config);
      AdaptiveConformalCalibrator second(config);
      first.restoreState(original.calibration);
      second.restoreState(decoded.calibration);

      const IntervalPrediction p1 = first.predictInterval(1.0, 2.0, true, 0.3);
      const IntervalPrediction p2 = second.predictInterval(1.0, 2.0, true, 0.3);
      REQUIRE(p1.lower == p2.lower);
      REQUIRE(p1.upper == p2.upper);
    }
}

TEST_CASE("SnapshotCodec: empty compliance tracker writes null", "[SnapshotCodec][Stream]")
{
  StreamSnapshot snapshot = buildStreamSnapshot();
  snapshot.compliance = CoverageComplianceTracker().getState();
  snapshot.lastGroundTruth = boost::posix_time::ptime();

  const StreamSnapshot decoded = SnapshotCodec::decodeStream(SnapshotCodec::encodeStream(snapshot));
  REQUIRE(decoded.compliance.count == 0);
  REQUIRE(std::isnan(decoded.compliance.emaCoverage));
  REQUIRE(decoded.lastGroundTruth.is_not_a_date_time());
}

TEST_CASE("SnapshotCodec: version 1 stream snapshots", "[SnapshotCodec][Stream]")
{
  const std::string v2 = SnapshotCodec::encodeStream(buildStreamSnapshot());

  const std::string v1 = rewrite(v2, [](rapidjson::Document& doc) {
    doc["version"].SetInt(1);
    doc.RemoveMember("compliance");
    doc.RemoveMember("latency_window");
    doc.RemoveMember("surprisal_window");
  });

  const StreamSnapshot decoded = SnapshotCodec::decodeStream(v1);
  REQUIRE(decoded.version == 1);
  REQUIRE(decoded.compliance.count == 0);
  REQUIRE(decoded.compliance.windowHits.empty());
  REQUIRE(decoded.latencyWindow.empty());
  REQUIRE(decoded.surprisalWindow.empty());
  REQUIRE(decoded.calibration.nObservations == 120);

  SECTION("version 2 requires the new fields")
    {
      const std::string broken = rewrite(v2, [](rapidjson::Document& doc) {
	doc.RemoveMember("latency_window");
      });
      REQUIRE_THROWS_AS(SnapshotCodec::decodeStream(broken), PersistenceException);
    }
}

TEST_CASE("SnapshotCodec: rejects malformed documents", "[SnapshotCodec]")
{
  const std::string v2 = SnapshotCodec::encodeStream(buildStreamSnapshot());

  REQUIRE_THROWS_AS(SnapshotCodec::decodeStream("{\"schema\": \"riskgov.stream\", "), PersistenceException);
  REQUIRE_THROWS_AS(SnapshotCodec::decodeStream(""), PersistenceException);

  REQUIRE_THROWS_AS(SnapshotCodec::decodeStream(rewrite(v2, [](rapidjson::Document& doc) {
	doc["version"].SetInt(3);
      })), PersistenceException);

  REQUIRE_THROWS_AS(SnapshotCodec::decodeStream(rewrite(v2, [](rapidjson::Document& doc) {
	doc["schema"].SetString("riskgov.ledger");
      })), PersistenceException);

  REQUIRE_THROWS_AS(SnapshotCodec::decodeStream(rewrite(v2, [](rapidjson::Document& doc) {
	doc["acceptance"]["posture"].SetString("HALT");
      })), PersistenceException);

  REQUIRE_THROWS_AS(SnapshotCodec::decodeStream(rewrite(v2, [](rapidjson::Document& doc) {
	doc["calibration"]["alpha_target"].SetString("0.1");
      })), PersistenceException);

  REQUIRE_THROWS_AS(SnapshotCodec::decodeStream(rewrite(v2, [](rapidjson::Document& doc) {
	doc["calibration"]["quantile_estimator"]["heights"].PopBack();
      })), PersistenceException);

  // A ledger document is not a stream snapshot
  REQUIRE_THROWS_AS(SnapshotCodec::decodeStream(SnapshotCodec::encodeLedger(LedgerSnapshot{0.05, {}})),
		    PersistenceException);
}

TEST_CASE("SnapshotCodec: ledger round trip", "[SnapshotCodec][Ledger]")
{
  AlphaSpendingLedger ledger(0.05);
  ledger.recordSpend("cand-1/canary", 0.005, LedgerEventType::TestAllocation, timestampAt(1));
  ledger.recordSpend("cand-1/canary", 0.0025, LedgerEventType::TestRestart, timestampAt(2));
  ledger.recordSpend("cand-2/canary", 0.01, LedgerEventType::TestAllocation, timestampAt(3));

  const LedgerSnapshot decoded =
    SnapshotCodec::decodeLedger(SnapshotCodec::encodeLedger(LedgerSnapshot{0.05, ledger.getEntries()}));

  REQUIRE(decoded.totalBudget == 0.05);
  REQUIRE(decoded.entries.size() == 3);
  REQUIRE(decoded.entries[1].testId == "cand-1/canary");
  REQUIRE(decoded.entries[1].eventType == LedgerEventType::TestRestart);
  REQUIRE(decoded.entries[1].timestamp == timestampAt(2));
  REQUIRE(decoded.entries[2].cumulativeAlpha == ledger.getEntries()[2].cumulativeAlpha);

  AlphaSpendingLedger restored(decoded.totalBudget);
  restored.restoreEntries(decoded.entries);
  REQUIRE(restored.getCumulativeAlpha() == Approx(0.0175));

  SECTION("unknown event type")
    {
      const std::string json = SnapshotCodec::encodeLedger(decoded);
      std::string broken(json);
      broken.replace(broken.find("test_restart"), 12, "test_rewound");
      REQUIRE_THROWS_AS(SnapshotCodec::decodeLedger(broken), PersistenceException);
    }
}

TEST_CASE("SnapshotCodec: lifecycle round trip", "[SnapshotCodec][Lifecycle]")
{
  auto ledger = std::make_shared<AlphaSpendingLedger>(0.1);
  std::shared_ptr<AlphaSpendingPolicy> policy = createSpendingPolicy("uniform");

  LifecycleConfiguration config;
  config.minimumDetectableEffect = 1.0;
  config.minSamples = 1;

  PolicyLifecycleManager manager(config, ledger, policy);
  manager.registerBaseline("live-1", "1.0.0", timestampAt(0));
  manager.registerCandidate("cand-1", "2.0.0", timestampAt(1));
  manager.startCanary("cand-1", timestampAt(2));
  manager.recordMetric("cand-1", 0.4, timestampAt(3));
  manager.recordMetric("cand-1", 0.6, timestampAt(4));

  const LifecycleSnapshot original = manager.getSnapshot();
  const LifecycleSnapshot decoded = SnapshotCodec::decodeLifecycle(SnapshotCodec::encodeLifecycle(original));

  REQUIRE(decoded.nextTestIndex == original.nextTestIndex);
  REQUIRE(decoded.records.size() == 2);
  REQUIRE(decoded.records[1].status == LifecycleStatus::Canary);
  REQUIRE(decoded.records[1].metrics.getCount() == 2);
  REQUIRE(decoded.records[1].metrics.getMean() == original.records[1].metrics.getMean());
  REQUIRE(decoded.records[0].promotedAt.is_not_a_date_time());
  REQUIRE(decoded.auditTrail.size() == original.auditTrail.size());
  REQUIRE(decoded.auditTrail.back().to == LifecycleStatus::Canary);

  REQUIRE(decoded.activeTests.size() == 1);
  const StageTestSnapshot& test = decoded.activeTests[0];
  REQUIRE(test.testId == "cand-1/canary");
  REQUIRE(test.config.model == LikelihoodModel::GaussianKnownVariance);
  REQUIRE(test.config.mu1 == Approx(1.0));
  REQUIRE(test.state.nSamples == 2);
  REQUIRE(test.state.allocation == AllocationStatus::Granted);
  REQUIRE(test.state.sumOfSquares == original.activeTests[0].state.sumOfSquares);

  PolicyLifecycleManager restored(config, ledger, policy);
  restored.restoreSnapshot(decoded);
  REQUIRE(restored.getRecord("cand-1")->status == LifecycleStatus::Canary);
}
