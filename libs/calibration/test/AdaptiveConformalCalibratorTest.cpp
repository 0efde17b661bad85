// AdaptiveConformalCalibratorTest.cpp
//
// Unit tests for AdaptiveConformalCalibrator:
//  - normal reference quantile before enough scores, estimator after
//  - alpha lift from transitions and instability only widens intervals
//  - signed controller: covered forecasts tighten, misses widen
//  - alpha and coverage bounds
//  - transition inflation and its cooldown
//  - snapshot restore and the AR(1) regime-shift scenario

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

#include "AdaptiveConformalCalibrator.h"
#include "NormalQuantile.h"
#include "RiskGovernanceException.h"
#include "TestUtils.h"

using namespace mkc_riskgov;
using Catch::Approx;

TEST_CASE("CalibratorConfiguration: validation", "[AdaptiveConformalCalibrator][Configuration]")
{
  CalibratorConfiguration config;
  REQUIRE_NOTHROW(config.validate());

  SECTION("alphaBase outside the bounds")
    {
      config.alphaMin = 0.15;
      REQUIRE_THROWS_AS(config.validate(), ConfigurationException);
    }

  SECTION("inverted bounds")
    {
      config.alphaMin = 0.4;
      config.alphaMax = 0.3;
      REQUIRE_THROWS_AS(AdaptiveConformalCalibrator(config), ConfigurationException);
    }

  SECTION("inflation ceiling must exceed 1")
    {
      config.inflationCeiling = 1.0;
      REQUIRE_THROWS_AS(config.validate(), ConfigurationException);
    }
}

TEST_CASE("AdaptiveConformalCalibrator: normal reference before calibration", "[AdaptiveConformalCalibrator]")
{
  AdaptiveConformalCalibrator calibrator;

  const IntervalPrediction p = calibrator.predictInterval(10.0, 2.0, false, 0.0);
  const double z = detail::compute_normal_critical_value(0.9);

  REQUIRE(p.alphaUsed == Approx(0.10));
  REQUIRE(p.quantile == Approx(z));
  REQUIRE(p.lower == Approx(10.0 - 2.0 * z));
  REQUIRE(p.upper == Approx(10.0 + 2.0 * z));
  REQUIRE(p.inflation == 1.0);
  REQUIRE(calibrator.getCurrentAlpha() == Approx(0.10));
}

TEST_CASE("AdaptiveConformalCalibrator: alpha lift widens the interval", "[AdaptiveConformalCalibrator]")
{
  AdaptiveConformalCalibrator calibrator;

  SECTION("transition flag")
    {
      const IntervalPrediction calm = calibrator.predictInterval(0.0, 1.0, false, 0.0);
      const IntervalPrediction transition = calibrator.predictInterval(0.0, 1.0, true, 0.0);

      REQUIRE(transition.alphaUsed == Approx(0.12));
      REQUIRE(transition.quantile == Approx(detail::compute_normal_critical_value(0.92)));
      REQUIRE(transition.width() > calm.width());
    }

  SECTION("alpha and width are monotone in aci_ema")
    {
      const std::vector<double> levels = {0.0, 0.05, 0.1, 0.5, 1.0, 2.0, 10.0};
      double lastAlpha = 0.0;
      double lastWidth = 0.0;

      for (double aci : levels)
	{
	  const IntervalPrediction p = calibrator.predictInterval(0.0, 1.0, false, aci);
	  REQUIRE(p.alphaUsed >= lastAlpha);
	  REQUIRE(p.width() >= lastWidth);
	  REQUIRE(p.alphaUsed <= calibrator.getConfiguration().alphaMax);
	  lastAlpha = p.alphaUsed;
	  lastWidth = p.width();
	}

      REQUIRE(lastAlpha == Approx(0.30));
    }

  SECTION("negative or NaN aci_ema counts as zero")
    {
      const IntervalPrediction base = calibrator.predictInterval(0.0, 1.0, false, 0.0);
      REQUIRE(calibrator.predictInterval(0.0, 1.0, false, -3.0).width() == Approx(base.width()));
      REQUIRE(calibrator.predictInterval(0.0, 1.0, false, std::numeric_limits<double>::quiet_NaN()).width() ==
	      Approx(base.width()));
    }
}

TEST_CASE("AdaptiveConformalCalibrator: controller sign", "[AdaptiveConformalCalibrator][Regression]")
{
  AdaptiveConformalCalibrator calibrator;

  SECTION("a covered forecast tightens")
    {
      const IntervalPrediction p = calibrator.predictInterval(0.0, 1.0, false, 0.0);
      const CalibrationUpdate u = calibrator.onObservation(0.0, p);

      REQUIRE(u.hit);
      REQUIRE(u.coverageError == Approx(0.1));
      REQUIRE(calibrator.getAlphaTarget() == Approx(0.1002));
      REQUIRE(calibrator.getMissStreak() == 0);
    }

  SECTION("a miss widens")
    {
      const IntervalPrediction p = calibrator.predictInterval(0.0, 1.0, false, 0.0);
      const CalibrationUpdate u = calibrator.onObservation(100.0, p);

      REQUIRE_FALSE(u.hit);
      REQUIRE(u.score == Approx(100.0));
      REQUIRE(calibrator.getAlphaTarget() == Approx(0.0982));
      REQUIRE(calibrator.getMissStreak() == 1);
    }

  SECTION("transition-flagged predictions use the faster rate")
    {
      const IntervalPrediction p = calibrator.predictInterval(0.0, 1.0, true, 0.0);
      calibrator.onObservation(100.0, p);
      REQUIRE(calibrator.getAlphaTarget() == Approx(0.1 - 0.01 * 0.9));
    }
}

TEST_CASE("AdaptiveConformalCalibrator: alpha and coverage stay bounded", "[AdaptiveConformalCalibrator]")
{
  AdaptiveConformalCalibrator calibrator;
  const CalibratorConfiguration& config = calibrator.getConfiguration();

  SECTION("persistent misses drive alpha_target to the floor")
    {
      for (int i = 0; i < 2000; ++i)
	{
	  const IntervalPrediction p = calibrator.predictInterval(0.0, 1.0, false, 0.0);
	  calibrator.onObservation(1000.0, p);
	  REQUIRE(calibrator.getAlphaTarget() >= config.alphaMin);
	  REQUIRE(calibrator.getCoverageEma() >= 0.0);
	}

      REQUIRE(calibrator.getAlphaTarget() == Approx(config.alphaMin));
      REQUIRE(calibrator.getMissStreak() == 2000);
    }

  SECTION("persistent coverage drives alpha_target to the ceiling")
    {
      for (int i = 0; i < 5000; ++i)
	{
	  const IntervalPrediction p = calibrator.predictInterval(0.0, 1.0, false, 0.0);
	  calibrator.onObservation(0.0, p);
	  REQUIRE(calibrator.getAlphaTarget() <= config.alphaMax);
	  REQUIRE(calibrator.getCoverageEma() <= 1.0);
	}

      REQUIRE(calibrator.getAlphaTarget() == Approx(config.alphaMax));
    }
}

TEST_CASE("AdaptiveConformalCalibrator: score estimator replaces the normal reference",
	  "[AdaptiveConformalCalibrator]")
{
  AdaptiveConformalCalibrator calibrator;

  // Every residual is half a sigma
  for (int i = 0; i < 99; ++i)
    {
      const IntervalPrediction p = calibrator.predictInterval(0.0, 1.0, false, 0.0);
      calibrator.onObservation(0.5, p);
    }

  REQUIRE(calibrator.predictInterval(0.0, 1.0, false, 0.0).quantile > 1.0);

  const IntervalPrediction p = calibrator.predictInterval(0.0, 1.0, false, 0.0);
  calibrator.onObservation(0.5, p);
  REQUIRE(calibrator.getScoreCount() == 100);

  const IntervalPrediction calibrated = calibrator.predictInterval(3.0, 2.0, false, 0.0);
  REQUIRE(calibrated.quantile == Approx(0.5));
  REQUIRE(calibrated.lower == Approx(2.0));
  REQUIRE(calibrated.upper == Approx(4.0));
}

TEST_CASE("AdaptiveConformalCalibrator: a small aci_ema never narrows the interval after a refresh",
	  "[AdaptiveConformalCalibrator][Regression]")
{
  // Volatility doubles at 400; alpha_target drifts and the estimator is rebuilt
  const auto series = generateRegimeShiftAr1(17, 3000, 400);
  AdaptiveConformalCalibrator calibrator;

  double trackedProbability = calibrator.getState().quantileEstimatorState.probability;
  std::size_t refreshes = 0;

  for (const auto& f : series)
    {
      const IntervalPrediction nudged = calibrator.predictInterval(f.point, f.sigma, false, 1e-6);
      const IntervalPrediction p = calibrator.predictInterval(f.point, f.sigma, false, 0.0);

      REQUIRE(nudged.alphaUsed >= p.alphaUsed);
      REQUIRE(nudged.width() >= p.width());

      calibrator.onObservation(f.observed, p);

      const double probability = calibrator.getState().quantileEstimatorState.probability;
      if (probability != trackedProbability)
	{
	  ++refreshes;
	  trackedProbability = probability;

	  // Straight after a rebuild the estimator is asked for exactly its own level
	  const IntervalPrediction atTarget = calibrator.predictInterval(1.0, 1.0, false, 0.0);
	  const IntervalPrediction above = calibrator.predictInterval(1.0, 1.0, false, 1e-6);
	  REQUIRE(above.width() >= atTarget.width());
	}
    }

  REQUIRE(refreshes > 0);
}

TEST_CASE("AdaptiveConformalCalibrator: transition inflation and cooldown", "[AdaptiveConformalCalibrator]")
{
  AdaptiveConformalCalibrator calibrator;

  for (int i = 0; i < 20; ++i)
    {
      const IntervalPrediction p = calibrator.predictInterval(0.0, 1.0, false, 0.0);
      REQUIRE_FALSE(calibrator.onObservation(1.0, p).spikeDetected);
    }

  // Score 10 against a recent mean of 1: threshold 4, inflation capped at 1.25
  const IntervalPrediction before = calibrator.predictInterval(0.0, 1.0, false, 0.0);
  REQUIRE(calibrator.onObservation(10.0, before).spikeDetected);
  REQUIRE(calibrator.getInflationFactor() == Approx(1.25));
  REQUIRE(calibrator.getCooldownCounter() == 25);

  const IntervalPrediction inflated = calibrator.predictInterval(0.0, 1.0, false, 0.0);
  REQUIRE(inflated.inflation == Approx(1.25));
  REQUIRE(inflated.width() == Approx(2.0 * 1.25 * inflated.quantile));

  SECTION("a second spike during the cooldown does not re-arm")
    {
      calibrator.onObservation(50.0, inflated);
      REQUIRE(calibrator.getCooldownCounter() == 24);
    }

  SECTION("inflation is released when the cooldown ends")
    {
      for (int i = 0; i < 24; ++i)
	{
	  const IntervalPrediction p = calibrator.predictInterval(0.0, 1.0, false, 0.0);
	  calibrator.onObservation(1.0, p);
	}

      REQUIRE(calibrator.getInflationFactor() == Approx(1.25));
      REQUIRE(calibrator.getCooldownCounter() == 1);

      const IntervalPrediction p = calibrator.predictInterval(0.0, 1.0, false, 0.0);
      calibrator.onObservation(1.0, p);
      REQUIRE(calibrator.getCooldownCounter() == 0);
      REQUIRE(calibrator.getInflationFactor() == 1.0);
    }
}

TEST_CASE("AdaptiveConformalCalibrator: instability excess", "[AdaptiveConformalCalibrator]")
{
  AdaptiveConformalCalibrator calibrator;
  REQUIRE(calibrator.getInstabilityExcess() == 0.0);

  for (int i = 0; i < 40; ++i)
    {
      const IntervalPrediction p = calibrator.predictInterval(0.0, 1.0, false, 0.0);
      calibrator.onObservation(5.0, p);
    }

  REQUIRE(calibrator.getInstabilityExcess() == Approx(5.0 - 1.25).margin(1e-3));
}

TEST_CASE("AdaptiveConformalCalibrator: invalid input leaves the state unchanged", "[AdaptiveConformalCalibrator]")
{
  AdaptiveConformalCalibrator calibrator;
  const IntervalPrediction p = calibrator.predictInterval(0.0, 1.0, false, 0.0);
  const CalibrationState before = calibrator.getState();

  REQUIRE_THROWS_AS(calibrator.predictInterval(0.0, 0.0, false, 0.0), InvalidInputException);
  REQUIRE_THROWS_AS(calibrator.predictInterval(0.0, -1.0, false, 0.0), InvalidInputException);
  REQUIRE_THROWS_AS(calibrator.predictInterval(std::numeric_limits<double>::infinity(), 1.0, false, 0.0),
		    InvalidInputException);
  REQUIRE_THROWS_AS(calibrator.onObservation(std::numeric_limits<double>::quiet_NaN(), p),
		    InvalidInputException);

  IntervalPrediction broken = p;
  broken.sigmaEffective = 0.0;
  REQUIRE_THROWS_AS(calibrator.onObservation(0.0, broken), InvalidInputException);

  const CalibrationState after = calibrator.getState();
  REQUIRE(after.alphaTarget == before.alphaTarget);
  REQUIRE(after.nObservations == 0);
  REQUIRE(after.scoreWindow.empty());
}

TEST_CASE("AdaptiveConformalCalibrator: restore continues identically", "[AdaptiveConformalCalibrator][Persistence]")
{
  const auto series = generateRegimeShiftAr1(7, 400, 200);
  AdaptiveConformalCalibrator original;

  for (std::size_t t = 0; t < 300; ++t)
    {
      const auto& f = series[t];
      original.onObservation(f.observed, original.predictInterval(f.point, f.sigma, f.transition, 0.0));
    }

  AdaptiveConformalCalibrator restored;
  restored.restoreState(original.getState());

  for (std::size_t t = 300; t < series.size(); ++t)
    {
      const auto& f = series[t];
      const IntervalPrediction a = original.predictInterval(f.point, f.sigma, f.transition, 0.0);
      const IntervalPrediction b = restored.predictInterval(f.point, f.sigma, f.transition, 0.0);

      REQUIRE(a.lower == b.lower);
      REQUIRE(a.upper == b.upper);
      REQUIRE(original.onObservation(f.observed, a).hit == restored.onObservation(f.observed, b).hit);
    }

  REQUIRE(original.getAlphaTarget() == restored.getAlphaTarget());
  REQUIRE(original.getCoverageEma() == restored.getCoverageEma());

  SECTION("states outside the configured bounds are rejected")
    {
      CalibrationState bad = original.getState();
      bad.alphaTarget = 0.5;
      REQUIRE_THROWS_AS(restored.restoreState(bad), std::invalid_argument);

      bad = original.getState();
      bad.inflationFactor = 3.0;
      REQUIRE_THROWS_AS(restored.restoreState(bad), std::invalid_argument);

      REQUIRE(restored.getAlphaTarget() == original.getAlphaTarget());
    }
}

TEST_CASE("AdaptiveConformalCalibrator: AR(1) regime shift keeps coverage on target",
	  "[AdaptiveConformalCalibrator][Scenario]")
{
  // 1000 observations, volatility doubles at 500, transition flagged for 10 cycles
  const auto series = generateRegimeShiftAr1(42, 1000, 500);
  AdaptiveConformalCalibrator calibrator;
  const CalibratorConfiguration& config = calibrator.getConfiguration();

  double deviationSum = 0.0;
  std::size_t deviationCount = 0;

  for (std::size_t t = 0; t < series.size(); ++t)
    {
      const auto& f = series[t];
      const IntervalPrediction p = calibrator.predictInterval(f.point, f.sigma, f.transition, 0.0);

      REQUIRE(p.lower <= p.point);
      REQUIRE(p.point <= p.upper);
      REQUIRE(p.alphaUsed >= config.alphaMin);
      REQUIRE(p.alphaUsed <= config.alphaMax);

      calibrator.onObservation(f.observed, p);

      REQUIRE(calibrator.getCoverageEma() >= 0.0);
      REQUIRE(calibrator.getCoverageEma() <= 1.0);

      if (t >= 700)
	{
	  deviationSum += std::fabs(calibrator.getCoverageEma() - calibrator.getCoverageTarget());
	  ++deviationCount;
	}
    }

  REQUIRE(std::fabs(calibrator.getCoverageEma() - calibrator.getCoverageTarget()) <= 0.03);
  REQUIRE(deviationSum / static_cast<double>(deviationCount) <= 0.03);
}
