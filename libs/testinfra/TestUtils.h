// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RISKGOV_TEST_UTILS_H
#define __RISKGOV_TEST_UTILS_H 1

#include <cstdint>
#include <random>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>

// ISO extended timestamp, e.g. "2024-03-01T09:30:00"
boost::posix_time::ptime createTimestamp(const std::string& isoString);

// Fixed base time plus cycle seconds. Strictly increasing in cycle.
boost::posix_time::ptime timestampAt(std::size_t cycle);

/**
 * Standard normal variates from std::mt19937 via Box-Muller.
 *
 * std::normal_distribution is implementation defined; this generator gives
 * the same sequence for a given seed on every standard library, which lets
 * scenario tests use fixed seeds.
 */
class DeterministicNormalGenerator
{
public:
  explicit DeterministicNormalGenerator(std::uint32_t seed);

  double next();

  double next(double mean, double stddev)
  {
    return mean + stddev * next();
  }

private:
  double nextUniform();

private:
  std::mt19937 mEngine;
  bool mHaveSpare;
  double mSpare;
};

struct SyntheticForecast
{
  double point;
  double sigma;
  double observed;
  bool transition;
};

/**
 * AR(1) series x_t = phi * x_{t-1} + e_t with e_t ~ N(0, vol) where vol
 * switches from volBefore to volAfter at index shiftAt.
 *
 * The synthetic forecaster predicts phi * x_{t-1} and supplies a RiskMetrics
 * style EWMA residual volatility (lambda) as sigma_hat, so it lags the
 * regime shift the way a production model would. The transition flag is
 * raised for transitionFlagLength cycles starting at shiftAt.
 */
std::vector<SyntheticForecast> generateRegimeShiftAr1(std::uint32_t seed,
						      std::size_t n,
						      std::size_t shiftAt,
						      double phi = 0.6,
						      double volBefore = 1.0,
						      double volAfter = 2.0,
						      double lambda = 0.94,
						      std::size_t transitionFlagLength = 10);

#endif
