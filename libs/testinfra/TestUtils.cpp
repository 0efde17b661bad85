// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "TestUtils.h"
#include <cmath>

using namespace boost::posix_time;

ptime createTimestamp(const std::string& isoString)
{
  return from_iso_extended_string(isoString);
}

ptime timestampAt(std::size_t cycle)
{
  static const ptime base(createTimestamp("2024-03-01T09:30:00"));
  return base + seconds(static_cast<long>(cycle));
}

DeterministicNormalGenerator::DeterministicNormalGenerator(std::uint32_t seed)
  : mEngine(seed),
    mHaveSpare(false),
    mSpare(0.0)
{}

double DeterministicNormalGenerator::nextUniform()
{
  // (k + 0.5) / 2^32 lies strictly inside (0, 1)
  return (static_cast<double>(mEngine()) + 0.5) / 4294967296.0;
}

double DeterministicNormalGenerator::next()
{
  if (mHaveSpare)
    {
      mHaveSpare = false;
      return mSpare;
    }

  const double u1 = nextUniform();
  const double u2 = nextUniform();
  const double radius = std::sqrt(-2.0 * std::log(u1));
  const double theta = 6.283185307179586 * u2;

  mSpare = radius * std::sin(theta);
  mHaveSpare = true;
  return radius * std::cos(theta);
}

std::vector<SyntheticForecast> generateRegimeShiftAr1(std::uint32_t seed,
						      std::size_t n,
						      std::size_t shiftAt,
						      double phi,
						      double volBefore,
						      double volAfter,
						      double lambda,
						      std::size_t transitionFlagLength)
{
  DeterministicNormalGenerator normal(seed);
  std::vector<SyntheticForecast> series;
  series.reserve(n);

  double previous = 0.0;
  double sigmaHat = volBefore;

  for (std::size_t t = 0; t < n; ++t)
    {
      const double vol = (t < shiftAt) ? volBefore : volAfter;
      const double point = phi * previous;
      const double observed = point + normal.next(0.0, vol);
      const bool transition = (t >= shiftAt) && (t < shiftAt + transitionFlagLength);

      series.push_back(SyntheticForecast{point, sigmaHat, observed, transition});

      const double residual = observed - point;
      sigmaHat = std::sqrt(lambda * sigmaHat * sigmaHat + (1.0 - lambda) * residual * residual);
      previous = observed;
    }

  return series;
}
