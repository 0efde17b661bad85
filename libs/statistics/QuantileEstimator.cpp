// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "QuantileEstimator.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace mkc_riskgov
{
  namespace
  {
    constexpr std::size_t kMinimumWarmup = 5;
  }

  QuantileEstimator::QuantileEstimator(double probability,
				       std::size_t warmupSize,
				       double safeDefault)
    : mState()
  {
    if (!(probability > 0.0 && probability < 1.0))
      throw std::invalid_argument("QuantileEstimator: probability must be in (0, 1)");

    if (warmupSize < kMinimumWarmup)
      throw std::invalid_argument("QuantileEstimator: warmup size must be >= 5");

    mState.probability = probability;
    mState.warmupSize = warmupSize;
    mState.safeDefault = safeDefault;
    mState.warmupBuffer.reserve(warmupSize);

    const double p = probability;
    mState.increments = {{0.0, p / 2.0, p, (1.0 + p) / 2.0, 1.0}};
  }

  void QuantileEstimator::observe(double value)
  {
    if (!std::isfinite(value))
      return;

    if (!mState.markersInitialized)
      {
	auto& buffer = mState.warmupBuffer;
	buffer.insert(std::upper_bound(buffer.begin(), buffer.end(), value), value);
	++mState.count;

	if (buffer.size() >= mState.warmupSize)
	  initializeMarkers();

	return;
      }

    auto& q = mState.heights;
    auto& n = mState.positions;

    // Locate the cell containing the new value, extending the extremes
    std::size_t k = 0;
    if (value < q[0])
      {
	q[0] = value;
	k = 0;
      }
    else if (value >= q[4])
      {
	q[4] = value;
	k = 3;
      }
    else
      {
	for (std::size_t i = 1; i < 5; ++i)
	  {
	    if (value < q[i])
	      {
		k = i - 1;
		break;
	      }
	  }
      }

    for (std::size_t i = k + 1; i < 5; ++i)
      ++n[i];

    for (std::size_t i = 0; i < 5; ++i)
      mState.desiredPositions[i] += mState.increments[i];

    // Adjust the three middle markers
    for (std::size_t i = 1; i < 4; ++i)
      {
	const double d = mState.desiredPositions[i] - static_cast<double>(n[i]);

	if ((d >= 1.0 && n[i + 1] - n[i] > 1) || (d <= -1.0 && n[i - 1] - n[i] < -1))
	  {
	    const int ds = (d > 0.0) ? 1 : -1;
	    const double candidate = parabolic(i, ds);

	    if (q[i - 1] < candidate && candidate < q[i + 1])
	      q[i] = candidate;
	    else
	      q[i] = linear(i, ds);

	    n[i] += ds;
	  }
      }

    ++mState.count;
  }

  double QuantileEstimator::estimate(double q) const
  {
    if (std::isnan(q))
      throw std::invalid_argument("QuantileEstimator: quantile level is NaN");

    if (mState.count == 0)
      return mState.safeDefault;

    const double level = std::min(1.0, std::max(0.0, q));

    if (!mState.markersInitialized)
      return empiricalQuantile(level);

    return markerQuantile(level);
  }

  double QuantileEstimator::estimate() const
  {
    return estimate(mState.probability);
  }

  void QuantileEstimator::restoreState(const QuantileEstimatorState& state)
  {
    validateState(state);
    mState = state;
  }

  void QuantileEstimator::initializeMarkers()
  {
    const auto& sorted = mState.warmupBuffer;
    const std::size_t last = sorted.size() - 1;

    std::array<std::size_t, 5> index;
    for (std::size_t i = 0; i < 5; ++i)
      index[i] = static_cast<std::size_t>(std::llround(static_cast<double>(last) * mState.increments[i]));

    // Markers must occupy distinct order statistics, anchored at both ends
    index[0] = 0;
    for (std::size_t i = 1; i < 4; ++i)
      index[i] = std::max(index[i], index[i - 1] + 1);

    index[4] = last;
    for (std::size_t i = 3; i > 0; --i)
      index[i] = std::min(index[i], index[i + 1] - 1);

    for (std::size_t i = 0; i < 5; ++i)
      {
	mState.heights[i] = sorted[index[i]];
	mState.positions[i] = static_cast<std::int64_t>(index[i]) + 1;
	mState.desiredPositions[i] = 1.0 + static_cast<double>(last) * mState.increments[i];
      }

    mState.markersInitialized = true;
    mState.warmupBuffer.clear();
    mState.warmupBuffer.shrink_to_fit();
  }

  double QuantileEstimator::empiricalQuantile(double q) const
  {
    const auto& sorted = mState.warmupBuffer;

    if (sorted.size() == 1)
      return sorted.front();

    const double h = q * static_cast<double>(sorted.size() - 1);
    const std::size_t lo = static_cast<std::size_t>(std::floor(h));
    const std::size_t hi = std::min(lo + 1, sorted.size() - 1);

    return std::min(sorted[hi], sorted[lo] + (h - static_cast<double>(lo)) * (sorted[hi] - sorted[lo]));
  }

  double QuantileEstimator::markerQuantile(double q) const
  {
    const auto& heights = mState.heights;

    const double denominator = static_cast<double>(mState.count - 1);

    std::array<double, 5> rank;
    for (std::size_t i = 0; i < 5; ++i)
      rank[i] = static_cast<double>(mState.positions[i] - 1) / denominator;

    // The centre marker estimates the p-quantile, so it sits at rank p; the
    // neighbours are clamped around it to keep the ranks ordered
    const double p = mState.probability;
    rank[2] = p;
    rank[1] = std::min(rank[1], p);
    rank[3] = std::max(rank[3], p);

    if (q <= rank[0])
      return heights[0];

    // A level on a rank returns that marker's height exactly
    for (std::size_t i = 1; i < 5; ++i)
      {
	if (q < rank[i])
	  {
	    const double w = (q - rank[i - 1]) / (rank[i] - rank[i - 1]);
	    return std::min(heights[i], heights[i - 1] + w * (heights[i] - heights[i - 1]));
	  }
      }

    return heights[4];
  }

  double QuantileEstimator::parabolic(std::size_t i, int d) const
  {
    const auto& q = mState.heights;
    const double n0 = static_cast<double>(mState.positions[i - 1]);
    const double n1 = static_cast<double>(mState.positions[i]);
    const double n2 = static_cast<double>(mState.positions[i + 1]);
    const double dd = static_cast<double>(d);

    return q[i] + dd / (n2 - n0) *
      ((n1 - n0 + dd) * (q[i + 1] - q[i]) / (n2 - n1) +
       (n2 - n1 - dd) * (q[i] - q[i - 1]) / (n1 - n0));
  }

  double QuantileEstimator::linear(std::size_t i, int d) const
  {
    const auto& q = mState.heights;
    const std::size_t j = (d > 0) ? i + 1 : i - 1;

    return q[i] + static_cast<double>(d) * (q[j] - q[i]) /
      static_cast<double>(mState.positions[j] - mState.positions[i]);
  }

  void QuantileEstimator::validateState(const QuantileEstimatorState& state)
  {
    if (!(state.probability > 0.0 && state.probability < 1.0))
      throw std::invalid_argument("QuantileEstimator: restored probability must be in (0, 1)");

    if (state.warmupSize < kMinimumWarmup)
      throw std::invalid_argument("QuantileEstimator: restored warmup size must be >= 5");

    if (!state.markersInitialized)
      {
	if (state.warmupBuffer.size() != state.count || state.count >= state.warmupSize)
	  throw std::invalid_argument("QuantileEstimator: restored warm-up buffer does not match count");

	if (!std::is_sorted(state.warmupBuffer.begin(), state.warmupBuffer.end()))
	  throw std::invalid_argument("QuantileEstimator: restored warm-up buffer is not sorted");

	return;
      }

    if (state.count < state.warmupSize)
      throw std::invalid_argument("QuantileEstimator: restored marker state has too few observations");

    for (std::size_t i = 1; i < 5; ++i)
      {
	if (state.positions[i] <= state.positions[i - 1])
	  throw std::invalid_argument("QuantileEstimator: restored marker positions not increasing");

	if (state.heights[i] < state.heights[i - 1])
	  throw std::invalid_argument("QuantileEstimator: restored marker heights not ordered");
      }

    if (state.positions[0] != 1 || state.positions[4] != static_cast<std::int64_t>(state.count))
      throw std::invalid_argument("QuantileEstimator: restored extreme markers inconsistent with count");
  }
}
