// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RISKGOV_QUANTILE_ESTIMATOR_H
#define __RISKGOV_QUANTILE_ESTIMATOR_H 1

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace mkc_riskgov
{
  /**
   * @brief Complete internal state of a QuantileEstimator.
   *
   * Plain value type so it can be written to and restored from a snapshot
   * without replaying observations.
   */
  struct QuantileEstimatorState
  {
    double probability = 0.9;
    std::size_t warmupSize = 100;
    double safeDefault = 0.0;
    std::uint64_t count = 0;
    bool markersInitialized = false;
    std::vector<double> warmupBuffer;		// sorted, only used before the switch
    std::array<double, 5> heights{{0.0, 0.0, 0.0, 0.0, 0.0}};
    std::array<std::int64_t, 5> positions{{0, 0, 0, 0, 0}};
    std::array<double, 5> desiredPositions{{0.0, 0.0, 0.0, 0.0, 0.0}};
    std::array<double, 5> increments{{0.0, 0.0, 0.0, 0.0, 0.0}};
  };

  /**
   * @brief Bounded memory streaming quantile estimator.
   *
   * Two phases:
   *
   *  1. Warm-up. The first warmupSize values are kept in a sorted buffer and
   *     estimate(q) is the linearly interpolated empirical quantile.
   *
   *  2. Once warmupSize values have been seen the estimator switches
   *     permanently to the P-squared algorithm of Jain and Chlamtac
   *     (CACM 28(10), 1985). The five markers are seeded from the warm-up
   *     buffer at probabilities {0, p/2, p, (1+p)/2, 1} and the buffer is
   *     released. Each observation then costs O(1) time and memory.
   *
   * The middle marker tracks the target probability p. estimate(q) linearly
   * interpolates the marker heights over their realised rank probabilities,
   * with the middle marker placed at p, so the estimate is continuous and
   * non-decreasing in q and estimate(p) is the middle marker height.
   *
   * Before any observation estimate() returns the configured safe default.
   */
  class QuantileEstimator
  {
  public:
    /**
     * @param probability Target probability tracked by the centre marker, in (0, 1).
     * @param warmupSize Number of values held in the sorted warm-up buffer, >= 5.
     * @param safeDefault Value returned by estimate() before any observation.
     *
     * @throws std::invalid_argument if probability is outside (0, 1) or
     *         warmupSize < 5.
     */
    explicit QuantileEstimator(double probability,
			       std::size_t warmupSize = 100,
			       double safeDefault = 0.0);

    /**
     * @brief Ingest one value. Non-finite values are ignored.
     */
    void observe(double value);

    /**
     * @brief Current estimate of the q-th quantile. q is clamped to [0, 1].
     * @throws std::invalid_argument if q is NaN.
     */
    double estimate(double q) const;

    // Estimate at the tracked target probability
    double estimate() const;

    double getProbability() const
    {
      return mState.probability;
    }

    std::uint64_t getCount() const
    {
      return mState.count;
    }

    std::size_t getWarmupSize() const
    {
      return mState.warmupSize;
    }

    // True once the estimator has switched to the five-marker phase
    bool isWarm() const
    {
      return mState.markersInitialized;
    }

    const QuantileEstimatorState& getState() const
    {
      return mState;
    }

    /**
     * @brief Replace the internal state with a previously captured one.
     * @throws std::invalid_argument if the state is internally inconsistent;
     *         the current state is kept in that case.
     */
    void restoreState(const QuantileEstimatorState& state);

  private:
    void initializeMarkers();
    double empiricalQuantile(double q) const;
    double markerQuantile(double q) const;
    double parabolic(std::size_t i, int d) const;
    double linear(std::size_t i, int d) const;

    static void validateState(const QuantileEstimatorState& state);

  private:
    QuantileEstimatorState mState;
  };
}

#endif
