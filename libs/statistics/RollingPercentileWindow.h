// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RISKGOV_ROLLING_PERCENTILE_WINDOW_H
#define __RISKGOV_ROLLING_PERCENTILE_WINDOW_H 1

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <vector>
#include <boost/circular_buffer.hpp>

namespace mkc_riskgov
{
  /**
   * @brief Fixed capacity window of the most recent values with a
   * winsorized percentile.
   *
   * Values are clipped to the window's own 1st and 99th percentiles before
   * the requested percentile is read, so a single corrupt sample cannot
   * dominate a p95 guard. With fewer than five values the maximum is
   * returned. An empty window yields NaN.
   */
  class RollingPercentileWindow
  {
  public:
    explicit RollingPercentileWindow(std::size_t capacity)
      : mValues(capacity)
    {
      if (capacity == 0)
	throw std::invalid_argument("RollingPercentileWindow: capacity must be > 0");
    }

    // Non-finite values are dropped
    void add(double value)
    {
      if (std::isfinite(value))
	mValues.push_back(value);
    }

    double winsorizedPercentile(double p) const
    {
      if (mValues.empty())
	return std::numeric_limits<double>::quiet_NaN();

      if (mValues.size() < 5)
	return *std::max_element(mValues.begin(), mValues.end());

      std::vector<double> sorted(mValues.begin(), mValues.end());
      std::sort(sorted.begin(), sorted.end());

      const double lo = percentileOfSorted(sorted, 0.01);
      const double hi = percentileOfSorted(sorted, 0.99);

      for (auto& v : sorted)
	v = std::min(hi, std::max(lo, v));

      return percentileOfSorted(sorted, std::min(1.0, std::max(0.0, p)));
    }

    std::size_t size() const
    {
      return mValues.size();
    }

    std::size_t capacity() const
    {
      return mValues.capacity();
    }

    bool empty() const
    {
      return mValues.empty();
    }

    // Oldest first
    std::vector<double> values() const
    {
      return std::vector<double>(mValues.begin(), mValues.end());
    }

    void assign(const std::vector<double>& values)
    {
      mValues.clear();
      for (double v : values)
	add(v);
    }

  private:
    static double percentileOfSorted(const std::vector<double>& sorted, double p)
    {
      const double h = p * static_cast<double>(sorted.size() - 1);
      const std::size_t lo = static_cast<std::size_t>(std::floor(h));
      const std::size_t hi = std::min(lo + 1, sorted.size() - 1);
      return sorted[lo] + (h - static_cast<double>(lo)) * (sorted[hi] - sorted[lo]);
    }

  private:
    boost::circular_buffer<double> mValues;
  };
}

#endif
