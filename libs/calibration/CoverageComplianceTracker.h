// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RISKGOV_COVERAGE_COMPLIANCE_TRACKER_H
#define __RISKGOV_COVERAGE_COMPLIANCE_TRACKER_H 1

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <boost/circular_buffer.hpp>

namespace mkc_riskgov
{
  struct CoverageComplianceConfiguration
  {
    std::size_t windowSize = 200;
    double emaBeta = 0.02;
    double blend = 0.5;			// weight of the window compliance
    double deficitTolerance = 0.05;	// under-coverage that counts as full non-compliance
    double excessTolerance = 0.10;	// over-coverage that counts as full non-compliance

    std::vector<std::string> validationErrors() const;

    // @throws ConfigurationException
    void validate() const;
  };

  struct CoverageComplianceState
  {
    std::vector<bool> windowHits;	// oldest first
    double emaCoverage;
    double lastTargetCoverage;
    std::uint64_t count;
  };

  /**
   * @brief Bounded coverage compliance (BCC) of realized interval coverage
   * against the calibrator's target.
   *
   * The compliance of a coverage rate c against a target t is
   *
   *   1 - min(1, max(0, t - c) / deficitTolerance + max(0, c - t) / excessTolerance)
   *
   * and the published estimate blends the compliance of a rolling window
   * with that of an EMA. Under-coverage is penalized more steeply than
   * over-coverage. With no data the estimate is 1.
   */
  class CoverageComplianceTracker
  {
  public:
    // @throws ConfigurationException if the configuration is invalid
    explicit CoverageComplianceTracker(const CoverageComplianceConfiguration& config =
					 CoverageComplianceConfiguration());

    // @throws InvalidInputException if targetCoverage is not in (0, 1)
    void update(bool hit, double targetCoverage);

    // In [0, 1]
    double getEstimate() const;

    // NaN with no data
    double getWindowCoverage() const;
    double getEmaCoverage() const;

    std::uint64_t getCount() const
    {
      return mCount;
    }

    static double compliance(double coverage,
			     double target,
			     double deficitTolerance,
			     double excessTolerance);

    CoverageComplianceState getState() const;

    // @throws std::invalid_argument if the state is out of range
    void restoreState(const CoverageComplianceState& state);

  private:
    CoverageComplianceConfiguration mConfig;
    boost::circular_buffer<bool> mWindow;
    std::size_t mWindowHits;
    double mEmaCoverage;
    double mLastTarget;
    std::uint64_t mCount;
  };
}

#endif
