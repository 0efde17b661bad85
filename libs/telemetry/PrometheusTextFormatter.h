// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RISKGOV_PROMETHEUS_TEXT_FORMATTER_H
#define __RISKGOV_PROMETHEUS_TEXT_FORMATTER_H 1

#include <string>
#include "InMemoryMetricsSink.h"

namespace mkc_riskgov
{
  /**
   * @brief Renders the contents of an InMemoryMetricsSink in the Prometheus
   * text exposition format (version 0.0.4).
   *
   * One "# TYPE" line per metric name followed by its series. Histograms are
   * written as cumulative _bucket series with an le label, plus _sum and
   * _count.
   */
  class PrometheusTextFormatter
  {
  public:
    static std::string render(const InMemoryMetricsSink& sink);

    // Label value escaping: backslash, double quote and newline
    static std::string escapeLabelValue(const std::string& value);

  private:
    static std::string formatLabels(const MetricLabels& labels);
    static std::string formatLabels(const MetricLabels& labels,
				    const std::string& extraName,
				    const std::string& extraValue);
    static std::string formatValue(double value);
  };
}

#endif
