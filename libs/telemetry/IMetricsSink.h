// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RISKGOV_IMETRICS_SINK_H
#define __RISKGOV_IMETRICS_SINK_H 1

#include <string>
#include <utility>
#include <vector>

namespace mkc_riskgov
{
  // Label name/value pairs. Keep cardinality low: posture, profile, guard,
  // reason, decision. Never order or trade identifiers.
  using MetricLabels = std::vector<std::pair<std::string, std::string>>;

  /**
   * @brief Destination for counters, gauges and histogram observations.
   *
   * Components receive a sink by injection instead of writing to a process
   * wide registry. Export (for example Prometheus text) is performed by a
   * separate adapter reading an InMemoryMetricsSink.
   *
   * Implementations must be safe to call from several decision streams at
   * once.
   */
  class IMetricsSink
  {
  public:
    virtual ~IMetricsSink() = default;

    virtual void incrementCounter(const std::string& name,
				  const MetricLabels& labels,
				  double delta = 1.0) = 0;

    virtual void setGauge(const std::string& name,
			  const MetricLabels& labels,
			  double value) = 0;

    virtual void observeHistogram(const std::string& name,
				  const MetricLabels& labels,
				  double value) = 0;
  };

  /**
   * @brief Sink that discards everything. Default for components built
   * without telemetry.
   */
  class NullMetricsSink : public IMetricsSink
  {
  public:
    void incrementCounter(const std::string&, const MetricLabels&, double) override {}
    void setGauge(const std::string&, const MetricLabels&, double) override {}
    void observeHistogram(const std::string&, const MetricLabels&, double) override {}
  };
}

#endif
