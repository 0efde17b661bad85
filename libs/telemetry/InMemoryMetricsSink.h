// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RISKGOV_IN_MEMORY_METRICS_SINK_H
#define __RISKGOV_IN_MEMORY_METRICS_SINK_H 1

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "IMetricsSink.h"

namespace mkc_riskgov
{
  enum class MetricType
  {
    Counter,
    Gauge,
    Histogram
  };

  struct HistogramData
  {
    std::vector<double> upperBounds;		// ascending, +Inf implied
    std::vector<std::uint64_t> bucketCounts;	// non-cumulative, size upperBounds + 1
    std::uint64_t count = 0;
    double sum = 0.0;
  };

  /**
   * @brief One labelled series as held by the sink. Labels are sorted by name.
   */
  struct MetricSeries
  {
    std::string name;
    MetricType type;
    MetricLabels labels;
    double value;		// counter total or gauge value
    HistogramData histogram;	// only for MetricType::Histogram
  };

  /**
   * @brief Thread-safe aggregating sink.
   *
   * Holds the current value of every series written to it. Tests query it
   * directly; PrometheusTextFormatter renders it for export.
   */
  class InMemoryMetricsSink : public IMetricsSink
  {
  public:
    InMemoryMetricsSink();

    void incrementCounter(const std::string& name,
			  const MetricLabels& labels,
			  double delta = 1.0) override;

    void setGauge(const std::string& name,
		  const MetricLabels& labels,
		  double value) override;

    void observeHistogram(const std::string& name,
			  const MetricLabels& labels,
			  double value) override;

    /**
     * @brief Bucket upper bounds for a histogram name. Applies to series
     * created after the call.
     * @throws std::invalid_argument if bounds are empty or not strictly ascending
     */
    void setHistogramBuckets(const std::string& name, const std::vector<double>& upperBounds);

    // 0 when the series does not exist
    double getCounter(const std::string& name, const MetricLabels& labels = {}) const;

    // Sum of a counter across all label sets
    double getCounterTotal(const std::string& name) const;

    std::optional<double> getGauge(const std::string& name, const MetricLabels& labels = {}) const;

    std::optional<HistogramData> getHistogram(const std::string& name,
					      const MetricLabels& labels = {}) const;

    // Consistent copy of every series, ordered by name then labels
    std::vector<MetricSeries> snapshot() const;

    void clear();

  private:
    using SeriesKey = std::pair<std::string, MetricLabels>;

    static MetricLabels canonical(const MetricLabels& labels);
    MetricSeries& findOrCreate(const std::string& name, const MetricLabels& labels, MetricType type);
    const MetricSeries* find(const std::string& name, const MetricLabels& labels) const;

  private:
    mutable std::mutex mMutex;
    std::map<SeriesKey, MetricSeries> mSeries;
    std::map<std::string, std::vector<double>> mHistogramBuckets;
    std::vector<double> mDefaultBuckets;
  };
}

#endif
