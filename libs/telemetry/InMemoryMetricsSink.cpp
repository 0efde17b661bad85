// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "InMemoryMetricsSink.h"
#include <algorithm>
#include <stdexcept>
#include "MetricNames.h"

namespace mkc_riskgov
{
  InMemoryMetricsSink::InMemoryMetricsSink()
    : mMutex(),
      mSeries(),
      mHistogramBuckets(),
      mDefaultBuckets{0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0}
  {
    mHistogramBuckets[metric_names::kLatencyMs] =
      {1.0, 2.0, 5.0, 10.0, 25.0, 50.0, 100.0, 150.0, 250.0, 500.0, 1000.0};
    mHistogramBuckets[metric_names::kSurprisal] =
      {0.1, 0.25, 0.5, 0.75, 1.0, 1.5, 2.0, 3.0, 5.0};
    mHistogramBuckets[metric_names::kRelativeIntervalWidth] =
      {0.001, 0.0025, 0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0};
  }

  void InMemoryMetricsSink::incrementCounter(const std::string& name,
					     const MetricLabels& labels,
					     double delta)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    findOrCreate(name, labels, MetricType::Counter).value += delta;
  }

  void InMemoryMetricsSink::setGauge(const std::string& name,
				     const MetricLabels& labels,
				     double value)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    findOrCreate(name, labels, MetricType::Gauge).value = value;
  }

  void InMemoryMetricsSink::observeHistogram(const std::string& name,
					     const MetricLabels& labels,
					     double value)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    HistogramData& h = findOrCreate(name, labels, MetricType::Histogram).histogram;

    const auto it = std::lower_bound(h.upperBounds.begin(), h.upperBounds.end(), value);
    ++h.bucketCounts[static_cast<std::size_t>(it - h.upperBounds.begin())];
    ++h.count;
    h.sum += value;
  }

  void InMemoryMetricsSink::setHistogramBuckets(const std::string& name,
						const std::vector<double>& upperBounds)
  {
    if (upperBounds.empty())
      throw std::invalid_argument("InMemoryMetricsSink: histogram buckets must not be empty");

    for (std::size_t i = 1; i < upperBounds.size(); ++i)
      {
	if (!(upperBounds[i] > upperBounds[i - 1]))
	  throw std::invalid_argument("InMemoryMetricsSink: histogram buckets must be strictly ascending");
      }

    std::lock_guard<std::mutex> lock(mMutex);
    mHistogramBuckets[name] = upperBounds;
  }

  double InMemoryMetricsSink::getCounter(const std::string& name, const MetricLabels& labels) const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    const MetricSeries* series = find(name, labels);
    return (series && series->type == MetricType::Counter) ? series->value : 0.0;
  }

  double InMemoryMetricsSink::getCounterTotal(const std::string& name) const
  {
    std::lock_guard<std::mutex> lock(mMutex);

    double total = 0.0;
    for (const auto& entry : mSeries)
      {
	if (entry.second.name == name && entry.second.type == MetricType::Counter)
	  total += entry.second.value;
      }

    return total;
  }

  std::optional<double> InMemoryMetricsSink::getGauge(const std::string& name,
						      const MetricLabels& labels) const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    const MetricSeries* series = find(name, labels);

    if (series && series->type == MetricType::Gauge)
      return series->value;

    return std::nullopt;
  }

  std::optional<HistogramData> InMemoryMetricsSink::getHistogram(const std::string& name,
								 const MetricLabels& labels) const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    const MetricSeries* series = find(name, labels);

    if (series && series->type == MetricType::Histogram)
      return series->histogram;

    return std::nullopt;
  }

  std::vector<MetricSeries> InMemoryMetricsSink::snapshot() const
  {
    std::lock_guard<std::mutex> lock(mMutex);

    std::vector<MetricSeries> result;
    result.reserve(mSeries.size());
    for (const auto& entry : mSeries)
      result.push_back(entry.second);

    return result;
  }

  void InMemoryMetricsSink::clear()
  {
    std::lock_guard<std::mutex> lock(mMutex);
    mSeries.clear();
  }

  MetricLabels InMemoryMetricsSink::canonical(const MetricLabels& labels)
  {
    MetricLabels sorted(labels);
    std::sort(sorted.begin(), sorted.end());
    return sorted;
  }

  MetricSeries& InMemoryMetricsSink::findOrCreate(const std::string& name,
						  const MetricLabels& labels,
						  MetricType type)
  {
    SeriesKey key(name, canonical(labels));
    auto it = mSeries.find(key);

    if (it != mSeries.end())
      {
	if (it->second.type != type)
	  throw std::invalid_argument("InMemoryMetricsSink: metric " + name +
				      " already registered with a different type");
	return it->second;
      }

    MetricSeries series;
    series.name = name;
    series.type = type;
    series.labels = key.second;
    series.value = 0.0;

    if (type == MetricType::Histogram)
      {
	const auto bucketIt = mHistogramBuckets.find(name);
	series.histogram.upperBounds = (bucketIt != mHistogramBuckets.end()) ?
	  bucketIt->second : mDefaultBuckets;
	series.histogram.bucketCounts.assign(series.histogram.upperBounds.size() + 1, 0);
      }

    return mSeries.emplace(std::move(key), std::move(series)).first->second;
  }

  const MetricSeries* InMemoryMetricsSink::find(const std::string& name,
						const MetricLabels& labels) const
  {
    const auto it = mSeries.find(SeriesKey(name, canonical(labels)));
    return (it != mSeries.end()) ? &it->second : nullptr;
  }
}
