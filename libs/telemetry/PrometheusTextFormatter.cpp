// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "PrometheusTextFormatter.h"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace mkc_riskgov
{
  namespace
  {
    const char* typeName(MetricType type)
    {
      switch (type)
	{
	case MetricType::Counter:
	  return "counter";
	case MetricType::Gauge:
	  return "gauge";
	case MetricType::Histogram:
	  return "histogram";
	}

      return "untyped";
    }
  }

  std::string PrometheusTextFormatter::render(const InMemoryMetricsSink& sink)
  {
    std::ostringstream out;
    std::string currentName;

    for (const MetricSeries& series : sink.snapshot())
      {
	if (series.name != currentName)
	  {
	    out << "# TYPE " << series.name << ' ' << typeName(series.type) << '\n';
	    currentName = series.name;
	  }

	if (series.type != MetricType::Histogram)
	  {
	    out << series.name << formatLabels(series.labels) << ' '
		<< formatValue(series.value) << '\n';
	    continue;
	  }

	const HistogramData& h = series.histogram;
	std::uint64_t cumulative = 0;

	for (std::size_t i = 0; i < h.upperBounds.size(); ++i)
	  {
	    cumulative += h.bucketCounts[i];
	    out << series.name << "_bucket"
		<< formatLabels(series.labels, "le", formatValue(h.upperBounds[i])) << ' '
		<< cumulative << '\n';
	  }

	out << series.name << "_bucket" << formatLabels(series.labels, "le", "+Inf") << ' '
	    << h.count << '\n';
	out << series.name << "_sum" << formatLabels(series.labels) << ' ' << formatValue(h.sum) << '\n';
	out << series.name << "_count" << formatLabels(series.labels) << ' ' << h.count << '\n';
      }

    return out.str();
  }

  std::string PrometheusTextFormatter::escapeLabelValue(const std::string& value)
  {
    std::string escaped;
    escaped.reserve(value.size());

    for (char c : value)
      {
	switch (c)
	  {
	  case '\\':
	    escaped += "\\\\";
	    break;
	  case '"':
	    escaped += "\\\"";
	    break;
	  case '\n':
	    escaped += "\\n";
	    break;
	  default:
	    escaped += c;
	  }
      }

    return escaped;
  }

  std::string PrometheusTextFormatter::formatLabels(const MetricLabels& labels)
  {
    if (labels.empty())
      return std::string();

    std::string text("{");
    for (std::size_t i = 0; i < labels.size(); ++i)
      {
	if (i > 0)
	  text += ',';
	text += labels[i].first + "=\"" + escapeLabelValue(labels[i].second) + "\"";
      }
    text += '}';

    return text;
  }

  std::string PrometheusTextFormatter::formatLabels(const MetricLabels& labels,
						    const std::string& extraName,
						    const std::string& extraValue)
  {
    MetricLabels extended(labels);
    extended.emplace_back(extraName, extraValue);
    return formatLabels(extended);
  }

  std::string PrometheusTextFormatter::formatValue(double value)
  {
    if (std::isnan(value))
      return "NaN";

    if (std::isinf(value))
      return value > 0 ? "+Inf" : "-Inf";

    std::ostringstream out;
    out << std::setprecision(12) << value;
    return out.str();
  }
}
