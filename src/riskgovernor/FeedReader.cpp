#include "FeedReader.h"
#include <exception>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include "csv.h"

namespace riskgovernor {

namespace {

using CsvTrim = io::trim_chars<' ', '\t'>;
using CsvQuote = io::double_quote_escape<',', '"'>;

FeedReaderException rowError(const std::string& filePath, unsigned line, const std::string& what) {
    return FeedReaderException(filePath + ":" + std::to_string(line) + ": " + what);
}

double parseDouble(const std::string& text, const char* column) {
    try {
        return boost::lexical_cast<double>(text);
    } catch (const boost::bad_lexical_cast&) {
        throw FeedReaderException(std::string("column ") + column + ": '" + text + "' is not a number");
    }
}

bool parseFlag(const std::string& text) {
    const std::string lower = boost::algorithm::to_lower_copy(text);
    if (lower.empty() || lower == "0" || lower == "false") {
        return false;
    }
    if (lower == "1" || lower == "true") {
        return true;
    }
    throw FeedReaderException("column regime_transition: '" + text + "' is not a flag");
}

std::vector<double> parseWeights(const std::string& text) {
    std::vector<double> weights;
    if (text.empty()) {
        return weights;
    }

    std::vector<std::string> parts;
    boost::algorithm::split(parts, text, boost::algorithm::is_any_of(";"));
    for (auto& part : parts) {
        boost::algorithm::trim(part);
        weights.push_back(parseDouble(part, "model_confidence"));
    }
    return weights;
}

void requireNonEmpty(const std::string& value, const char* column) {
    if (value.empty()) {
        throw FeedReaderException(std::string("column ") + column + " is empty");
    }
}

} // namespace

boost::posix_time::ptime FeedReader::parseTimestamp(const std::string& text) {
    std::string normalized = boost::algorithm::trim_copy(text);
    if (normalized.size() > 10 && normalized[10] == 'T') {
        normalized[10] = ' ';
    }
    if (!normalized.empty() && (normalized.back() == 'Z' || normalized.back() == 'z')) {
        normalized.pop_back();
    }
    if (normalized.empty()) {
        throw FeedReaderException("timestamp is empty");
    }

    try {
        const boost::posix_time::ptime t = boost::posix_time::time_from_string(normalized);
        if (t.is_special()) {
            throw FeedReaderException("timestamp '" + text + "' is not a point in time");
        }
        return t;
    } catch (const FeedReaderException&) {
        throw;
    } catch (const std::exception&) {
        throw FeedReaderException("timestamp '" + text + "' is not a UTC date and time");
    }
}

std::vector<ForecastRecord> FeedReader::readForecasts(const std::string& filePath) {
    std::vector<ForecastRecord> records;

    try {
        io::CSVReader<8, CsvTrim, CsvQuote> csvFile(filePath);
        csvFile.read_header(io::ignore_extra_column | io::ignore_missing_column,
                            "timestamp", "stream", "point", "sigma_hat",
                            "regime_transition", "model_confidence", "latency_ms", "base_notional");

        for (const char* required : {"timestamp", "stream", "point", "sigma_hat"}) {
            if (!csvFile.has_column(required)) {
                throw FeedReaderException(filePath + ": missing column " + required);
            }
        }

        std::string timestamp, stream, point, sigma, transition, confidence, latency, notional;
        while (true) {
            transition.clear();
            confidence.clear();
            latency.clear();
            notional.clear();

            if (!csvFile.read_row(timestamp, stream, point, sigma, transition, confidence, latency, notional)) {
                break;
            }

            try {
                requireNonEmpty(stream, "stream");

                ForecastRecord record;
                record.streamId = stream;
                record.event.timestamp = parseTimestamp(timestamp);
                record.event.point = parseDouble(point, "point");
                record.event.sigmaHat = parseDouble(sigma, "sigma_hat");
                record.event.regimeTransition = parseFlag(transition);
                record.event.modelConfidence = parseWeights(confidence);
                if (!latency.empty()) {
                    record.event.latencyMs = parseDouble(latency, "latency_ms");
                }
                if (!notional.empty()) {
                    record.event.baseNotional = parseDouble(notional, "base_notional");
                }
                records.push_back(std::move(record));
            } catch (const FeedReaderException& e) {
                throw rowError(filePath, csvFile.get_file_line(), e.what());
            }
        }
    } catch (const io::error::base& e) {
        throw FeedReaderException(std::string("Forecast feed: ") + e.what());
    }

    return records;
}

std::vector<GroundTruthRecord> FeedReader::readGroundTruth(const std::string& filePath) {
    std::vector<GroundTruthRecord> records;

    try {
        io::CSVReader<3, CsvTrim, CsvQuote> csvFile(filePath);
        csvFile.read_header(io::ignore_extra_column, "timestamp", "stream", "observed");

        std::string timestamp, stream, observed;
        while (csvFile.read_row(timestamp, stream, observed)) {
            try {
                requireNonEmpty(stream, "stream");

                GroundTruthRecord record;
                record.streamId = stream;
                record.event.timestamp = parseTimestamp(timestamp);
                record.event.observed = parseDouble(observed, "observed");
                records.push_back(std::move(record));
            } catch (const FeedReaderException& e) {
                throw rowError(filePath, csvFile.get_file_line(), e.what());
            }
        }
    } catch (const io::error::base& e) {
        throw FeedReaderException(std::string("Ground truth feed: ") + e.what());
    }

    return records;
}

std::vector<PolicyMetricRecord> FeedReader::readPolicyFeed(const std::string& filePath) {
    std::vector<PolicyMetricRecord> records;

    try {
        io::CSVReader<3, CsvTrim, CsvQuote> csvFile(filePath);
        csvFile.read_header(io::ignore_extra_column, "timestamp", "policy_id", "value");

        std::string timestamp, policyId, value;
        while (csvFile.read_row(timestamp, policyId, value)) {
            try {
                requireNonEmpty(policyId, "policy_id");
                records.push_back({policyId, parseTimestamp(timestamp), parseDouble(value, "value")});
            } catch (const FeedReaderException& e) {
                throw rowError(filePath, csvFile.get_file_line(), e.what());
            }
        }
    } catch (const io::error::base& e) {
        throw FeedReaderException(std::string("Policy feed: ") + e.what());
    }

    return records;
}

} // namespace riskgovernor
