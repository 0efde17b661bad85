// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "SnapshotCodec.h"
#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <type_traits>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include "RiskGovernanceException.h"

using namespace rapidjson;
using boost::posix_time::ptime;

namespace mkc_riskgov
{
  namespace
  {
    using Allocator = Document::AllocatorType;

    // ---- writing ----

    Value number(double v)
    {
      return std::isfinite(v) ? Value(v) : Value(kNullType);
    }

    Value count(std::uint64_t v)
    {
      return Value(static_cast<uint64_t>(v));
    }

    Value text(const std::string& s, Allocator& allocator)
    {
      return Value(s.c_str(), static_cast<SizeType>(s.size()), allocator);
    }

    Value timestamp(const ptime& t, Allocator& allocator)
    {
      if (t.is_special())
	return Value(kNullType);

      return text(boost::posix_time::to_iso_extended_string(t), allocator);
    }

    template <typename Range>
    Value doubles(const Range& values, Allocator& allocator)
    {
      Value array(kArrayType);
      for (double v : values)
	array.PushBack(number(v), allocator);

      return array;
    }

    std::string serialize(const Document& doc)
    {
      StringBuffer buffer;
      PrettyWriter<StringBuffer> writer(buffer);
      doc.Accept(writer);

      return buffer.GetString();
    }

    void addHeader(Document& doc, const char* schema, int version)
    {
      Allocator& allocator = doc.GetAllocator();
      doc.AddMember("schema", Value(schema, allocator), allocator);
      doc.AddMember("version", version, allocator);
    }

    // ---- reading ----

    PersistenceException malformed(const std::string& what)
    {
      return PersistenceException("SnapshotCodec: " + what);
    }

    const Value& member(const Value& object, const char* key)
    {
      if (!object.IsObject())
	throw malformed(std::string("expected an object holding '") + key + "'");

      const auto it = object.FindMember(key);
      if (it == object.MemberEnd())
	throw malformed(std::string("missing field '") + key + "'");

      return it->value;
    }

    bool hasMember(const Value& object, const char* key)
    {
      return object.IsObject() && object.FindMember(key) != object.MemberEnd();
    }

    double asDouble(const Value& v, const char* key)
    {
      if (v.IsNull())
	return std::numeric_limits<double>::quiet_NaN();

      if (!v.IsNumber())
	throw malformed(std::string("field '") + key + "' is not a number");

      return v.GetDouble();
    }

    double readDouble(const Value& object, const char* key)
    {
      return asDouble(member(object, key), key);
    }

    std::uint64_t readCount(const Value& object, const char* key)
    {
      const Value& v = member(object, key);
      if (!v.IsUint64())
	throw malformed(std::string("field '") + key + "' is not a non-negative integer");

      return v.GetUint64();
    }

    std::int64_t readInt64(const Value& v, const char* key)
    {
      if (!v.IsInt64())
	throw malformed(std::string("field '") + key + "' is not an integer");

      return v.GetInt64();
    }

    bool readBool(const Value& object, const char* key)
    {
      const Value& v = member(object, key);
      if (!v.IsBool())
	throw malformed(std::string("field '") + key + "' is not a boolean");

      return v.GetBool();
    }

    std::string readString(const Value& object, const char* key)
    {
      const Value& v = member(object, key);
      if (!v.IsString())
	throw malformed(std::string("field '") + key + "' is not a string");

      return std::string(v.GetString(), v.GetStringLength());
    }

    ptime readTimestamp(const Value& object, const char* key)
    {
      const Value& v = member(object, key);
      if (v.IsNull())
	return ptime();

      if (!v.IsString())
	throw malformed(std::string("field '") + key + "' is not a timestamp");

      return boost::posix_time::from_iso_extended_string(std::string(v.GetString(), v.GetStringLength()));
    }

    const Value& readArray(const Value& object, const char* key)
    {
      const Value& v = member(object, key);
      if (!v.IsArray())
	throw malformed(std::string("field '") + key + "' is not an array");

      return v;
    }

    std::vector<double> readDoubles(const Value& object, const char* key)
    {
      std::vector<double> values;
      for (const auto& v : readArray(object, key).GetArray())
	values.push_back(asDouble(v, key));

      return values;
    }

    template <typename T, std::size_t N>
    std::array<T, N> readFixed(const Value& object, const char* key)
    {
      const Value& array = readArray(object, key);
      if (array.Size() != N)
	throw malformed(std::string("field '") + key + "' has the wrong length");

      std::array<T, N> values;
      for (SizeType i = 0; i < N; ++i)
	{
	  if constexpr (std::is_integral<T>::value)
	    values[i] = static_cast<T>(readInt64(array[i], key));
	  else
	    values[i] = asDouble(array[i], key);
	}

      return values;
    }

    void parse(Document& doc, const std::string& json, const char* schema, int maxVersion)
    {
      doc.Parse<kParseFullPrecisionFlag>(json.c_str(), json.size());
      if (doc.HasParseError())
	throw malformed(std::string("parse error at offset ") + std::to_string(doc.GetErrorOffset()) +
			": " + GetParseError_En(doc.GetParseError()));

      const std::string found = readString(doc, "schema");
      if (found != schema)
	throw malformed("expected schema " + std::string(schema) + ", found " + found);

      const std::uint64_t version = readCount(doc, "version");
      if (version < 1 || version > static_cast<std::uint64_t>(maxVersion))
	throw malformed("unsupported " + found + " version " + std::to_string(version));
    }

    // Enum names and component constructors report bad values with
    // std::invalid_argument or ConfigurationException
    template <typename F>
    auto guarded(const char* what, F decode) -> decltype(decode())
    {
      try
	{
	  return decode();
	}
      catch (const PersistenceException&)
	{
	  throw;
	}
      catch (const std::exception& e)
	{
	  throw malformed(std::string("malformed ") + what + " snapshot: " + e.what());
	}
    }

    // ---- component states ----

    Value encodeQuantile(const QuantileEstimatorState& s, Allocator& a)
    {
      Value v(kObjectType);
      v.AddMember("probability", number(s.probability), a);
      v.AddMember("warmup_size", count(s.warmupSize), a);
      v.AddMember("safe_default", number(s.safeDefault), a);
      v.AddMember("count", count(s.count), a);
      v.AddMember("markers_initialized", s.markersInitialized, a);
      v.AddMember("warmup_buffer", doubles(s.warmupBuffer, a), a);
      v.AddMember("heights", doubles(s.heights, a), a);

      Value positions(kArrayType);
      for (std::int64_t p : s.positions)
	positions.PushBack(Value(static_cast<int64_t>(p)), a);
      v.AddMember("positions", positions, a);

      v.AddMember("desired_positions", doubles(s.desiredPositions, a), a);
      v.AddMember("increments", doubles(s.increments, a), a);
      return v;
    }

    QuantileEstimatorState decodeQuantile(const Value& v)
    {
      QuantileEstimatorState s;
      s.probability = readDouble(v, "probability");
      s.warmupSize = readCount(v, "warmup_size");
      s.safeDefault = readDouble(v, "safe_default");
      s.count = readCount(v, "count");
      s.markersInitialized = readBool(v, "markers_initialized");
      s.warmupBuffer = readDoubles(v, "warmup_buffer");
      s.heights = readFixed<double, 5>(v, "heights");
      s.positions = readFixed<std::int64_t, 5>(v, "positions");
      s.desiredPositions = readFixed<double, 5>(v, "desired_positions");
      s.increments = readFixed<double, 5>(v, "increments");
      return s;
    }

    Value encodeCalibration(const CalibrationState& s, Allocator& a)
    {
      Value v(kObjectType);
      v.AddMember("current_alpha", number(s.currentAlpha), a);
      v.AddMember("alpha_target", number(s.alphaTarget), a);
      v.AddMember("coverage_ema", number(s.coverageEma), a);
      v.AddMember("miss_streak", count(s.missStreak), a);
      v.AddMember("quantile_estimator", encodeQuantile(s.quantileEstimatorState, a), a);
      v.AddMember("inflation_factor", number(s.inflationFactor), a);
      v.AddMember("cooldown_counter", count(s.cooldownCounter), a);
      v.AddMember("score_window", doubles(s.scoreWindow, a), a);
      v.AddMember("recent_scores", doubles(s.recentScores, a), a);
      v.AddMember("instability_ema", number(s.instabilityEma), a);
      v.AddMember("n_observations", count(s.nObservations), a);
      return v;
    }

    CalibrationState decodeCalibration(const Value& v)
    {
      CalibrationState s;
      s.currentAlpha = readDouble(v, "current_alpha");
      s.alphaTarget = readDouble(v, "alpha_target");
      s.coverageEma = readDouble(v, "coverage_ema");
      s.missStreak = readCount(v, "miss_streak");
      s.quantileEstimatorState = decodeQuantile(member(v, "quantile_estimator"));
      s.inflationFactor = readDouble(v, "inflation_factor");
      s.cooldownCounter = readCount(v, "cooldown_counter");
      s.scoreWindow = readDoubles(v, "score_window");
      s.recentScores = readDoubles(v, "recent_scores");
      s.instabilityEma = readDouble(v, "instability_ema");
      s.nObservations = readCount(v, "n_observations");
      return s;
    }

    Value encodeCompliance(const CoverageComplianceState& s, Allocator& a)
    {
      Value v(kObjectType);

      Value hits(kArrayType);
      for (bool hit : s.windowHits)
	hits.PushBack(hit, a);
      v.AddMember("window_hits", hits, a);

      v.AddMember("ema_coverage", number(s.emaCoverage), a);
      v.AddMember("last_target_coverage", number(s.lastTargetCoverage), a);
      v.AddMember("count", count(s.count), a);
      return v;
    }

    CoverageComplianceState emptyCompliance()
    {
      const double nan = std::numeric_limits<double>::quiet_NaN();
      return CoverageComplianceState{std::vector<bool>(), nan, nan, 0};
    }

    CoverageComplianceState decodeCompliance(const Value& v)
    {
      CoverageComplianceState s = emptyCompliance();

      for (const auto& hit : readArray(v, "window_hits").GetArray())
	{
	  if (!hit.IsBool())
	    throw malformed("field 'window_hits' holds a non boolean");
	  s.windowHits.push_back(hit.GetBool());
	}

      s.emaCoverage = readDouble(v, "ema_coverage");
      s.lastTargetCoverage = readDouble(v, "last_target_coverage");
      s.count = readCount(v, "count");
      return s;
    }

    Value encodeAcceptance(const AcceptanceState& s, Allocator& a)
    {
      Value v(kObjectType);
      v.AddMember("posture", Value(toString(s.posture), a), a);
      v.AddMember("dwell_counter", count(s.dwellCounter), a);
      v.AddMember("last_transition", timestamp(s.lastTransition, a), a);
      v.AddMember("soft_breach_streak", count(s.softBreachStreak), a);
      v.AddMember("clean_streak", count(s.cleanStreak), a);

      Value violations(kObjectType);
      for (const auto& entry : s.violationsByGuard)
	violations.AddMember(Value(toString(entry.first), a), count(entry.second), a);
      v.AddMember("violations_by_guard", violations, a);

      Value hard(kObjectType);
      for (const auto& entry : s.hardViolationsByGuard)
	hard.AddMember(Value(toString(entry.first), a), count(entry.second), a);
      v.AddMember("hard_violations_by_guard", hard, a);

      Value transitions(kObjectType);
      for (const auto& entry : s.transitionCounts)
	transitions.AddMember(text(entry.first, a), count(entry.second), a);
      v.AddMember("transition_counts", transitions, a);

      Value decisions(kObjectType);
      for (const auto& entry : s.decisionsByPosture)
	decisions.AddMember(Value(toString(entry.first), a), count(entry.second), a);
      v.AddMember("decisions_by_posture", decisions, a);

      v.AddMember("cycles", count(s.cycles), a);
      v.AddMember("pending_cycles", count(s.pendingCycles), a);
      return v;
    }

    template <typename Key, typename KeyParser>
    std::map<Key, std::uint64_t> readCountMap(const Value& object, const char* key, KeyParser parseKey)
    {
      const Value& v = member(object, key);
      if (!v.IsObject())
	throw malformed(std::string("field '") + key + "' is not an object");

      std::map<Key, std::uint64_t> counts;
      for (const auto& entry : v.GetObject())
	{
	  if (!entry.value.IsUint64())
	    throw malformed(std::string("field '") + key + "' holds a non count value");
	  counts[parseKey(std::string(entry.name.GetString(), entry.name.GetStringLength()))] =
	    entry.value.GetUint64();
	}

      return counts;
    }

    AcceptanceState decodeAcceptance(const Value& v)
    {
      AcceptanceState s;
      s.posture = postureFromString(readString(v, "posture"));
      s.dwellCounter = readCount(v, "dwell_counter");
      s.lastTransition = readTimestamp(v, "last_transition");
      s.softBreachStreak = readCount(v, "soft_breach_streak");
      s.cleanStreak = readCount(v, "clean_streak");
      s.violationsByGuard = readCountMap<GuardKind>(v, "violations_by_guard", guardKindFromString);
      s.hardViolationsByGuard = readCountMap<GuardKind>(v, "hard_violations_by_guard", guardKindFromString);
      s.transitionCounts = readCountMap<std::string>(v, "transition_counts",
						     [](const std::string& name) { return name; });
      s.decisionsByPosture = readCountMap<Posture>(v, "decisions_by_posture", postureFromString);
      s.cycles = readCount(v, "cycles");
      s.pendingCycles = readCount(v, "pending_cycles");
      return s;
    }

    Value encodePending(const PendingPrediction& p, Allocator& a)
    {
      Value v(kObjectType);
      v.AddMember("timestamp", timestamp(p.timestamp, a), a);
      v.AddMember("lower", number(p.prediction.lower), a);
      v.AddMember("upper", number(p.prediction.upper), a);
      v.AddMember("alpha_used", number(p.prediction.alphaUsed), a);
      v.AddMember("point", number(p.prediction.point), a);
      v.AddMember("sigma_effective", number(p.prediction.sigmaEffective), a);
      v.AddMember("quantile", number(p.prediction.quantile), a);
      v.AddMember("inflation", number(p.prediction.inflation), a);
      v.AddMember("is_transition", p.prediction.isTransition, a);
      return v;
    }

    PendingPrediction decodePending(const Value& v)
    {
      PendingPrediction p;
      p.timestamp = readTimestamp(v, "timestamp");
      if (p.timestamp.is_special())
	throw malformed("pending prediction without a timestamp");

      p.prediction = IntervalPrediction{readDouble(v, "lower"),
					readDouble(v, "upper"),
					readDouble(v, "alpha_used"),
					readDouble(v, "point"),
					readDouble(v, "sigma_effective"),
					readDouble(v, "quantile"),
					readDouble(v, "inflation"),
					readBool(v, "is_transition")};
      return p;
    }

    Value encodeTesterConfiguration(const SequentialTesterConfiguration& c, Allocator& a)
    {
      Value v(kObjectType);
      v.AddMember("mu0", number(c.mu0), a);
      v.AddMember("mu1", number(c.mu1), a);
      v.AddMember("sigma", number(c.sigma), a);
      v.AddMember("beta", number(c.beta), a);
      v.AddMember("min_samples", count(c.minSamples), a);
      v.AddMember("max_samples", count(c.maxSamples), a);
      v.AddMember("expected_tests", count(c.expectedTests), a);
      v.AddMember("model", Value(toString(c.model), a), a);
      v.AddMember("variance_floor", number(c.varianceFloor), a);
      return v;
    }

    SequentialTesterConfiguration decodeTesterConfiguration(const Value& v)
    {
      SequentialTesterConfiguration c;
      c.mu0 = readDouble(v, "mu0");
      c.mu1 = readDouble(v, "mu1");
      c.sigma = readDouble(v, "sigma");
      c.beta = readDouble(v, "beta");
      c.minSamples = readCount(v, "min_samples");
      c.maxSamples = readCount(v, "max_samples");
      c.expectedTests = readCount(v, "expected_tests");
      c.model = likelihoodModelFromString(readString(v, "model"));
      c.varianceFloor = readDouble(v, "variance_floor");
      return c;
    }

    Value encodeTesterState(const SequentialTestState& s, Allocator& a)
    {
      Value v(kObjectType);
      v.AddMember("llr", number(s.logLikelihoodRatio), a);
      v.AddMember("n_samples", count(s.nSamples), a);
      v.AddMember("decision", Value(toString(s.decision), a), a);
      v.AddMember("alpha_test", number(s.alphaTest), a);
      v.AddMember("allocation", Value(toString(s.allocation), a), a);
      v.AddMember("sum", number(s.sum), a);
      v.AddMember("sum_of_squares", number(s.sumOfSquares), a);
      v.AddMember("runs_completed", count(s.runsCompleted), a);
      v.AddMember("total_steps", count(s.totalSteps), a);
      return v;
    }

    SequentialTestState decodeTesterState(const Value& v)
    {
      SequentialTestState s;
      s.logLikelihoodRatio = readDouble(v, "llr");
      s.nSamples = readCount(v, "n_samples");
      s.decision = sequentialDecisionFromString(readString(v, "decision"));
      s.alphaTest = readDouble(v, "alpha_test");
      s.allocation = allocationStatusFromString(readString(v, "allocation"));
      s.sum = readDouble(v, "sum");
      s.sumOfSquares = readDouble(v, "sum_of_squares");
      s.runsCompleted = readCount(v, "runs_completed");
      s.totalSteps = readCount(v, "total_steps");
      return s;
    }
  }

  std::string SnapshotCodec::encodeStream(const StreamSnapshot& snapshot)
  {
    Document doc;
    doc.SetObject();
    Allocator& a = doc.GetAllocator();

    addHeader(doc, kStreamSchema, kStreamVersion);
    doc.AddMember("stream_id", text(snapshot.streamId, a), a);
    doc.AddMember("profile", text(snapshot.profile, a), a);
    doc.AddMember("last_forecast", timestamp(snapshot.lastForecast, a), a);
    doc.AddMember("last_ground_truth", timestamp(snapshot.lastGroundTruth, a), a);
    doc.AddMember("calibration", encodeCalibration(snapshot.calibration, a), a);
    doc.AddMember("compliance", encodeCompliance(snapshot.compliance, a), a);
    doc.AddMember("acceptance", encodeAcceptance(snapshot.acceptance, a), a);
    doc.AddMember("latency_window", doubles(snapshot.latencyWindow, a), a);
    doc.AddMember("surprisal_window", doubles(snapshot.surprisalWindow, a), a);

    Value pending(kArrayType);
    for (const auto& p : snapshot.pending)
      pending.PushBack(encodePending(p, a), a);
    doc.AddMember("pending", pending, a);

    return serialize(doc);
  }

  StreamSnapshot SnapshotCodec::decodeStream(const std::string& json)
  {
    return guarded("stream", [&json]() {
      Document doc;
      parse(doc, json, kStreamSchema, kStreamVersion);

      StreamSnapshot snapshot;
      snapshot.version = static_cast<int>(readCount(doc, "version"));
      snapshot.streamId = readString(doc, "stream_id");
      snapshot.profile = readString(doc, "profile");
      snapshot.lastForecast = readTimestamp(doc, "last_forecast");
      snapshot.lastGroundTruth = readTimestamp(doc, "last_ground_truth");
      snapshot.calibration = decodeCalibration(member(doc, "calibration"));
      snapshot.acceptance = decodeAcceptance(member(doc, "acceptance"));

      // Version 1 predates the compliance tracker and the percentile windows
      if (snapshot.version >= 2)
	{
	  snapshot.compliance = decodeCompliance(member(doc, "compliance"));
	  snapshot.latencyWindow = readDoubles(doc, "latency_window");
	  snapshot.surprisalWindow = readDoubles(doc, "surprisal_window");
	}
      else
	{
	  snapshot.compliance = hasMember(doc, "compliance") ?
	    decodeCompliance(member(doc, "compliance")) : emptyCompliance();
	  if (hasMember(doc, "latency_window"))
	    snapshot.latencyWindow = readDoubles(doc, "latency_window");
	  if (hasMember(doc, "surprisal_window"))
	    snapshot.surprisalWindow = readDoubles(doc, "surprisal_window");
	}

      if (hasMember(doc, "pending"))
	for (const auto& p : readArray(doc, "pending").GetArray())
	  snapshot.pending.push_back(decodePending(p));

      return snapshot;
    });
  }

  std::string SnapshotCodec::encodeLedger(const LedgerSnapshot& snapshot)
  {
    Document doc;
    doc.SetObject();
    Allocator& a = doc.GetAllocator();

    addHeader(doc, kLedgerSchema, kLedgerVersion);
    doc.AddMember("total_budget", number(snapshot.totalBudget), a);

    Value entries(kArrayType);
    for (const auto& e : snapshot.entries)
      {
	Value v(kObjectType);
	v.AddMember("test_id", text(e.testId, a), a);
	v.AddMember("alpha_spent", number(e.alphaSpent), a);
	v.AddMember("cumulative_alpha", number(e.cumulativeAlpha), a);
	v.AddMember("event_type", Value(toString(e.eventType), a), a);
	v.AddMember("timestamp", timestamp(e.timestamp, a), a);
	entries.PushBack(v, a);
      }
    doc.AddMember("entries", entries, a);

    return serialize(doc);
  }

  LedgerSnapshot SnapshotCodec::decodeLedger(const std::string& json)
  {
    return guarded("ledger", [&json]() {
      Document doc;
      parse(doc, json, kLedgerSchema, kLedgerVersion);

      LedgerSnapshot snapshot;
      snapshot.totalBudget = readDouble(doc, "total_budget");

      for (const auto& v : readArray(doc, "entries").GetArray())
	snapshot.entries.push_back(AlphaLedgerEntry{readString(v, "test_id"),
						    readDouble(v, "alpha_spent"),
						    readDouble(v, "cumulative_alpha"),
						    ledgerEventTypeFromString(readString(v, "event_type")),
						    readTimestamp(v, "timestamp")});
      return snapshot;
    });
  }

  std::string SnapshotCodec::encodeLifecycle(const LifecycleSnapshot& snapshot)
  {
    Document doc;
    doc.SetObject();
    Allocator& a = doc.GetAllocator();

    addHeader(doc, kLifecycleSchema, kLifecycleVersion);
    doc.AddMember("next_test_index", count(snapshot.nextTestIndex), a);

    Value records(kArrayType);
    for (const auto& r : snapshot.records)
      {
	Value metrics(kObjectType);
	metrics.AddMember("count", count(r.metrics.getCount()), a);
	metrics.AddMember("mean", number(r.metrics.getMean()), a);
	metrics.AddMember("sum_squared_deviations", number(r.metrics.getSumSquaredDeviations()), a);

	Value v(kObjectType);
	v.AddMember("policy_id", text(r.policyId, a), a);
	v.AddMember("version", text(r.version, a), a);
	v.AddMember("status", Value(toString(r.status), a), a);
	v.AddMember("metrics", metrics, a);
	v.AddMember("created_at", timestamp(r.createdAt, a), a);
	v.AddMember("promoted_at", timestamp(r.promotedAt, a), a);
	records.PushBack(v, a);
      }
    doc.AddMember("records", records, a);

    Value trail(kArrayType);
    for (const auto& t : snapshot.auditTrail)
      {
	Value v(kObjectType);
	v.AddMember("policy_id", text(t.policyId, a), a);
	v.AddMember("from", Value(toString(t.from), a), a);
	v.AddMember("to", Value(toString(t.to), a), a);
	v.AddMember("timestamp", timestamp(t.timestamp, a), a);
	v.AddMember("reason", text(t.reason, a), a);
	trail.PushBack(v, a);
      }
    doc.AddMember("audit_trail", trail, a);

    Value tests(kArrayType);
    for (const auto& t : snapshot.activeTests)
      {
	Value v(kObjectType);
	v.AddMember("policy_id", text(t.policyId, a), a);
	v.AddMember("test_id", text(t.testId, a), a);
	v.AddMember("test_index", count(t.testIndex), a);
	v.AddMember("config", encodeTesterConfiguration(t.config, a), a);
	v.AddMember("state", encodeTesterState(t.state, a), a);
	tests.PushBack(v, a);
      }
    doc.AddMember("active_tests", tests, a);

    return serialize(doc);
  }

  LifecycleSnapshot SnapshotCodec::decodeLifecycle(const std::string& json)
  {
    return guarded("lifecycle", [&json]() {
      Document doc;
      parse(doc, json, kLifecycleSchema, kLifecycleVersion);

      LifecycleSnapshot snapshot;
      snapshot.nextTestIndex = readCount(doc, "next_test_index");

      for (const auto& v : readArray(doc, "records").GetArray())
	{
	  const Value& m = member(v, "metrics");
	  snapshot.records.push_back(PolicyRecord{readString(v, "policy_id"),
						  readString(v, "version"),
						  lifecycleStatusFromString(readString(v, "status")),
						  RollingMetrics(readCount(m, "count"),
								 readDouble(m, "mean"),
								 readDouble(m, "sum_squared_deviations")),
						  readTimestamp(v, "created_at"),
						  readTimestamp(v, "promoted_at")});
	}

      for (const auto& v : readArray(doc, "audit_trail").GetArray())
	snapshot.auditTrail.push_back(LifecycleTransition{readString(v, "policy_id"),
							  lifecycleStatusFromString(readString(v, "from")),
							  lifecycleStatusFromString(readString(v, "to")),
							  readTimestamp(v, "timestamp"),
							  readString(v, "reason")});

      for (const auto& v : readArray(doc, "active_tests").GetArray())
	snapshot.activeTests.push_back(StageTestSnapshot{readString(v, "policy_id"),
							 readString(v, "test_id"),
							 decodeTesterConfiguration(member(v, "config")),
							 readCount(v, "test_index"),
							 decodeTesterState(member(v, "state"))});
      return snapshot;
    });
  }
}
