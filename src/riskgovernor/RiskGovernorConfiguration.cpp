#include "RiskGovernorConfiguration.h"
#include <cstdint>
#include <fstream>
#include <iterator>
#include <set>
#include <stdexcept>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include "RiskGovernanceException.h"

using namespace rapidjson;
using namespace mkc_riskgov;

namespace riskgovernor {

namespace {

using Allocator = Document::AllocatorType;

ConfigurationException badValue(const std::string& path, const char* expected) {
    return ConfigurationException("RiskGovernorConfiguration: '" + path + "' must be " + expected);
}

std::string join(const std::string& path, const char* key) {
    return path.empty() ? std::string(key) : path + "." + key;
}

// Returns nullptr when the key is absent
const Value* find(const Value& object, const char* key) {
    const auto it = object.FindMember(key);
    return it == object.MemberEnd() ? nullptr : &it->value;
}

const Value* section(const Value& object, const char* key, const std::string& path) {
    const Value* v = find(object, key);
    if (v && !v->IsObject()) {
        throw badValue(join(path, key), "an object");
    }
    return v;
}

void read(const Value& object, const char* key, const std::string& path, double& target) {
    if (const Value* v = find(object, key)) {
        if (!v->IsNumber()) {
            throw badValue(join(path, key), "a number");
        }
        target = v->GetDouble();
    }
}

void read(const Value& object, const char* key, const std::string& path, std::size_t& target) {
    if (const Value* v = find(object, key)) {
        if (!v->IsUint64()) {
            throw badValue(join(path, key), "a non-negative integer");
        }
        target = static_cast<std::size_t>(v->GetUint64());
    }
}

void read(const Value& object, const char* key, const std::string& path, bool& target) {
    if (const Value* v = find(object, key)) {
        if (!v->IsBool()) {
            throw badValue(join(path, key), "true or false");
        }
        target = v->GetBool();
    }
}

void read(const Value& object, const char* key, const std::string& path, std::string& target) {
    if (const Value* v = find(object, key)) {
        if (!v->IsString()) {
            throw badValue(join(path, key), "a string");
        }
        target = std::string(v->GetString(), v->GetStringLength());
    }
}

void readCalibrator(const Value& json, const std::string& path, CalibratorConfiguration& c) {
    read(json, "alpha_base", path, c.alphaBase);
    read(json, "alpha_min", path, c.alphaMin);
    read(json, "alpha_max", path, c.alphaMax);
    read(json, "transition_alpha_lift", path, c.transitionAlphaLift);
    read(json, "instability_alpha_lift", path, c.instabilityAlphaLift);
    read(json, "eta_base", path, c.etaBase);
    read(json, "eta_transition", path, c.etaTransition);
    read(json, "coverage_ema_beta", path, c.coverageEmaBeta);
    read(json, "min_calibration_size", path, c.minCalibrationSize);
    read(json, "inflation_ceiling", path, c.inflationCeiling);
    read(json, "cooldown_cycles", path, c.cooldownCycles);
    read(json, "transition_score_multiple", path, c.transitionScoreMultiple);
    read(json, "recent_score_window", path, c.recentScoreWindow);
    read(json, "min_recent_scores", path, c.minRecentScores);
    read(json, "score_window_size", path, c.scoreWindowSize);
    read(json, "refresh_interval", path, c.refreshInterval);
    read(json, "retarget_tolerance", path, c.retargetTolerance);
    read(json, "instability_ema_beta", path, c.instabilityEmaBeta);
    read(json, "aci_threshold", path, c.aciThreshold);
}

void readCompliance(const Value& json, const std::string& path, CoverageComplianceConfiguration& c) {
    read(json, "window_size", path, c.windowSize);
    read(json, "ema_beta", path, c.emaBeta);
    read(json, "blend", path, c.blend);
    read(json, "deficit_tolerance", path, c.deficitTolerance);
    read(json, "excess_tolerance", path, c.excessTolerance);
}

void readAggregator(const Value& json, const std::string& path, AggregatorConfiguration& c) {
    read(json, "state_weight", path, c.stateWeight);
    read(json, "model_weight", path, c.modelWeight);
    read(json, "forecast_weight", path, c.forecastWeight);
    read(json, "deficit_scale", path, c.deficitScale);
    read(json, "missing_model_uncertainty", path, c.missingModelUncertainty);
    read(json, "sigma_min", path, c.sigmaMin);
    read(json, "c_ref", path, c.cRef);
    read(json, "beta_ref", path, c.betaRef);
    read(json, "inflation_ceiling", path, c.inflationCeiling);
    read(json, "gamma", path, c.gamma);
}

void readAcceptance(const Value& json, const std::string& path, AcceptanceConfiguration& c) {
    read(json, "dwell_min_derisk", path, c.dwellMinDerisk);
    read(json, "dwell_min_recovery", path, c.dwellMinRecovery);
    read(json, "block_cooldown_cycles", path, c.blockCooldownCycles);
    read(json, "block_recovery_window", path, c.blockRecoveryWindow);
    read(json, "allow_direct_block_recovery", path, c.allowDirectBlockRecovery);
    read(json, "kappa_plus_confidence_floor", path, c.kappaPlusConfidenceFloor);

    const std::string guardsPath = join(path, "guards");
    if (const Value* guards = section(json, "guards", path)) {
        for (auto it = guards->MemberBegin(); it != guards->MemberEnd(); ++it) {
            const std::string name(it->name.GetString(), it->name.GetStringLength());
            const std::string guardPath = guardsPath + "." + name;

            GuardKind kind;
            try {
                kind = guardKindFromString(name);
            } catch (const std::invalid_argument&) {
                throw ConfigurationException("RiskGovernorConfiguration: unknown guard '" + guardPath + "'");
            }

            if (!it->value.IsObject()) {
                throw badValue(guardPath, "an object");
            }

            GuardThreshold& threshold = c.thresholds[kind];
            read(it->value, "enabled", guardPath, threshold.enabled);
            read(it->value, "soft", guardPath, threshold.soft);
            read(it->value, "hard", guardPath, threshold.hard);
        }
    }
}

void readGate(const Value& json, const std::string& path, ExecutionGateConfiguration& c) {
    read(json, "min_notional", path, c.minNotional);
    read(json, "max_notional", path, c.maxNotional);
    read(json, "hard_block_on_guard", path, c.hardBlockOnGuard);

    const std::string scalePath = join(path, "scale_map");
    if (const Value* scales = section(json, "scale_map", path)) {
        for (auto it = scales->MemberBegin(); it != scales->MemberEnd(); ++it) {
            const std::string name(it->name.GetString(), it->name.GetStringLength());

            Posture posture;
            try {
                posture = postureFromString(name);
            } catch (const std::invalid_argument&) {
                throw ConfigurationException("RiskGovernorConfiguration: unknown posture '" +
                                             scalePath + "." + name + "'");
            }

            if (!it->value.IsNumber()) {
                throw badValue(scalePath + "." + name, "a number");
            }
            c.scaleMap[posture] = it->value.GetDouble();
        }
    }
}

void readStream(const Value& json, const std::string& path, StreamConfiguration& c) {
    read(json, "id", path, c.streamId);
    read(json, "profile", path, c.profile);
    read(json, "latency_window", path, c.latencyWindow);
    read(json, "surprisal_window", path, c.surprisalWindow);
    read(json, "cycle_budget_ms", path, c.cycleBudgetMs);
    read(json, "sigma_min", path, c.sigmaMin);
    read(json, "huber_delta", path, c.huberDelta);
    read(json, "max_pending", path, c.maxPending);

    if (const Value* v = section(json, "calibrator", path)) {
        readCalibrator(*v, join(path, "calibrator"), c.calibrator);
    }
    if (const Value* v = section(json, "compliance", path)) {
        readCompliance(*v, join(path, "compliance"), c.compliance);
    }
    if (const Value* v = section(json, "aggregator", path)) {
        readAggregator(*v, join(path, "aggregator"), c.aggregator);
    }
    if (const Value* v = section(json, "acceptance", path)) {
        readAcceptance(*v, join(path, "acceptance"), c.acceptance);
    }
    if (const Value* v = section(json, "gate", path)) {
        readGate(*v, join(path, "gate"), c.gate);
    }
}

void readLifecycle(const Value& json, const std::string& path, LifecycleConfiguration& c) {
    read(json, "default_baseline_mean", path, c.defaultBaselineMean);
    read(json, "default_sigma", path, c.defaultSigma);
    read(json, "minimum_detectable_effect", path, c.minimumDetectableEffect);
    read(json, "min_baseline_samples", path, c.minBaselineSamples);
    read(json, "beta", path, c.beta);
    read(json, "min_samples", path, c.minSamples);
    read(json, "max_samples", path, c.maxSamples);
    read(json, "expected_tests", path, c.expectedTests);

    std::string model(toString(c.model));
    read(json, "model", path, model);
    c.model = likelihoodModelFromString(model);
}

void readEngine(const Value& json, const std::string& path, EngineConfiguration& c) {
    read(json, "worker_threads", path, c.workerThreads);
    read(json, "alpha_budget", path, c.alphaBudget);
    read(json, "spending_policy", path, c.spendingPolicy);
    read(json, "spending_half_life", path, c.spendingHalfLife);
    read(json, "snapshot_directory", path, c.snapshotDirectory);
    read(json, "snapshot_every_events", path, c.snapshotEveryEvents);
    read(json, "quarantine_corrupt_snapshots", path, c.quarantineCorruptSnapshots);
}

void readSnapshots(const Value& json, const std::string& path, SnapshotSchedulerConfiguration& c) {
    read(json, "flush_interval_ms", path, c.flushIntervalMs);
    read(json, "initial_backoff_ms", path, c.initialBackoffMs);
    read(json, "max_backoff_ms", path, c.maxBackoffMs);
}

PolicyEntry readPolicy(const Value& json, const std::string& path) {
    if (!json.IsObject()) {
        throw badValue(path, "an object");
    }

    PolicyEntry entry;
    std::string role = "candidate";

    read(json, "id", path, entry.id);
    read(json, "version", path, entry.version);
    read(json, "role", path, role);
    read(json, "start_canary", path, entry.startCanary);

    if (role == "baseline") {
        entry.baseline = true;
    } else if (role != "candidate") {
        throw badValue(join(path, "role"), "\"baseline\" or \"candidate\"");
    }
    return entry;
}

// ---- writing ----

Value text(const std::string& s, Allocator& allocator) {
    return Value(s.c_str(), static_cast<SizeType>(s.size()), allocator);
}

Value count(std::size_t v) {
    return Value(static_cast<uint64_t>(v));
}

Value writeCalibrator(const CalibratorConfiguration& c, Allocator& a) {
    Value v(kObjectType);
    v.AddMember("alpha_base", c.alphaBase, a);
    v.AddMember("alpha_min", c.alphaMin, a);
    v.AddMember("alpha_max", c.alphaMax, a);
    v.AddMember("transition_alpha_lift", c.transitionAlphaLift, a);
    v.AddMember("instability_alpha_lift", c.instabilityAlphaLift, a);
    v.AddMember("eta_base", c.etaBase, a);
    v.AddMember("eta_transition", c.etaTransition, a);
    v.AddMember("coverage_ema_beta", c.coverageEmaBeta, a);
    v.AddMember("min_calibration_size", count(c.minCalibrationSize), a);
    v.AddMember("inflation_ceiling", c.inflationCeiling, a);
    v.AddMember("cooldown_cycles", count(c.cooldownCycles), a);
    v.AddMember("transition_score_multiple", c.transitionScoreMultiple, a);
    v.AddMember("recent_score_window", count(c.recentScoreWindow), a);
    v.AddMember("min_recent_scores", count(c.minRecentScores), a);
    v.AddMember("score_window_size", count(c.scoreWindowSize), a);
    v.AddMember("refresh_interval", count(c.refreshInterval), a);
    v.AddMember("retarget_tolerance", c.retargetTolerance, a);
    v.AddMember("instability_ema_beta", c.instabilityEmaBeta, a);
    v.AddMember("aci_threshold", c.aciThreshold, a);
    return v;
}

Value writeCompliance(const CoverageComplianceConfiguration& c, Allocator& a) {
    Value v(kObjectType);
    v.AddMember("window_size", count(c.windowSize), a);
    v.AddMember("ema_beta", c.emaBeta, a);
    v.AddMember("blend", c.blend, a);
    v.AddMember("deficit_tolerance", c.deficitTolerance, a);
    v.AddMember("excess_tolerance", c.excessTolerance, a);
    return v;
}

Value writeAggregator(const AggregatorConfiguration& c, Allocator& a) {
    Value v(kObjectType);
    v.AddMember("state_weight", c.stateWeight, a);
    v.AddMember("model_weight", c.modelWeight, a);
    v.AddMember("forecast_weight", c.forecastWeight, a);
    v.AddMember("deficit_scale", c.deficitScale, a);
    v.AddMember("missing_model_uncertainty", c.missingModelUncertainty, a);
    v.AddMember("sigma_min", c.sigmaMin, a);
    v.AddMember("c_ref", c.cRef, a);
    v.AddMember("beta_ref", c.betaRef, a);
    v.AddMember("inflation_ceiling", c.inflationCeiling, a);
    v.AddMember("gamma", c.gamma, a);
    return v;
}

Value writeAcceptance(const AcceptanceConfiguration& c, Allocator& a) {
    Value v(kObjectType);
    v.AddMember("dwell_min_derisk", count(c.dwellMinDerisk), a);
    v.AddMember("dwell_min_recovery", count(c.dwellMinRecovery), a);
    v.AddMember("block_cooldown_cycles", count(c.blockCooldownCycles), a);
    v.AddMember("block_recovery_window", count(c.blockRecoveryWindow), a);
    v.AddMember("allow_direct_block_recovery", c.allowDirectBlockRecovery, a);
    v.AddMember("kappa_plus_confidence_floor", c.kappaPlusConfidenceFloor, a);

    Value guards(kObjectType);
    for (GuardKind kind : allGuardKinds()) {
        const GuardThreshold& threshold = c.threshold(kind);
        Value guard(kObjectType);
        guard.AddMember("enabled", threshold.enabled, a);
        guard.AddMember("soft", threshold.soft, a);
        guard.AddMember("hard", threshold.hard, a);
        guards.AddMember(Value(toString(kind), a), guard, a);
    }
    v.AddMember("guards", guards, a);
    return v;
}

Value writeGate(const ExecutionGateConfiguration& c, Allocator& a) {
    Value v(kObjectType);
    Value scales(kObjectType);
    for (const auto& entry : c.scaleMap) {
        scales.AddMember(Value(toString(entry.first), a), entry.second, a);
    }
    v.AddMember("scale_map", scales, a);
    v.AddMember("min_notional", c.minNotional, a);
    v.AddMember("max_notional", c.maxNotional, a);
    v.AddMember("hard_block_on_guard", c.hardBlockOnGuard, a);
    return v;
}

Value writeStream(const StreamConfiguration& c, bool withId, Allocator& a) {
    Value v(kObjectType);
    if (withId) {
        v.AddMember("id", text(c.streamId, a), a);
    }
    v.AddMember("profile", text(c.profile, a), a);
    v.AddMember("latency_window", count(c.latencyWindow), a);
    v.AddMember("surprisal_window", count(c.surprisalWindow), a);
    v.AddMember("cycle_budget_ms", c.cycleBudgetMs, a);
    v.AddMember("sigma_min", c.sigmaMin, a);
    v.AddMember("huber_delta", c.huberDelta, a);
    v.AddMember("max_pending", count(c.maxPending), a);
    v.AddMember("calibrator", writeCalibrator(c.calibrator, a), a);
    v.AddMember("compliance", writeCompliance(c.compliance, a), a);
    v.AddMember("aggregator", writeAggregator(c.aggregator, a), a);
    v.AddMember("acceptance", writeAcceptance(c.acceptance, a), a);
    v.AddMember("gate", writeGate(c.gate, a), a);
    return v;
}

Value writeLifecycle(const LifecycleConfiguration& c, Allocator& a) {
    Value v(kObjectType);
    v.AddMember("default_baseline_mean", c.defaultBaselineMean, a);
    v.AddMember("default_sigma", c.defaultSigma, a);
    v.AddMember("minimum_detectable_effect", c.minimumDetectableEffect, a);
    v.AddMember("min_baseline_samples", count(c.minBaselineSamples), a);
    v.AddMember("beta", c.beta, a);
    v.AddMember("min_samples", count(c.minSamples), a);
    v.AddMember("max_samples", count(c.maxSamples), a);
    v.AddMember("expected_tests", count(c.expectedTests), a);
    v.AddMember("model", Value(toString(c.model), a), a);
    return v;
}

std::string lowerName(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warning:
        return "warning";
    case LogLevel::Error:
        return "error";
    }
    return "info";
}

} // namespace

RiskGovernorConfiguration::RiskGovernorConfiguration()
    : engine_(), streams_(), policies_(), logging_() {}

RiskGovernorConfiguration RiskGovernorConfiguration::createDefault() {
    RiskGovernorConfiguration config;
    config.engine_.snapshotDirectory = "snapshots";
    return config;
}

RiskGovernorConfiguration RiskGovernorConfiguration::loadFromFile(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw ConfigurationException("RiskGovernorConfiguration: cannot open " + filePath);
    }

    const std::string json((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
    return loadFromString(json);
}

RiskGovernorConfiguration RiskGovernorConfiguration::loadFromString(const std::string& json) {
    Document doc;
    doc.Parse<kParseFullPrecisionFlag>(json.c_str(), json.size());

    if (doc.HasParseError()) {
        throw ConfigurationException(std::string("RiskGovernorConfiguration: JSON parse error: ") +
                                     GetParseError_En(doc.GetParseError()) + " at offset " +
                                     std::to_string(doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        throw ConfigurationException("RiskGovernorConfiguration: document must be an object");
    }

    RiskGovernorConfiguration config;
    EngineConfiguration& engine = config.engine_;

    if (const Value* v = section(doc, "engine", "")) {
        readEngine(*v, "engine", engine);
    }
    if (const Value* v = section(doc, "snapshots", "")) {
        readSnapshots(*v, "snapshots", engine.snapshots);
    }
    if (const Value* v = section(doc, "lifecycle", "")) {
        readLifecycle(*v, "lifecycle", engine.lifecycle);
    }
    if (const Value* v = section(doc, "stream_defaults", "")) {
        readStream(*v, "stream_defaults", engine.streamDefaults);
    }

    if (const Value* streams = find(doc, "streams")) {
        if (!streams->IsArray()) {
            throw badValue("streams", "an array");
        }
        for (SizeType i = 0; i < streams->Size(); ++i) {
            const std::string path = "streams[" + std::to_string(i) + "]";
            const Value& entry = (*streams)[i];
            if (!entry.IsObject()) {
                throw badValue(path, "an object");
            }

            StreamConfiguration stream(engine.streamDefaults);
            stream.streamId.clear();
            readStream(entry, path, stream);
            config.streams_.push_back(stream);
        }
    }

    if (const Value* policies = find(doc, "policies")) {
        if (!policies->IsArray()) {
            throw badValue("policies", "an array");
        }
        for (SizeType i = 0; i < policies->Size(); ++i) {
            config.policies_.push_back(readPolicy((*policies)[i], "policies[" + std::to_string(i) + "]"));
        }
    }

    if (const Value* logging = section(doc, "logging", "")) {
        std::string level = lowerName(config.logging_.level);
        read(*logging, "level", "logging", level);
        read(*logging, "file", "logging", config.logging_.file);
        try {
            config.logging_.level = logLevelFromString(level);
        } catch (const std::invalid_argument& e) {
            throw ConfigurationException(std::string("RiskGovernorConfiguration: ") + e.what());
        }
    }

    config.validate();
    return config;
}

std::string RiskGovernorConfiguration::toJson() const {
    Document doc;
    doc.SetObject();
    Allocator& a = doc.GetAllocator();

    Value engine(kObjectType);
    engine.AddMember("worker_threads", count(engine_.workerThreads), a);
    engine.AddMember("alpha_budget", engine_.alphaBudget, a);
    engine.AddMember("spending_policy", text(engine_.spendingPolicy, a), a);
    engine.AddMember("spending_half_life", engine_.spendingHalfLife, a);
    engine.AddMember("snapshot_directory", text(engine_.snapshotDirectory, a), a);
    engine.AddMember("snapshot_every_events", count(engine_.snapshotEveryEvents), a);
    engine.AddMember("quarantine_corrupt_snapshots", engine_.quarantineCorruptSnapshots, a);
    doc.AddMember("engine", engine, a);

    Value snapshots(kObjectType);
    snapshots.AddMember("flush_interval_ms", count(engine_.snapshots.flushIntervalMs), a);
    snapshots.AddMember("initial_backoff_ms", count(engine_.snapshots.initialBackoffMs), a);
    snapshots.AddMember("max_backoff_ms", count(engine_.snapshots.maxBackoffMs), a);
    doc.AddMember("snapshots", snapshots, a);

    doc.AddMember("lifecycle", writeLifecycle(engine_.lifecycle, a), a);
    doc.AddMember("stream_defaults", writeStream(engine_.streamDefaults, false, a), a);

    Value streams(kArrayType);
    for (const auto& stream : streams_) {
        streams.PushBack(writeStream(stream, true, a), a);
    }
    doc.AddMember("streams", streams, a);

    Value policies(kArrayType);
    for (const auto& policy : policies_) {
        Value entry(kObjectType);
        entry.AddMember("id", text(policy.id, a), a);
        entry.AddMember("version", text(policy.version, a), a);
        entry.AddMember("role", Value(policy.baseline ? "baseline" : "candidate", a), a);
        entry.AddMember("start_canary", policy.startCanary, a);
        policies.PushBack(entry, a);
    }
    doc.AddMember("policies", policies, a);

    Value logging(kObjectType);
    logging.AddMember("level", text(lowerName(logging_.level), a), a);
    logging.AddMember("file", text(logging_.file, a), a);
    doc.AddMember("logging", logging, a);

    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    doc.Accept(writer);

    return buffer.GetString();
}

void RiskGovernorConfiguration::saveToFile(const std::string& filePath) const {
    std::ofstream file(filePath);
    if (!file.is_open()) {
        throw ConfigurationException("RiskGovernorConfiguration: cannot open " + filePath + " for writing");
    }

    file << toJson() << '\n';
    file.close();
    if (file.fail()) {
        throw ConfigurationException("RiskGovernorConfiguration: failed writing " + filePath);
    }
}

std::vector<std::string> RiskGovernorConfiguration::validationErrors() const {
    std::vector<std::string> errors = engine_.validationErrors();

    std::set<std::string> ids;
    for (const auto& stream : streams_) {
        if (stream.streamId.empty()) {
            errors.push_back("streams: every entry needs an id");
            continue;
        }
        if (!ids.insert(stream.streamId).second) {
            errors.push_back("streams: duplicate id " + stream.streamId);
        }
        for (const auto& e : stream.validationErrors()) {
            errors.push_back("stream " + stream.streamId + ": " + e);
        }
    }

    std::set<std::string> policyIds;
    std::size_t baselines = 0;
    for (const auto& policy : policies_) {
        if (policy.id.empty()) {
            errors.push_back("policies: every entry needs an id");
            continue;
        }
        if (!policyIds.insert(policy.id).second) {
            errors.push_back("policies: duplicate id " + policy.id);
        }
        if (policy.baseline) {
            ++baselines;
        }
    }
    if (baselines > 1) {
        errors.push_back("policies: at most one baseline");
    }

    return errors;
}

void RiskGovernorConfiguration::validate() const {
    throwOnConfigurationErrors("RiskGovernorConfiguration", validationErrors());
}

} // namespace riskgovernor
