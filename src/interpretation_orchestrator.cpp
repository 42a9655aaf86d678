#include "interpretation_orchestrator.h"
#include "logger.h"
#include "normalizer.h"
#include <atomic>
#include <iomanip>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace domo_nlu {

namespace {

std::string format_confidence(float value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

/// Why the gate rejected the rule result
std::string gate_failure_reason(const IntentMatch& intent, const DeviceMatch& device, const GateConfig& gate) {
    if (intent.intent == IntentKind::Unknown) {
        return "no intent recognized";
    }
    if (intent.confidence < gate.intent_threshold) {
        return "low intent confidence";
    }
    if (!device.device_key) {
        return "device not specified";
    }
    return "low device confidence";
}

} // namespace

class InterpretationOrchestrator::Impl {
public:
    Impl(const Config& config, std::shared_ptr<FallbackInterpreter> fallback)
        : config_(config)
        , normalizer_(config.normalizer)
        , classifier_(config.classifier)
        , resolver_(config.resolver, config.normalizer)
        , fallback_(config.fallback.enabled ? std::move(fallback) : nullptr)
        , next_request_id_(1) {
        LOG_INFO("Interpretation pipeline ready (" + std::to_string(classifier_.rule_count()) +
                 " intent rules, fallback " + (fallback_ ? fallback_->name() : std::string("disabled")) + ")");
    }

    InterpretationTrace run(const std::string& text, const CancelToken& cancel) const {
        uint64_t request_id = next_request_id_.fetch_add(1);
        InterpretationTrace trace;
        InterpretationStateMachine machine;
        trace.original_text = text;

        // One snapshot for the whole request, even if a reload lands mid-way
        auto table = resolver_.snapshot();
        trace.vocabulary_version = table->version;

        trace.normalized_text = normalizer_.normalize(text);
        LOG_TRACE(request_id, "normalize", "text=\"" + trace.normalized_text + "\"");

        trace.negation = negation_.detect(trace.normalized_text);
        trace.clean_text = NegationDetector::strip(trace.normalized_text, trace.negation);
        if (trace.negation.is_negated) {
            LOG_TRACE(request_id, "negation", std::string("type=") + to_string(trace.negation.type) +
                      " trigger=\"" + trace.negation.trigger + "\"");
        }

        trace.intent = classifier_.match(trace.clean_text);
        LOG_TRACE(request_id, "intent", std::string("intent=") + to_string(trace.intent.intent) +
                  " confidence=" + format_confidence(trace.intent.confidence) + " rule=" + trace.intent.rule_id);

        trace.device = resolver_.match(trace.clean_text, *table);
        LOG_TRACE(request_id, "entity", "device=" + trace.device.device_key.value_or("null") +
                  " confidence=" + format_confidence(trace.device.confidence) +
                  " strategy=" + to_string(trace.device.strategy));

        const GateConfig& gate = config_.gate;
        bool intent_ok = trace.intent.intent != IntentKind::Unknown &&
                         trace.intent.confidence >= gate.intent_threshold;
        bool device_ok = !intent_requires_device(trace.intent.intent) ||
                         (trace.device.device_key && trace.device.confidence >= gate.device_threshold);
        trace.gate_passed = intent_ok && device_ok;

        Interpretation result;
        result.negated = trace.negation.is_negated;

        if (trace.gate_passed) {
            LOG_GATE("pass intent=" + std::string(to_string(trace.intent.intent)) +
                     " (" + format_confidence(trace.intent.confidence) + ") device=" +
                     trace.device.device_key.value_or("null") + " (" + format_confidence(trace.device.confidence) + ")");
            machine.on_gate_passed();
            result.intent = trace.intent.intent;
            result.device_key = trace.device.device_key;
            result.source = InterpretationSource::Rules;
        } else {
            std::string reason = gate_failure_reason(trace.intent, trace.device, gate);
            LOG_GATE("fail: " + reason + " (intent " + format_confidence(trace.intent.confidence) +
                     ", device " + format_confidence(trace.device.confidence) + ")");
            machine.on_gate_failed(fallback_ != nullptr);

            std::string fallback_status;
            if (fallback_) {
                auto answer = consult_fallback(text, trace.negation.is_negated, *table, cancel);
                if (answer.is_ok()) {
                    machine.on_fallback_answered();
                    result.intent = answer.value().intent;
                    result.device_key = answer.value().device_key;
                    result.source = InterpretationSource::Fallback;
                } else {
                    machine.on_fallback_failed();
                    trace.fallback_error = answer.error();
                    fallback_status = "fallback " + describe(answer.error());
                    LOG_WARN("[Fallback] " + fallback_->name() + " failed: " + answer.error().message);
                }
            } else {
                fallback_status = "fallback disabled";
            }

            if (result.source != InterpretationSource::Fallback) {
                result.intent = trace.intent.intent;
                if (trace.device.device_key && trace.device.confidence > 0.0f) {
                    result.device_key = trace.device.device_key;
                }
                result.source = InterpretationSource::Rules;
                result.degraded = true;
                result.note = reason + "; " + fallback_status;
            }
        }

        trace.states = machine.history();
        trace.result = result;
        LOG_TRACE(request_id, "resolved", machine.history_string());
        return trace;
    }

    Result<void> reload_vocabulary(const std::vector<DeviceRecord>& snapshot) {
        return resolver_.reload(snapshot);
    }

    std::shared_ptr<const AliasTable> vocabulary() const {
        return resolver_.snapshot();
    }

    bool has_fallback() const {
        return fallback_ != nullptr;
    }

private:
    Config config_;
    Normalizer normalizer_;
    NegationDetector negation_;
    IntentClassifier classifier_;
    EntityResolver resolver_;
    std::shared_ptr<FallbackInterpreter> fallback_;
    mutable std::atomic<uint64_t> next_request_id_;

    /// Fallback implementations report failures as errors; a throwing one is treated the same way
    Result<FallbackAnswer> consult_fallback(const std::string& text, bool negated,
                                            const AliasTable& table, const CancelToken& cancel) const {
        FallbackRequest request;
        request.text = text;
        request.hint_negated = negated;
        request.devices = table.devices;

        LOG_FALLBACK("delegating to " + fallback_->name());
        try {
            return fallback_->interpret(request, cancel);
        } catch (const std::exception& e) {
            return make_internal_error(std::string("fallback threw: ") + e.what());
        }
    }
};

InterpretationOrchestrator::InterpretationOrchestrator(const Config& config,
                                                       std::shared_ptr<FallbackInterpreter> fallback)
    : pimpl_(std::make_unique<Impl>(config, std::move(fallback))) {}

InterpretationOrchestrator::~InterpretationOrchestrator() = default;

Interpretation InterpretationOrchestrator::interpret(const std::string& text, const CancelToken& cancel) const {
    return pimpl_->run(text, cancel).result;
}

InterpretationTrace InterpretationOrchestrator::interpret_traced(const std::string& text,
                                                                 const CancelToken& cancel) const {
    return pimpl_->run(text, cancel);
}

Result<void> InterpretationOrchestrator::reload_vocabulary(const std::vector<DeviceRecord>& snapshot) {
    return pimpl_->reload_vocabulary(snapshot);
}

std::shared_ptr<const AliasTable> InterpretationOrchestrator::vocabulary() const {
    return pimpl_->vocabulary();
}

bool InterpretationOrchestrator::has_fallback() const {
    return pimpl_->has_fallback();
}

std::string to_json(const Interpretation& interpretation) {
    json j;
    j["intent"] = to_string(interpretation.intent);
    if (interpretation.device_key) {
        j["device"] = *interpretation.device_key;
    } else {
        j["device"] = nullptr;
    }
    j["negated"] = interpretation.negated;
    j["source"] = to_string(interpretation.source);
    if (interpretation.degraded) {
        j["degraded"] = true;
        j["note"] = interpretation.note;
    }
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string trace_to_json(const InterpretationTrace& trace) {
    json j;
    j["text"] = trace.original_text;
    j["normalized"] = trace.normalized_text;
    j["clean"] = trace.clean_text;
    j["vocabulary_version"] = trace.vocabulary_version;

    j["negation"]["negated"] = trace.negation.is_negated;
    j["negation"]["type"] = to_string(trace.negation.type);
    j["negation"]["trigger"] = trace.negation.trigger;
    j["negation"]["scope"] = trace.negation.scope;
    j["negation"]["confidence"] = trace.negation.confidence;

    j["intent"]["intent"] = to_string(trace.intent.intent);
    j["intent"]["confidence"] = trace.intent.confidence;
    j["intent"]["rule"] = trace.intent.rule_id;
    j["intent"]["matched"] = trace.intent.matched_text;

    if (trace.device.device_key) {
        j["device"]["device"] = *trace.device.device_key;
    } else {
        j["device"]["device"] = nullptr;
    }
    j["device"]["confidence"] = trace.device.confidence;
    j["device"]["strategy"] = to_string(trace.device.strategy);
    j["device"]["alias"] = trace.device.matched_alias;
    if (trace.device.detected_room) {
        j["device"]["room"] = *trace.device.detected_room;
    }
    j["device"]["room_override"] = trace.device.room_override;

    j["gate_passed"] = trace.gate_passed;
    json states = json::array();
    for (auto state : trace.states) {
        states.push_back(to_string(state));
    }
    j["states"] = states;
    if (trace.fallback_error) {
        j["fallback_error"]["type"] = to_string(trace.fallback_error->type);
        j["fallback_error"]["message"] = trace.fallback_error->message;
    }
    j["result"] = json::parse(to_json(trace.result));
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace domo_nlu
