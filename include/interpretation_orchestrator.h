#pragma once

#include "common.h"
#include "config.h"
#include "entity_resolver.h"
#include "errors.h"
#include "fallback_client.h"
#include "intent_classifier.h"
#include "interpretation_state.h"
#include "negation_detector.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace domo_nlu {

/**
 * @brief Everything the pipeline computed for one request
 */
struct InterpretationTrace {
    std::string original_text;
    std::string normalized_text;
    std::string clean_text;             ///< normalized_text with the negation trigger removed
    NegationResult negation;
    IntentMatch intent;
    DeviceMatch device;
    bool gate_passed = false;
    std::vector<InterpretationState> states;
    std::optional<Error> fallback_error;
    uint64_t vocabulary_version = 0;
    Interpretation result;
};

/**
 * @brief Composes the rule stages, applies the confidence gate, and delegates or degrades
 *
 * normalize -> detect negation -> strip trigger -> classify -> resolve device/room -> gate.
 * The gate passes when intent confidence >= intent_threshold and either device
 * confidence >= device_threshold or the intent needs no device (status).
 * Otherwise the original text is sent to the fallback; its answer is taken verbatim.
 * The negation flag always comes from the rule stage.
 *
 * interpret() never throws and never surfaces fallback failures: those degrade to
 * the best rule-based guess with degraded=true and a note. Safe to call
 * concurrently; reload_vocabulary() swaps the device snapshot atomically.
 */
class InterpretationOrchestrator {
public:
    /**
     * @param config Pipeline configuration (thresholds, strategies, locales)
     * @param fallback Optional fallback interpreter; ignored when config.fallback.enabled is false
     */
    explicit InterpretationOrchestrator(const Config& config,
                                        std::shared_ptr<FallbackInterpreter> fallback = nullptr);
    ~InterpretationOrchestrator();

    InterpretationOrchestrator(const InterpretationOrchestrator&) = delete;
    InterpretationOrchestrator& operator=(const InterpretationOrchestrator&) = delete;

    Interpretation interpret(const std::string& text, const CancelToken& cancel = nullptr) const;

    InterpretationTrace interpret_traced(const std::string& text, const CancelToken& cancel = nullptr) const;

    /**
     * @brief Replace the device vocabulary; on failure the previous one keeps serving
     */
    Result<void> reload_vocabulary(const std::vector<DeviceRecord>& snapshot);

    std::shared_ptr<const AliasTable> vocabulary() const;

    bool has_fallback() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/// {"intent": ..., "device": ..., "negated": ..., "source": ...[, "degraded": true, "note": ...]}
std::string to_json(const Interpretation& interpretation);

/// Diagnostic dump of a trace (stages, confidences, states)
std::string trace_to_json(const InterpretationTrace& trace);

} // namespace domo_nlu
