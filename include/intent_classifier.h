#pragma once

#include "common.h"
#include "config.h"
#include <string>
#include <vector>
#include <memory>

namespace domo_nlu {

/**
 * @brief Static intent rule: any expression matching a token-bounded span fires the rule
 */
struct PatternRule {
    std::string id;                        ///< e.g. "es.turn_on.imperative"
    IntentKind intent = IntentKind::Unknown;
    std::vector<std::string> expressions;  ///< Regex bodies over normalized text (non-capturing groups only)
    float base_confidence = 0.0f;
    std::string locale;                    ///< "es" | "en"
};

/**
 * @brief Result of classifying one text
 */
struct IntentMatch {
    IntentKind intent = IntentKind::Unknown;
    float confidence = 0.0f;
    std::string rule_id;
    std::string matched_text;
    TextSpan span;
    std::string locale;
    size_t rule_index = 0;   ///< Registration index, last tie-breaker
};

/**
 * @brief Built-in Spanish/English registry, in registration order
 */
const std::vector<PatternRule>& builtin_intent_rules();

/**
 * @brief Scores normalized, de-negated text against an immutable rule registry
 *
 * Confidence is the rule's base confidence plus leading_bonus when its span
 * starts the utterance, capped at 1. Results are totally ordered by
 * confidence (desc), span start (asc), then registration index (asc).
 *
 * The registry is compiled once at construction and never mutated, so one
 * classifier may serve any number of threads.
 */
class IntentClassifier {
public:
    /**
     * @brief Compile rules; throws std::runtime_error if an expression is invalid
     */
    explicit IntentClassifier(const ClassifierConfig& config = ClassifierConfig(),
                              const std::vector<PatternRule>& rules = builtin_intent_rules());
    ~IntentClassifier();

    IntentClassifier(const IntentClassifier&) = delete;
    IntentClassifier& operator=(const IntentClassifier&) = delete;

    /**
     * @brief Best match, or Unknown with confidence 0 when no rule fires
     */
    IntentMatch match(const std::string& text) const;

    /**
     * @brief Every rule that fired, in the classifier's total order
     */
    std::vector<IntentMatch> match_all(const std::string& text) const;

    /// Number of rules active after locale filtering
    size_t rule_count() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace domo_nlu
