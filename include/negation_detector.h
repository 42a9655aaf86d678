#pragma once

#include "common.h"
#include <string>
#include <vector>
#include <regex>

namespace domo_nlu {

/**
 * @brief Outcome of negation detection on normalized text
 */
struct NegationResult {
    bool is_negated = false;
    NegationType type = NegationType::None;
    std::string trigger;        ///< Removed trigger tokens, e.g. "no", "no la", "deja de"
    std::string scope;          ///< Verb text that followed the trigger, if captured
    float confidence = 0.0f;
    TextSpan matched_span;      ///< Trigger plus scope
    TextSpan removed_span;      ///< Trigger plus the space that joined it to the scope
};

/**
 * @brief Detects Spanish/English negation and strips its trigger
 *
 * Pattern families are evaluated in a fixed precedence:
 * direct > pronoun > compound > prohibitive > implicit.
 * The first family with any token-bounded match wins. Known false positives
 * ("no se si", "por que no", "no puedes") short-circuit to not negated.
 *
 * All operations are pure; one instance may be shared across threads.
 */
class NegationDetector {
public:
    /// Compiles the built-in families; throws std::runtime_error if one is invalid
    NegationDetector();

    /**
     * @brief Classify negation in already-normalized text
     */
    NegationResult detect(const std::string& normalized_text) const;

    /**
     * @brief Detect and strip the trigger span ("no enciendas la luz" -> "enciendas la luz")
     * Text without negation is returned unchanged (whitespace collapsed).
     */
    std::string remove_negation(const std::string& normalized_text) const;

    /**
     * @brief Strip the removed span of an existing result without detecting again
     */
    static std::string strip(const std::string& normalized_text, const NegationResult& result);

    /// Fixed confidence assigned to each family
    static float family_confidence(NegationType type);

private:
    struct CompiledPattern {
        NegationType type;
        std::regex regex;
    };

    std::vector<CompiledPattern> patterns_;
    std::vector<std::regex> exceptions_;
};

} // namespace domo_nlu
