#pragma once

#include "config.h"
#include <string>
#include <vector>

namespace domo_nlu {

/**
 * @brief Canonicalizes raw command text into a matchable, single-spaced token stream
 *
 * Lowercases (ASCII and Latin-1 capitals), replaces punctuation with spaces,
 * folds diacritics to ASCII while keeping ñ, expands whole-token colloquialisms,
 * fixes common typos, and collapses whitespace. Digit sequences survive verbatim,
 * including a decimal point or comma between digits and a trailing %.
 *
 * normalize() is pure and idempotent for a given configuration.
 */
class Normalizer {
public:
    explicit Normalizer(const NormalizerConfig& config = NormalizerConfig());

    /**
     * @brief Normalize raw text. Never fails; empty input yields empty output.
     */
    std::string normalize(const std::string& text) const;

    /**
     * @brief Normalize, then split into whitespace-delimited tokens (order preserved)
     */
    std::vector<std::string> tokenize(const std::string& text) const;

    /**
     * @brief Numeric spans of already-normalized text ("50%", "2.5", "21")
     */
    static std::vector<std::string> extract_numbers(const std::string& normalized_text);

    /**
     * @brief Spanish/English function words ignored by n-gram and partial matching
     */
    static bool is_stopword(const std::string& token);

private:
    NormalizerConfig config_;

    static std::string fold_characters(const std::string& text);
};

} // namespace domo_nlu
