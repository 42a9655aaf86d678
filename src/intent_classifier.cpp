#include "intent_classifier.h"
#include "logger.h"
#include "text_match.h"
#include <algorithm>
#include <cmath>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace domo_nlu {

class IntentClassifier::Impl {
public:
    Impl(const ClassifierConfig& config, const std::vector<PatternRule>& rules)
        : leading_bonus_(config.leading_bonus) {
        for (size_t index = 0; index < rules.size(); ++index) {
            const auto& rule = rules[index];
            if (!config.locales.empty() &&
                std::find(config.locales.begin(), config.locales.end(), rule.locale) == config.locales.end()) {
                continue;
            }
            CompiledRule compiled;
            compiled.rule = rule;
            compiled.index = index;
            for (const auto& expression : rule.expressions) {
                try {
                    compiled.patterns.push_back(compile_token_pattern(expression));
                } catch (const std::regex_error& e) {
                    throw std::runtime_error("Invalid expression in intent rule " + rule.id + ": " + e.what());
                }
            }
            rules_.push_back(std::move(compiled));
        }
    }

    std::vector<IntentMatch> match_all(const std::string& text) const {
        std::vector<IntentMatch> matches;
        if (text.empty()) {
            return matches;
        }

        for (const auto& compiled : rules_) {
            TextSpan best_span;
            bool fired = false;
            for (const auto& pattern : compiled.patterns) {
                TextSpan span;
                bool hit = false;
                try {
                    hit = search_token_pattern(pattern, text, span);
                } catch (const std::regex_error& e) {
                    // Complexity/stack errors on pathological input count as no match
                    Logger::warn("Intent rule " + compiled.rule.id + " failed on input: " + e.what());
                    hit = false;
                }
                if (hit && (!fired || span.start < best_span.start)) {
                    best_span = span;
                    fired = true;
                }
            }
            if (!fired) {
                continue;
            }

            IntentMatch match;
            match.intent = compiled.rule.intent;
            match.rule_id = compiled.rule.id;
            match.locale = compiled.rule.locale;
            match.span = best_span;
            match.matched_text = text.substr(best_span.start, best_span.length);
            match.rule_index = compiled.index;
            float confidence = compiled.rule.base_confidence;
            if (best_span.start == 0) {
                confidence += leading_bonus_;
            }
            // Quantize so base + bonus ties exactly with an equal base confidence
            match.confidence = clamp_confidence(std::round(confidence * 1000.0f) / 1000.0f);
            matches.push_back(match);
        }

        std::sort(matches.begin(), matches.end(), [](const IntentMatch& a, const IntentMatch& b) {
            if (a.confidence != b.confidence) return a.confidence > b.confidence;
            if (a.span.start != b.span.start) return a.span.start < b.span.start;
            return a.rule_index < b.rule_index;
        });
        return matches;
    }

    IntentMatch match(const std::string& text) const {
        auto matches = match_all(text);
        if (matches.empty()) {
            LOG_INTENT("no rule matched \"" + text + "\"");
            return IntentMatch();
        }
        const auto& best = matches.front();
        std::ostringstream oss;
        oss << to_string(best.intent) << " via " << best.rule_id << " (\"" << best.matched_text
            << "\" @" << best.span.start << ", conf=" << best.confidence << ", "
            << matches.size() << " candidate(s))";
        LOG_INTENT(oss.str());
        return best;
    }

    size_t rule_count() const {
        return rules_.size();
    }

private:
    struct CompiledRule {
        PatternRule rule;
        size_t index = 0;
        std::vector<std::regex> patterns;
    };

    float leading_bonus_;
    std::vector<CompiledRule> rules_;
};

IntentClassifier::IntentClassifier(const ClassifierConfig& config, const std::vector<PatternRule>& rules)
    : pimpl_(std::make_unique<Impl>(config, rules)) {}

IntentClassifier::~IntentClassifier() = default;

IntentMatch IntentClassifier::match(const std::string& text) const {
    return pimpl_->match(text);
}

std::vector<IntentMatch> IntentClassifier::match_all(const std::string& text) const {
    return pimpl_->match_all(text);
}

size_t IntentClassifier::rule_count() const {
    return pimpl_->rule_count();
}

} // namespace domo_nlu
