#include "negation_detector.h"
#include "logger.h"
#include "text_match.h"
#include "utils.h"
#include <stdexcept>

namespace domo_nlu {

namespace {

// Negatable verb forms, accent-folded as produced by Normalizer.
const std::string kSubjunctive =
    "enciendas?|prendas?|actives?|inicies?|arranques?|conectes?|"
    "apagues?|desactives?|detengas?|pares?|desconectes?|cortes?|"
    "abras?|despejes?|descorras?|levantes?|subas?|destapes?|"
    "cierres?|corras?|bajes?|tapes?|bloquees?|alternes?|cambies?";

const std::string kInfinitive =
    "(?:encender|prender|activar|iniciar|arrancar|conectar|"
    "apagar|desactivar|detener|parar|desconectar|cortar|"
    "abrir|despejar|descorrer|levantar|subir|destapar|"
    "cerrar|correr|bajar|tapar|bloquear|alternar|cambiar)(?:la|lo|las|los|le|les|me)?";

const std::string kSpanishVerb = kSubjunctive + "|" + kInfinitive;

const std::string kEnglishVerb =
    "turn|switch|open|close|start|stop|activate|deactivate|enable|disable|"
    "power|shut|lock|unlock|raise|lower|toggle";

const std::string kEnglishGerund =
    "turning|switching|opening|closing|starting|stopping|locking|unlocking|activating|enabling";

struct PatternSpec {
    NegationType type;
    const char* trigger;
    std::string follow;
    bool follow_optional;
};

/// Families in precedence order. Triggers and follows may only use non-capturing groups.
const std::vector<PatternSpec>& pattern_specs() {
    static const std::vector<PatternSpec> specs = {
        {NegationType::Direct, "no", kSpanishVerb, false},
        {NegationType::Direct, "(?:do not|don t|dont)", kEnglishVerb, false},

        {NegationType::Pronoun, "no (?:(?:me|te|se) )?(?:la|lo|las|los|le|les|me|te)", kSpanishVerb, false},

        {NegationType::Compound, "no (?:quiero|queremos|deseo|necesito|me gustaria)(?: que)?(?: se)?(?: (?:la|lo|las|los))?", kSpanishVerb, false},
        {NegationType::Compound, "(?:prefiero|preferiria)(?: que)? no(?: se)?", kSpanishVerb, false},
        {NegationType::Compound, "que no se", kSpanishVerb, false},
        {NegationType::Compound, "i (?:do not|don t|dont) want(?: you)?(?: to)?", kEnglishVerb, false},

        {NegationType::Prohibitive, "(?:deja|dejen|deje|para|paren|pare) de", kInfinitive, false},
        {NegationType::Prohibitive, "(?:evita|evitar|evites|sin)", kInfinitive, false},
        {NegationType::Prohibitive, "(?:avoid|without)", kEnglishGerund, false},

        {NegationType::Implicit, "mejor(?: que)? no(?: se)?", kSpanishVerb, true},
        {NegationType::Implicit, "(?:todavia|aun) no", kSpanishVerb, true},
        {NegationType::Implicit, "(?:nunca|jamas)(?: se)?(?: (?:la|lo|las|los))?", kSpanishVerb, false},
        {NegationType::Implicit, "nada de", kInfinitive, false},
        {NegationType::Implicit, "never", kEnglishVerb, false},
        {NegationType::Implicit, "better not", kEnglishVerb, true},
    };
    return specs;
}

const std::vector<const char*>& exception_bodies() {
    static const std::vector<const char*> bodies = {
        "no se (?:si|como|que)",
        "no (?:puedes|podrias|podes)",
        "por que no",
        "como no",
        "(?:ya|que) no (?:esta|funciona)",
    };
    return bodies;
}

} // namespace

NegationDetector::NegationDetector() {
    for (const auto& spec : pattern_specs()) {
        std::string follow = spec.follow_optional
            ? "(?: (" + spec.follow + "))?"
            : " (" + spec.follow + ")";
        std::string body = "(?:^| )((" + std::string(spec.trigger) + ")" + follow + ")(?= |$)";
        try {
            patterns_.push_back({spec.type, std::regex(body, std::regex::ECMAScript | std::regex::optimize)});
        } catch (const std::regex_error& e) {
            throw std::runtime_error("Invalid negation pattern '" + std::string(spec.trigger) + "': " + e.what());
        }
    }
    for (const char* body : exception_bodies()) {
        try {
            exceptions_.push_back(compile_token_pattern(body));
        } catch (const std::regex_error& e) {
            throw std::runtime_error("Invalid negation exception '" + std::string(body) + "': " + e.what());
        }
    }
}

float NegationDetector::family_confidence(NegationType type) {
    switch (type) {
        case NegationType::Direct:      return 0.95f;
        case NegationType::Pronoun:     return 0.90f;
        case NegationType::Compound:    return 0.85f;
        case NegationType::Prohibitive: return 0.85f;
        case NegationType::Implicit:    return 0.75f;
        case NegationType::None:        return 0.0f;
    }
    return 0.0f;
}

NegationResult NegationDetector::detect(const std::string& normalized_text) const {
    NegationResult result;
    if (normalized_text.empty()) {
        return result;
    }

    TextSpan unused;
    for (const auto& exception : exceptions_) {
        if (search_token_pattern(exception, normalized_text, unused)) {
            LOG_NEG("false-positive phrase, not negated: \"" + normalized_text + "\"");
            return result;
        }
    }

    // Patterns are grouped by family in precedence order; within a family the earliest span wins.
    NegationType current_family = NegationType::None;
    std::smatch best;
    bool have_best = false;

    for (const auto& pattern : patterns_) {
        if (pattern.type != current_family) {
            if (have_best) break;
            current_family = pattern.type;
        }
        std::smatch m;
        if (!std::regex_search(normalized_text, m, pattern.regex)) {
            continue;
        }
        if (!have_best || m.position(1) < best.position(1)) {
            best = m;
            have_best = true;
        }
    }

    if (!have_best) {
        return result;
    }

    result.is_negated = true;
    result.type = current_family;
    result.confidence = family_confidence(current_family);
    result.trigger = best.str(2);
    result.scope = best[3].matched ? best.str(3) : std::string();
    result.matched_span.start = static_cast<size_t>(best.position(1));
    result.matched_span.length = static_cast<size_t>(best.length(1));

    result.removed_span.start = static_cast<size_t>(best.position(2));
    result.removed_span.length = static_cast<size_t>(best.length(2));
    if (result.removed_span.end() < normalized_text.size() &&
        normalized_text[result.removed_span.end()] == ' ') {
        result.removed_span.length += 1;
    }

    LOG_NEG(std::string(to_string(result.type)) + " negation, trigger=\"" + result.trigger +
            "\" scope=\"" + result.scope + "\"");
    return result;
}

std::string NegationDetector::strip(const std::string& normalized_text, const NegationResult& result) {
    if (!result.is_negated || result.removed_span.end() > normalized_text.size()) {
        return utils::collapse_spaces(normalized_text);
    }
    std::string clean = normalized_text;
    clean.erase(result.removed_span.start, result.removed_span.length);
    return utils::collapse_spaces(clean);
}

std::string NegationDetector::remove_negation(const std::string& normalized_text) const {
    return strip(normalized_text, detect(normalized_text));
}

} // namespace domo_nlu
