/**
 * Negation detector tests: family precedence, trigger removal, token
 * boundaries, and the false-positive phrases that must not negate.
 *
 * Run from build dir: ./test_negation
 */

#include "negation_detector.h"
#include "normalizer.h"
#include <iostream>
#include <string>
#include <vector>

using namespace domo_nlu;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    NegationDetector detector;
    Normalizer normalizer;

    // --- Direct ---
    NegationResult direct = detector.detect("no enciendas la luz");
    ASSERT(direct.is_negated);
    ASSERT(direct.type == NegationType::Direct);
    ASSERT(direct.trigger == "no");
    ASSERT(direct.scope == "enciendas");
    ASSERT(direct.confidence == NegationDetector::family_confidence(NegationType::Direct));
    ASSERT(direct.matched_span.start == 0);
    ASSERT(direct.removed_span.start == 0);
    ASSERT(direct.removed_span.length == 3);
    ASSERT(NegationDetector::strip("no enciendas la luz", direct) == "enciendas la luz");
    ASSERT(detector.remove_negation("no enciendas la luz") == "enciendas la luz");

    ASSERT(detector.remove_negation("por favor no apagues el ventilador") == "por favor apagues el ventilador");
    ASSERT(detector.detect("no abrir la puerta").type == NegationType::Direct);

    NegationResult english = detector.detect(normalizer.normalize("Don't turn on the light"));
    ASSERT(english.is_negated);
    ASSERT(english.type == NegationType::Direct);
    ASSERT(english.trigger == "don t");
    ASSERT(NegationDetector::strip("don t turn on the light", english) == "turn on the light");

    // --- Pronoun ---
    NegationResult pronoun = detector.detect("no la enciendas");
    ASSERT(pronoun.type == NegationType::Pronoun);
    ASSERT(pronoun.trigger == "no la");
    ASSERT(detector.remove_negation("no la enciendas") == "enciendas");
    ASSERT(detector.detect("no me la apagues").type == NegationType::Pronoun);

    // --- Compound ---
    NegationResult compound = detector.detect("no quiero que se encienda la luz");
    ASSERT(compound.type == NegationType::Compound);
    ASSERT(compound.trigger == "no quiero que se");
    ASSERT(detector.remove_negation("no quiero que se encienda la luz") == "encienda la luz");
    ASSERT(detector.detect("prefiero que no se abra la ventana").type == NegationType::Compound);
    // A bare "no" + verb inside a compound phrase is still direct
    ASSERT(detector.detect("prefiero que no abras la ventana").type == NegationType::Direct);
    ASSERT(detector.detect("i don t want to open the door").type == NegationType::Compound);

    // --- Prohibitive ---
    NegationResult prohibitive = detector.detect("deja de encender la luz");
    ASSERT(prohibitive.type == NegationType::Prohibitive);
    ASSERT(prohibitive.trigger == "deja de");
    ASSERT(detector.remove_negation("deja de encender la luz") == "encender la luz");
    ASSERT(detector.detect("evita abrir la puerta").type == NegationType::Prohibitive);
    ASSERT(detector.detect("avoid opening the garage").type == NegationType::Prohibitive);

    // --- Implicit ---
    NegationResult implicit = detector.detect("nunca apagues la alarma");
    ASSERT(implicit.type == NegationType::Implicit);
    ASSERT(implicit.confidence == NegationDetector::family_confidence(NegationType::Implicit));
    ASSERT(detector.remove_negation("nunca apagues la alarma") == "apagues la alarma");
    NegationResult bare = detector.detect("mejor no");
    ASSERT(bare.is_negated);
    ASSERT(bare.type == NegationType::Implicit);
    ASSERT(bare.scope.empty());
    ASSERT(detector.detect("todavia no").is_negated);
    ASSERT(detector.detect("never open the window").type == NegationType::Implicit);

    // --- Precedence: the higher family wins even when it starts later ---
    NegationResult mixed = detector.detect("nunca apagues y no enciendas la luz");
    ASSERT(mixed.type == NegationType::Direct);
    ASSERT(mixed.removed_span.start == 16);
    ASSERT(NegationDetector::strip("nunca apagues y no enciendas la luz", mixed) == "nunca apagues y enciendas la luz");
    ASSERT(detector.detect("mejor no abras la puerta").type == NegationType::Direct);

    // Within a family the earliest match wins
    NegationResult earliest = detector.detect("no cierres la puerta y no abras la ventana");
    ASSERT(earliest.scope == "cierres");
    ASSERT(earliest.removed_span.start == 0);

    // --- Confidence ordering across families ---
    ASSERT(NegationDetector::family_confidence(NegationType::Direct) >
           NegationDetector::family_confidence(NegationType::Pronoun));
    ASSERT(NegationDetector::family_confidence(NegationType::Pronoun) >
           NegationDetector::family_confidence(NegationType::Compound));
    ASSERT(NegationDetector::family_confidence(NegationType::Prohibitive) >
           NegationDetector::family_confidence(NegationType::Implicit));
    ASSERT(NegationDetector::family_confidence(NegationType::None) == 0.0f);

    // --- Token boundaries: "no" inside another word never triggers ---
    ASSERT(!detector.detect("cambia el nombre del sensor").is_negated);
    ASSERT(!detector.detect("enciende la luz del normando").is_negated);
    ASSERT(!detector.detect("enciende la luz de noche").is_negated);

    // --- False positives ---
    ASSERT(!detector.detect("no se si prender la luz").is_negated);
    ASSERT(!detector.detect("no puedes apagar la luz").is_negated);
    ASSERT(!detector.detect("por que no enciendes la luz").is_negated);
    ASSERT(!detector.detect("la luz ya no funciona").is_negated);

    // --- No trigger at all ---
    const std::vector<std::string> affirmative = {
        "enciende la luz",
        "abre la puerta del garaje",
        "turn off the kitchen light",
        "como esta la alarma",
        "",
    };
    for (const auto& text : affirmative) {
        NegationResult r = detector.detect(text);
        ASSERT(!r.is_negated);
        ASSERT(r.type == NegationType::None);
        ASSERT(r.confidence == 0.0f);
        ASSERT(detector.remove_negation(text) == text);
    }

    // "no" alone is not a negated command
    ASSERT(!detector.detect("no").is_negated);

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All negation tests passed.\n";
    return 0;
}
