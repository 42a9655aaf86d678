/**
 * Intent classifier tests: built-in Spanish/English rules, leading bonus,
 * total ordering of candidates, locale filtering, and custom registries.
 *
 * Run from build dir: ./test_intent_classifier
 */

#include "intent_classifier.h"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace domo_nlu;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    IntentClassifier classifier;
    ASSERT(classifier.rule_count() == builtin_intent_rules().size());

    // --- Built-in rules ---
    IntentMatch on = classifier.match("enciende la luz");
    ASSERT(on.intent == IntentKind::TurnOn);
    ASSERT(on.rule_id == "es.turn_on.imperative");
    ASSERT(on.matched_text == "enciende");
    ASSERT(on.span.start == 0);
    ASSERT(on.confidence == 0.95f);

    // Same rule, not at the start: no bonus
    IntentMatch later = classifier.match("la luz enciende");
    ASSERT(later.intent == IntentKind::TurnOn);
    ASSERT(later.confidence == 0.9f);

    ASSERT(classifier.match("apaga la luz de la cocina").intent == IntentKind::TurnOff);
    ASSERT(classifier.match("abre la puerta").intent == IntentKind::Open);
    ASSERT(classifier.match("cierra la ventana").intent == IntentKind::Close);
    ASSERT(classifier.match("sube la persiana").intent == IntentKind::Open);
    ASSERT(classifier.match("baja las cortinas").intent == IntentKind::Close);
    ASSERT(classifier.match("esta encendida la luz").intent == IntentKind::Status);
    ASSERT(classifier.match("alterna la luz").intent == IntentKind::Toggle);

    // Negation-stripped subjunctive keeps the affirmative intent
    IntentMatch subjunctive = classifier.match("enciendas la luz");
    ASSERT(subjunctive.intent == IntentKind::TurnOn);
    ASSERT(subjunctive.rule_id == "es.turn_on.subjunctive");
    ASSERT(subjunctive.confidence == 0.9f);

    // English
    IntentMatch english = classifier.match("turn on the kitchen light");
    ASSERT(english.intent == IntentKind::TurnOn);
    ASSERT(english.locale == "en");
    ASSERT(classifier.match("switch the light off").intent == IntentKind::TurnOff);
    ASSERT(classifier.match("is the garage door open").intent == IntentKind::Status);
    ASSERT(classifier.match("toggle the lamp").intent == IntentKind::Toggle);

    // Implicit status sits below the gate unless it leads
    IntentMatch implicit = classifier.match("la tele funciona");
    ASSERT(implicit.intent == IntentKind::Status);
    ASSERT(implicit.confidence == 0.75f);

    // --- No match ---
    IntentMatch none = classifier.match("hola que tal");
    ASSERT(none.intent == IntentKind::Unknown);
    ASSERT(none.confidence == 0.0f);
    ASSERT(none.rule_id.empty());
    ASSERT(classifier.match_all("hola que tal").empty());
    ASSERT(classifier.match("").intent == IntentKind::Unknown);

    // Token boundaries: "prendedor" is not "prende"
    ASSERT(classifier.match("el prendedor rojo").intent == IntentKind::Unknown);

    // --- Very long tokens ---
    const std::string blob(50000, 'a');
    ASSERT(classifier.match("is " + blob + " on").intent == IntentKind::Unknown);
    ASSERT(classifier.match("turn " + blob + " on").intent == IntentKind::Unknown);
    ASSERT(classifier.match("turn " + blob).intent == IntentKind::Unknown);

    IntentMatch before_blob = classifier.match("turn the lamp on " + blob);
    ASSERT(before_blob.intent == IntentKind::TurnOn);
    ASSERT(before_blob.span.start == 0);
    ASSERT(before_blob.confidence == 0.95f);

    IntentMatch after_blob = classifier.match(blob + " enciende la luz");
    ASSERT(after_blob.intent == IntentKind::TurnOn);
    ASSERT(after_blob.span.start == blob.size() + 1);
    ASSERT(after_blob.matched_text == "enciende");
    ASSERT(after_blob.confidence == 0.9f);

    // Custom rules with unbounded repetition stay safe too
    std::vector<PatternRule> greedy = {{"test.greedy", IntentKind::Toggle, {"cambia .+"}, 0.9f, "es"}};
    IntentClassifier greedy_classifier(ClassifierConfig(), greedy);
    ASSERT(greedy_classifier.match("cambia " + blob).intent == IntentKind::Unknown);
    ASSERT(greedy_classifier.match("cambia el modo").intent == IntentKind::Toggle);

    // --- Total order: confidence desc, span start asc, registration asc ---
    std::vector<IntentMatch> all = classifier.match_all("encender y apaga la luz");
    ASSERT(all.size() >= 2);
    if (all.size() >= 2) {
        // Infinitive (0.85) + leading bonus ties the later imperative (0.90)
        ASSERT(all[0].intent == IntentKind::TurnOn);
        ASSERT(all[1].intent == IntentKind::TurnOff);
        ASSERT(all[0].confidence == all[1].confidence);
        ASSERT(all[0].span.start < all[1].span.start);
    }
    ASSERT(classifier.match("encender y apaga la luz").intent == IntentKind::TurnOn);

    std::vector<IntentMatch> ordered = classifier.match_all("prende la luz o apaga el ventilador y abre la puerta");
    ASSERT(ordered.size() >= 3);
    for (size_t i = 1; i < ordered.size(); ++i) {
        ASSERT(ordered[i - 1].confidence >= ordered[i].confidence);
        if (ordered[i - 1].confidence == ordered[i].confidence) {
            ASSERT(ordered[i - 1].span.start <= ordered[i].span.start);
        }
    }
    if (!ordered.empty()) {
        ASSERT(ordered[0].intent == IntentKind::TurnOn);
    }

    // Registration order breaks exact ties
    std::vector<PatternRule> tied = {
        {"test.first", IntentKind::TurnOn, {"luz"}, 0.8f, "es"},
        {"test.second", IntentKind::TurnOff, {"luz"}, 0.8f, "es"},
    };
    IntentClassifier tie_classifier(ClassifierConfig(), tied);
    std::vector<IntentMatch> tie = tie_classifier.match_all("la luz");
    ASSERT(tie.size() == 2);
    if (tie.size() == 2) {
        ASSERT(tie[0].rule_id == "test.first");
        ASSERT(tie[0].rule_index == 0);
        ASSERT(tie[1].rule_index == 1);
    }

    // --- Leading bonus is configurable ---
    ClassifierConfig no_bonus;
    no_bonus.leading_bonus = 0.0f;
    IntentClassifier flat(no_bonus);
    ASSERT(flat.match("enciende la luz").confidence == 0.9f);

    // Confidence is capped at 1
    std::vector<PatternRule> strong = {{"test.strong", IntentKind::Open, {"abre"}, 0.99f, "es"}};
    ClassifierConfig big_bonus;
    big_bonus.leading_bonus = 0.5f;
    IntentClassifier capped(big_bonus, strong);
    ASSERT(capped.match("abre").confidence == 1.0f);

    // --- Locale filter ---
    ClassifierConfig spanish_only;
    spanish_only.locales = {"es"};
    IntentClassifier spanish(spanish_only);
    ASSERT(spanish.rule_count() < classifier.rule_count());
    ASSERT(spanish.match("turn on the light").intent == IntentKind::Unknown);
    ASSERT(spanish.match("enciende la luz").intent == IntentKind::TurnOn);

    // --- Invalid expressions fail at construction ---
    bool threw = false;
    try {
        std::vector<PatternRule> broken = {{"test.broken", IntentKind::Open, {"(abre"}, 0.9f, "es"}};
        IntentClassifier bad(ClassifierConfig(), broken);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ASSERT(threw);

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All intent classifier tests passed.\n";
    return 0;
}
