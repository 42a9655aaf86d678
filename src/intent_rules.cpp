#include "intent_classifier.h"

namespace domo_nlu {

// Expressions run against normalized text: lowercase, accent-folded (ñ kept), single-spaced.
// Subjunctive forms are needed because negation stripping leaves "enciendas la luz".
// Repetitions are bounded: std::regex recurses once per character a quantifier consumes.
const std::vector<PatternRule>& builtin_intent_rules() {
    static const std::vector<PatternRule> rules = {
        // ---- turn_on ----
        {"es.turn_on.imperative", IntentKind::TurnOn, {
            "(?:por favor )?(?:enciende|encende|prende|activa|inicia|arranca|conecta)(?:la|lo|las|los|le|me)?",
            "ilumina(?:me)?",
        }, 0.90f, "es"},
        {"es.turn_on.infinitive", IntentKind::TurnOn, {
            "(?:encender|prender|activar|iniciar|arrancar|conectar|iluminar)(?:la|lo|las|los)?",
        }, 0.85f, "es"},
        {"es.turn_on.subjunctive", IntentKind::TurnOn, {
            "enciendas?|prendas?|actives?|inicies?|arranques?|conectes?",
        }, 0.85f, "es"},
        {"es.turn_on.colloquial", IntentKind::TurnOn, {
            "pon(?:er|me|le)? (?:la )?(?:luz|lampara)",
            "pon(?:er|lo|la)? en marcha",
            "da(?:r|me|le)? (?:luz|energia|corriente)",
            "echa(?:r)? luz",
        }, 0.80f, "es"},
        {"en.turn_on", IntentKind::TurnOn, {
            "(?:turn|switch|power) on",
            "(?:turn|switch) (?:[^ ]{1,32} ){1,3}on",
            "light up|activate|enable|start",
        }, 0.90f, "en"},

        // ---- turn_off ----
        {"es.turn_off.imperative", IntentKind::TurnOff, {
            "(?:apaga|desactiva|deten|desconecta)(?:la|lo|las|los|le|me)?",
            "(?:corta|quita)(?:r)? (?:la )?(?:luz|energia|corriente)",
        }, 0.90f, "es"},
        {"es.turn_off.infinitive", IntentKind::TurnOff, {
            "(?:apagar|desactivar|detener|desconectar)(?:la|lo|las|los)?",
        }, 0.85f, "es"},
        {"es.turn_off.subjunctive", IntentKind::TurnOff, {
            "apagues?|desactives?|detengas?|desconectes?",
        }, 0.85f, "es"},
        {"es.turn_off.stop", IntentKind::TurnOff, {
            "(?:para|pare|parar) (?:el|la|los|las)",
        }, 0.80f, "es"},
        {"en.turn_off", IntentKind::TurnOff, {
            "(?:turn|switch|power|shut) off",
            "(?:turn|switch) (?:[^ ]{1,32} ){1,3}off",
            "shut down|deactivate|disable|stop",
        }, 0.90f, "en"},

        // ---- open ----
        {"es.open.imperative", IntentKind::Open, {
            "(?:abre|abri|despeja|descorre|levanta|destapa)(?:la|lo|las|los|le|me)?",
        }, 0.90f, "es"},
        {"es.open.raise", IntentKind::Open, {
            "sube(?:la|lo)? (?:(?:la|el|las|los) )?(?:persiana|cortina|toldo)s?",
        }, 0.85f, "es"},
        {"es.open.infinitive", IntentKind::Open, {
            "(?:abrir|despejar|descorrer|levantar|destapar)(?:la|lo|las|los)?",
        }, 0.85f, "es"},
        {"es.open.subjunctive", IntentKind::Open, {
            "abras?|despejes?|descorras?|levantes?|subas|destapes?",
        }, 0.85f, "es"},
        {"es.open.leave", IntentKind::Open, {
            "deja(?:r)? (?:abierto|abierta|abiertos|abiertas)",
        }, 0.80f, "es"},
        {"en.open", IntentKind::Open, {
            "open|unlock|raise",
            "roll up|lift up|pull up|slide open",
        }, 0.90f, "en"},

        // ---- close ----
        {"es.close.imperative", IntentKind::Close, {
            "(?:cierra|cerra|tapa|bloquea)(?:la|lo|las|los|le|me)?",
        }, 0.90f, "es"},
        {"es.close.lower", IntentKind::Close, {
            "(?:baja|corre)(?:la|lo)? (?:(?:la|el|las|los) )?(?:persiana|cortina|toldo)s?",
        }, 0.85f, "es"},
        {"es.close.infinitive", IntentKind::Close, {
            "(?:cerrar|tapar|bloquear)(?:la|lo|las|los)?",
        }, 0.85f, "es"},
        {"es.close.subjunctive", IntentKind::Close, {
            "cierres?|corras|bajes|tapes?|bloquees?",
        }, 0.85f, "es"},
        {"es.close.leave", IntentKind::Close, {
            "deja(?:r)? (?:cerrado|cerrada|cerrados|cerradas)",
        }, 0.80f, "es"},
        {"en.close", IntentKind::Close, {
            "close|shut|lock|lower",
            "roll down|pull down|slide (?:shut|closed)",
        }, 0.90f, "en"},

        // ---- status ----
        {"es.status.state", IntentKind::Status, {
            "(?:esta|estan) (?:encendid|apagad|abiert|cerrad|activad|prendid)(?:o|a|os|as)",
            "(?:esta|estan) funcionando",
        }, 0.85f, "es"},
        {"es.status.question", IntentKind::Status, {
            "como (?:esta|estan)",
            "que tal (?:esta|estan)",
            "cual es (?:el )?(?:estado|status)",
            "que pasa con",
        }, 0.85f, "es"},
        {"es.status.query", IntentKind::Status, {
            "(?:estado|status|situacion) (?:de|del)",
            "(?:dime|decime|muestrame|dame) (?:el )?(?:estado|status)",
            "consulta(?:r)?|verifica(?:r)?|revisa(?:r)?|chequea(?:r)?|checa(?:r)?",
            "(?:info|informacion) (?:de|del|sobre)",
        }, 0.85f, "es"},
        {"es.status.implicit", IntentKind::Status, {
            "funciona|funcionando|anda|andando",
            "hay luz (?:en|encendida)",
        }, 0.75f, "es"},
        {"en.status", IntentKind::Status, {
            "(?:is|are) (?:the )?[^ ]{1,32}(?: [^ ]{1,32})? (?:on|off|open|closed|locked|unlocked)",
            "(?:what is|what s|whats) (?:the )?(?:status|state)",
            "(?:check|verify|show) (?:the )?(?:status|state)",
            "(?:status|state) (?:of|for)",
        }, 0.85f, "en"},

        // ---- toggle ----
        {"es.toggle", IntentKind::Toggle, {
            "alterna(?:r)?|alterne",
            "(?:cambia|cambiar|cambie) (?:el )?(?:estado|modo)",
            "(?:invierte|invertir|invierta)(?: el estado)?",
        }, 0.90f, "es"},
        {"en.toggle", IntentKind::Toggle, {
            "toggle|flip",
            "change (?:the )?(?:state|mode)",
        }, 0.90f, "en"},
    };
    return rules;
}

} // namespace domo_nlu
