#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace domo_nlu {

/**
 * @brief Action category requested by a command
 */
enum class IntentKind {
    TurnOn,
    TurnOff,
    Open,
    Close,
    Status,
    Toggle,
    Unknown
};

/**
 * @brief Informational device category (never matched directly)
 */
enum class DeviceCategory {
    Light,
    Fan,
    Door,
    Window,
    Curtain,
    Lock,
    Alarm,
    Sensor,
    Climate,
    Other
};

/**
 * @brief Negation family that produced a NegationResult
 */
enum class NegationType {
    None,
    Direct,       ///< "no enciendas"
    Pronoun,      ///< "no la enciendas"
    Compound,     ///< "no quiero que se encienda"
    Prohibitive,  ///< "deja de encender"
    Implicit      ///< "mejor no", "nunca apagues"
};

/**
 * @brief Entity resolution strategy that produced a hit
 */
enum class MatchStrategy {
    None,
    ExactAlias,
    NGram,
    Partial
};

/**
 * @brief Which stage produced the final intent/device pair
 */
enum class InterpretationSource {
    Rules,
    Fallback
};

/// Byte range [start, start + length) inside a normalized string
struct TextSpan {
    size_t start = 0;
    size_t length = 0;

    size_t end() const { return start + length; }
    bool empty() const { return length == 0; }
};

/**
 * @brief One entry of an externally supplied device vocabulary snapshot
 */
struct DeviceRecord {
    std::string device_key;
    std::string name;
    DeviceCategory category = DeviceCategory::Other;
    std::string room;
    std::vector<std::string> aliases;
};

/**
 * @brief Final output of one interpretation request
 */
struct Interpretation {
    IntentKind intent = IntentKind::Unknown;
    std::optional<std::string> device_key;
    bool negated = false;
    InterpretationSource source = InterpretationSource::Rules;
    bool degraded = false;  ///< Rule-based guess returned because the fallback could not answer
    std::string note;       ///< Caveat attached to degraded results
};

const char* to_string(IntentKind intent);
const char* to_string(DeviceCategory category);
const char* to_string(NegationType type);
const char* to_string(MatchStrategy strategy);
const char* to_string(InterpretationSource source);

/// Parse a wire intent name ("turn_on", ...); nullopt if unrecognized
std::optional<IntentKind> parse_intent(const std::string& name);

/// Parse a category name; unrecognized names map to Other
DeviceCategory parse_category(const std::string& name);

/// True for intents that act on a device (everything except Status and Unknown)
bool intent_requires_device(IntentKind intent);

/// Clamp a confidence into [0, 1]
float clamp_confidence(float value);

} // namespace domo_nlu
