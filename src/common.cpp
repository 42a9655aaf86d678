#include "common.h"
#include "errors.h"
#include "utils.h"
#include <unordered_map>

namespace domo_nlu {

const char* to_string(IntentKind intent) {
    switch (intent) {
        case IntentKind::TurnOn:  return "turn_on";
        case IntentKind::TurnOff: return "turn_off";
        case IntentKind::Open:    return "open";
        case IntentKind::Close:   return "close";
        case IntentKind::Status:  return "status";
        case IntentKind::Toggle:  return "toggle";
        case IntentKind::Unknown: return "unknown";
    }
    return "unknown";
}

const char* to_string(DeviceCategory category) {
    switch (category) {
        case DeviceCategory::Light:   return "light";
        case DeviceCategory::Fan:     return "fan";
        case DeviceCategory::Door:    return "door";
        case DeviceCategory::Window:  return "window";
        case DeviceCategory::Curtain: return "curtain";
        case DeviceCategory::Lock:    return "lock";
        case DeviceCategory::Alarm:   return "alarm";
        case DeviceCategory::Sensor:  return "sensor";
        case DeviceCategory::Climate: return "climate";
        case DeviceCategory::Other:   return "other";
    }
    return "other";
}

const char* to_string(NegationType type) {
    switch (type) {
        case NegationType::None:        return "none";
        case NegationType::Direct:      return "direct";
        case NegationType::Pronoun:     return "pronoun";
        case NegationType::Compound:    return "compound";
        case NegationType::Prohibitive: return "prohibitive";
        case NegationType::Implicit:    return "implicit";
    }
    return "none";
}

const char* to_string(MatchStrategy strategy) {
    switch (strategy) {
        case MatchStrategy::None:       return "none";
        case MatchStrategy::ExactAlias: return "exact";
        case MatchStrategy::NGram:      return "ngram";
        case MatchStrategy::Partial:    return "partial";
    }
    return "none";
}

const char* to_string(InterpretationSource source) {
    switch (source) {
        case InterpretationSource::Rules:    return "rules";
        case InterpretationSource::Fallback: return "fallback";
    }
    return "rules";
}

std::optional<IntentKind> parse_intent(const std::string& name) {
    static const std::unordered_map<std::string, IntentKind> names = {
        {"turn_on", IntentKind::TurnOn},
        {"turn_off", IntentKind::TurnOff},
        {"open", IntentKind::Open},
        {"close", IntentKind::Close},
        {"status", IntentKind::Status},
        {"toggle", IntentKind::Toggle},
        {"unknown", IntentKind::Unknown},
    };
    auto it = names.find(utils::lower_copy(utils::trim_copy(name)));
    if (it == names.end()) {
        return std::nullopt;
    }
    return it->second;
}

DeviceCategory parse_category(const std::string& name) {
    static const std::unordered_map<std::string, DeviceCategory> names = {
        {"light", DeviceCategory::Light},
        {"fan", DeviceCategory::Fan},
        {"door", DeviceCategory::Door},
        {"window", DeviceCategory::Window},
        {"curtain", DeviceCategory::Curtain},
        {"lock", DeviceCategory::Lock},
        {"alarm", DeviceCategory::Alarm},
        {"sensor", DeviceCategory::Sensor},
        {"camera", DeviceCategory::Sensor},
        {"climate", DeviceCategory::Climate},
        {"thermostat", DeviceCategory::Climate},
        {"switch", DeviceCategory::Other},
        {"other", DeviceCategory::Other},
    };
    auto it = names.find(utils::lower_copy(utils::trim_copy(name)));
    return it == names.end() ? DeviceCategory::Other : it->second;
}

bool intent_requires_device(IntentKind intent) {
    switch (intent) {
        case IntentKind::TurnOn:
        case IntentKind::TurnOff:
        case IntentKind::Open:
        case IntentKind::Close:
        case IntentKind::Toggle:
            return true;
        case IntentKind::Status:
        case IntentKind::Unknown:
            return false;
    }
    return false;
}

const char* to_string(ErrorType type) {
    switch (type) {
        case ErrorType::None:            return "none";
        case ErrorType::IOError:         return "io_error";
        case ErrorType::NetworkError:    return "network_error";
        case ErrorType::ParseError:      return "parse_error";
        case ErrorType::VocabularyError: return "vocabulary_error";
        case ErrorType::Timeout:         return "timeout";
        case ErrorType::Cancelled:       return "cancelled";
        case ErrorType::Internal:        return "internal";
    }
    return "internal";
}

float clamp_confidence(float value) {
    if (value < 0.0f) return 0.0f;
    if (value > 1.0f) return 1.0f;
    return value;
}

} // namespace domo_nlu
