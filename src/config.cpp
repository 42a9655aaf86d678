#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

/// Apply all known sections of j onto cfg; unknown keys are ignored, missing keys keep defaults.
void apply_json_to_config(domo_nlu::Config& cfg, const json& j) {
    if (j.contains("logging") && j["logging"].is_object()) {
        auto& l = j["logging"];
        if (l.contains("level") && l["level"].is_string()) cfg.logging.level = l["level"];
        if (l.contains("file") && l["file"].is_string()) cfg.logging.file = l["file"];
    }

    if (j.contains("normalizer") && j["normalizer"].is_object()) {
        auto& n = j["normalizer"];
        if (n.contains("expand_colloquialisms")) cfg.normalizer.expand_colloquialisms = n["expand_colloquialisms"];
        if (n.contains("fix_typos")) cfg.normalizer.fix_typos = n["fix_typos"];
    }

    if (j.contains("classifier") && j["classifier"].is_object()) {
        auto& c = j["classifier"];
        if (c.contains("locales") && c["locales"].is_array()) {
            cfg.classifier.locales.clear();
            for (const auto& loc : c["locales"]) {
                if (loc.is_string()) cfg.classifier.locales.push_back(loc.get<std::string>());
            }
        }
        if (c.contains("leading_bonus") && c["leading_bonus"].is_number()) cfg.classifier.leading_bonus = c["leading_bonus"];
    }

    if (j.contains("resolver") && j["resolver"].is_object()) {
        auto& r = j["resolver"];
        if (r.contains("exact_confidence")) cfg.resolver.exact_confidence = r["exact_confidence"];
        if (r.contains("ngram_confidence")) cfg.resolver.ngram_confidence = r["ngram_confidence"];
        if (r.contains("partial_confidence")) cfg.resolver.partial_confidence = r["partial_confidence"];
        if (r.contains("min_partial_token_length") && r["min_partial_token_length"].is_number_integer())
            cfg.resolver.min_partial_token_length = r["min_partial_token_length"];
    }

    if (j.contains("gate") && j["gate"].is_object()) {
        auto& g = j["gate"];
        if (g.contains("intent_threshold")) cfg.gate.intent_threshold = g["intent_threshold"];
        if (g.contains("device_threshold")) cfg.gate.device_threshold = g["device_threshold"];
    }

    if (j.contains("fallback") && j["fallback"].is_object()) {
        auto& f = j["fallback"];
        if (f.contains("enabled")) cfg.fallback.enabled = f["enabled"];
        if (f.contains("endpoint") && f["endpoint"].is_string()) cfg.fallback.endpoint = f["endpoint"];
        if (f.contains("model") && f["model"].is_string()) cfg.fallback.model = f["model"];
        if (f.contains("timeout_ms") && f["timeout_ms"].is_number_integer()) cfg.fallback.timeout_ms = f["timeout_ms"];
        if (f.contains("connect_timeout_ms") && f["connect_timeout_ms"].is_number_integer())
            cfg.fallback.connect_timeout_ms = f["connect_timeout_ms"];
        if (f.contains("temperature") && f["temperature"].is_number()) cfg.fallback.temperature = f["temperature"];
        if (f.contains("max_tokens") && f["max_tokens"].is_number_integer()) cfg.fallback.max_tokens = f["max_tokens"];
    }

    if (j.contains("vocabulary") && j["vocabulary"].is_object()) {
        auto& v = j["vocabulary"];
        if (v.contains("devices_file") && v["devices_file"].is_string()) cfg.vocabulary.devices_file = v["devices_file"];
    }

    if (j.contains("workers") && j["workers"].is_object()) {
        auto& w = j["workers"];
        if (w.contains("count") && w["count"].is_number_integer()) cfg.workers.count = w["count"];
    }
}

} // namespace

namespace domo_nlu {

Config Config::load_from_file(const std::string& path) {
    Config cfg;

    std::ifstream file(expand_path(path));
    if (!file.is_open()) {
        Logger::warn("Could not open config file: " + path + ". Using defaults.");
        return cfg;
    }

    try {
        json j;
        file >> j;
        apply_json_to_config(cfg, j);
    } catch (const json::exception& e) {
        Logger::error("Error parsing config: " + std::string(e.what()));
        return Config();
    }

    cfg.logging.file = expand_path(cfg.logging.file);
    cfg.vocabulary.devices_file = expand_path(cfg.vocabulary.devices_file);

    if (cfg.workers.count < 1) {
        Logger::warn("workers.count must be at least 1; using 1");
        cfg.workers.count = 1;
    }
    if (cfg.resolver.min_partial_token_length < 1) {
        cfg.resolver.min_partial_token_length = 1;
    }

    return cfg;
}

void Config::save_to_file(const std::string& path) const {
    json j;

    j["logging"]["level"] = logging.level;
    j["logging"]["file"] = logging.file;

    j["normalizer"]["expand_colloquialisms"] = normalizer.expand_colloquialisms;
    j["normalizer"]["fix_typos"] = normalizer.fix_typos;

    j["classifier"]["locales"] = classifier.locales;
    j["classifier"]["leading_bonus"] = classifier.leading_bonus;

    j["resolver"]["exact_confidence"] = resolver.exact_confidence;
    j["resolver"]["ngram_confidence"] = resolver.ngram_confidence;
    j["resolver"]["partial_confidence"] = resolver.partial_confidence;
    j["resolver"]["min_partial_token_length"] = resolver.min_partial_token_length;

    j["gate"]["intent_threshold"] = gate.intent_threshold;
    j["gate"]["device_threshold"] = gate.device_threshold;

    j["fallback"]["enabled"] = fallback.enabled;
    j["fallback"]["endpoint"] = fallback.endpoint;
    j["fallback"]["model"] = fallback.model;
    j["fallback"]["timeout_ms"] = fallback.timeout_ms;
    j["fallback"]["connect_timeout_ms"] = fallback.connect_timeout_ms;
    j["fallback"]["temperature"] = fallback.temperature;
    j["fallback"]["max_tokens"] = fallback.max_tokens;

    j["vocabulary"]["devices_file"] = vocabulary.devices_file;

    j["workers"]["count"] = workers.count;

    std::ofstream file(path);
    if (!file.is_open()) {
        Logger::error("Could not write config file: " + path);
        return;
    }
    file << j.dump(2, ' ', false, json::error_handler_t::replace);
}

} // namespace domo_nlu
