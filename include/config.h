#pragma once

#include <string>
#include <vector>

namespace domo_nlu {

struct LoggingConfig {
    std::string level = "info";   ///< debug | info | warn | error
    std::string file;             ///< Empty = console only
};

struct NormalizerConfig {
    bool expand_colloquialisms = true;  ///< "xfa" -> "por favor", "pls" -> "please"
    bool fix_typos = true;              ///< "lus" -> "luz", "bano" -> "baño"
};

struct ClassifierConfig {
    /// Rules whose locale is not listed here are skipped
    std::vector<std::string> locales = {"es", "en"};
    /// Added to a rule's base confidence when its span starts the utterance
    float leading_bonus = 0.05f;
};

struct ResolverConfig {
    float exact_confidence = 0.95f;
    float ngram_confidence = 0.85f;
    float partial_confidence = 0.70f;
    int min_partial_token_length = 4;  ///< Shorter tokens never produce a partial hit
};

/// Confidence gate between rule-based result and fallback
struct GateConfig {
    float intent_threshold = 0.8f;
    float device_threshold = 0.7f;
};

struct FallbackConfig {
    bool enabled = true;
    std::string endpoint = "http://localhost:11434";  ///< Ollama base URL; /api/generate is appended
    std::string model = "phi3";
    int timeout_ms = 10000;
    int connect_timeout_ms = 1000;
    float temperature = 0.1f;
    int max_tokens = 100;
};

struct VocabularyConfig {
    std::string devices_file = "config/devices.json";
};

struct WorkerConfig {
    int count = 4;
};

struct Config {
    LoggingConfig logging;
    NormalizerConfig normalizer;
    ClassifierConfig classifier;
    ResolverConfig resolver;
    GateConfig gate;
    FallbackConfig fallback;
    VocabularyConfig vocabulary;
    WorkerConfig workers;

    static Config load_from_file(const std::string& path);
    void save_to_file(const std::string& path) const;
};

} // namespace domo_nlu
