#pragma once

#include "common.h"
#include "config.h"
#include "errors.h"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace domo_nlu {

/// Shared cancellation flag; raising it aborts an in-flight fallback wait
using CancelToken = std::shared_ptr<std::atomic<bool>>;

inline CancelToken make_cancel_token() {
    return std::make_shared<std::atomic<bool>>(false);
}

inline bool is_cancelled(const CancelToken& token) {
    return token && token->load();
}

/**
 * @brief What the orchestrator hands to the fallback interpreter
 */
struct FallbackRequest {
    std::string text;                  ///< Original, un-normalized utterance
    bool hint_negated = false;
    std::vector<DeviceRecord> devices; ///< Current vocabulary, for prompting
};

/**
 * @brief A usable fallback answer; accepted verbatim by the orchestrator
 */
struct FallbackAnswer {
    IntentKind intent = IntentKind::Unknown;
    std::optional<std::string> device_key;
};

/**
 * @brief External, higher-latency interpreter consulted when rule confidence is too low
 *
 * Implementations must bound their own wait and honor the cancel token.
 * Timeouts, transport errors and unusable payloads are returned as errors, never thrown.
 */
class FallbackInterpreter {
public:
    virtual ~FallbackInterpreter() = default;

    virtual Result<FallbackAnswer> interpret(const FallbackRequest& request, const CancelToken& cancel) = 0;

    /// Short identifier used in logs
    virtual std::string name() const = 0;
};

/**
 * @brief Extract {"intent": ..., "device": ...} from model output
 *
 * Tries the whole text as JSON first, then the first balanced {...} block.
 * Anything without a recognized string intent and a string/null device is a ParseError.
 */
Result<FallbackAnswer> parse_fallback_answer(const std::string& model_text);

/**
 * @brief Fallback backed by an Ollama-compatible /api/generate endpoint (libcurl)
 */
class OllamaFallbackClient : public FallbackInterpreter {
public:
    explicit OllamaFallbackClient(const FallbackConfig& config);
    ~OllamaFallbackClient() override;

    OllamaFallbackClient(const OllamaFallbackClient&) = delete;
    OllamaFallbackClient& operator=(const OllamaFallbackClient&) = delete;

    Result<FallbackAnswer> interpret(const FallbackRequest& request, const CancelToken& cancel) override;
    std::string name() const override;

    /**
     * @brief GET /api/tags to verify the server is reachable
     */
    Result<void> check_connection();

    /**
     * @brief Prompt sent to the model (exposed for diagnostics and tests)
     */
    static std::string build_prompt(const FallbackRequest& request);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace domo_nlu
