#include "fallback_client.h"
#include "logger.h"
#include <curl/curl.h>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace domo_nlu {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* buffer = static_cast<std::string*>(userp);
    buffer->append(static_cast<char*>(contents), total_size);
    return total_size;
}

/// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK
int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* cancel = static_cast<std::atomic<bool>*>(clientp);
    return (cancel && cancel->load()) ? 1 : 0;
}

Result<FallbackAnswer> answer_from_json(const json& j) {
    if (!j.is_object() || !j.contains("intent") || !j["intent"].is_string()) {
        return make_parse_error("fallback answer has no string \"intent\"");
    }
    auto intent = parse_intent(j["intent"].get<std::string>());
    if (!intent) {
        return make_parse_error("fallback answer has unrecognized intent \"" + j["intent"].get<std::string>() + "\"");
    }

    FallbackAnswer answer;
    answer.intent = *intent;
    if (j.contains("device")) {
        const auto& device = j["device"];
        if (device.is_string()) {
            std::string key = device.get<std::string>();
            if (!key.empty() && key != "null" && key != "none") {
                answer.device_key = key;
            }
        } else if (!device.is_null()) {
            return make_parse_error("fallback answer \"device\" must be a string or null");
        }
    }
    return answer;
}

} // namespace

Result<FallbackAnswer> parse_fallback_answer(const std::string& model_text) {
    json direct = json::parse(model_text, nullptr, false);
    if (!direct.is_discarded() && direct.is_object()) {
        return answer_from_json(direct);
    }

    // Models often wrap the object in prose or code fences
    size_t open = model_text.find('{');
    while (open != std::string::npos) {
        int depth = 0;
        bool in_string = false;
        for (size_t i = open; i < model_text.size(); ++i) {
            char c = model_text[i];
            if (in_string) {
                if (c == '\\') { ++i; continue; }
                if (c == '"') in_string = false;
                continue;
            }
            if (c == '"') in_string = true;
            else if (c == '{') ++depth;
            else if (c == '}' && --depth == 0) {
                json embedded = json::parse(model_text.substr(open, i - open + 1), nullptr, false);
                if (!embedded.is_discarded() && embedded.is_object() && embedded.contains("intent")) {
                    return answer_from_json(embedded);
                }
                break;
            }
        }
        open = model_text.find('{', open + 1);
    }

    return make_parse_error("no JSON object in fallback output");
}

class OllamaFallbackClient::Impl {
public:
    explicit Impl(const FallbackConfig& config) : config_(config) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        base_url_ = config.endpoint;
        while (!base_url_.empty() && base_url_.back() == '/') {
            base_url_.pop_back();
        }
        const std::string generate_suffix = "/api/generate";
        if (base_url_.size() >= generate_suffix.size() &&
            base_url_.compare(base_url_.size() - generate_suffix.size(), generate_suffix.size(), generate_suffix) == 0) {
            base_url_.erase(base_url_.size() - generate_suffix.size());
        }
    }

    ~Impl() {
        curl_global_cleanup();
    }

    Result<FallbackAnswer> interpret(const FallbackRequest& request, const CancelToken& cancel) {
        if (is_cancelled(cancel)) {
            return make_cancelled_error("cancelled before fallback request");
        }

        json body;
        body["model"] = config_.model;
        body["prompt"] = build_prompt(request);
        body["stream"] = false;
        body["options"]["temperature"] = config_.temperature;
        body["options"]["top_p"] = 0.9;
        body["options"]["num_predict"] = config_.max_tokens;
        body["options"]["stop"] = json::array({"\n", "```"});

        LOG_FALLBACK("POST " + base_url_ + "/api/generate model=" + config_.model);
        // Utterances are not guaranteed to be valid UTF-8
        std::string payload = body.dump(-1, ' ', false, json::error_handler_t::replace);
        auto response = perform(base_url_ + "/api/generate", payload, config_.timeout_ms, cancel.get());
        if (response.is_error()) {
            return response.error();
        }

        json reply = json::parse(response.value(), nullptr, false);
        if (reply.is_discarded() || !reply.is_object()) {
            return make_parse_error("fallback server returned non-JSON body");
        }
        if (!reply.contains("response") || !reply["response"].is_string()) {
            return make_parse_error("fallback server reply has no \"response\" field");
        }

        std::string generated = reply["response"].get<std::string>();
        LOG_FALLBACK("raw answer: " + generated);
        return parse_fallback_answer(generated);
    }

    Result<void> check_connection() {
        auto response = perform(base_url_ + "/api/tags", "", config_.connect_timeout_ms + 4000, nullptr);
        if (response.is_error()) {
            return response.error();
        }
        return Result<void>();
    }

private:
    FallbackConfig config_;
    std::string base_url_;

    /// POST when body is non-empty, GET otherwise. Maps curl failures onto ErrorType.
    Result<std::string> perform(const std::string& url, const std::string& body, int timeout_ms,
                                std::atomic<bool>* cancel) {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return make_network_error("Failed to initialize CURL");
        }

        struct curl_slist* headers = nullptr;
        std::string response_buffer;

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        if (!body.empty()) {
            headers = curl_slist_append(headers, "Content-Type: application/json");
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        }
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.connect_timeout_ms));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, cancel);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

        CURLcode res = curl_easy_perform(curl);
        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        switch (res) {
            case CURLE_OK:
                break;
            case CURLE_OPERATION_TIMEDOUT:
                return make_timeout_error("fallback request timed out after " + std::to_string(timeout_ms) + "ms");
            case CURLE_ABORTED_BY_CALLBACK:
                return make_cancelled_error("fallback request cancelled");
            default:
                return make_network_error(std::string("fallback request failed: ") + curl_easy_strerror(res));
        }

        if (http_code != 200) {
            std::ostringstream oss;
            oss << "fallback server returned HTTP " << http_code;
            return make_network_error(oss.str());
        }
        return response_buffer;
    }
};

OllamaFallbackClient::OllamaFallbackClient(const FallbackConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

OllamaFallbackClient::~OllamaFallbackClient() = default;

Result<FallbackAnswer> OllamaFallbackClient::interpret(const FallbackRequest& request, const CancelToken& cancel) {
    return pimpl_->interpret(request, cancel);
}

std::string OllamaFallbackClient::name() const {
    return "ollama";
}

Result<void> OllamaFallbackClient::check_connection() {
    return pimpl_->check_connection();
}

std::string OllamaFallbackClient::build_prompt(const FallbackRequest& request) {
    std::ostringstream prompt;
    prompt << "Eres un parser de comandos domoticos. Extrae intent y device del comando (espanol o ingles).\n\n"
           << "INTENTS: turn_on, turn_off, open, close, status, toggle, unknown\n\n"
           << "DEVICES (key|type|room):\n";
    for (const auto& device : request.devices) {
        prompt << device.device_key << "|" << to_string(device.category) << "|" << device.room << "\n";
    }
    prompt << "\nREGLAS:\n"
           << "- Responde SOLO JSON: {\"intent\":\"X\",\"device\":\"Y\"}\n"
           << "- device=null si no se identifica\n"
           << "- intent=unknown si no es comando domotico\n"
           << "- Si el comando es negativo, devuelve la accion negada (\"no enciendas\" -> turn_on)\n"
           << "- turn_on/turn_off: luces, ventiladores, alarmas\n"
           << "- open/close: puertas, ventanas, cortinas\n\n"
           << "EJEMPLOS:\n"
           << "\"enciende luz comedor\" -> {\"intent\":\"turn_on\",\"device\":\"luz_comedor\"}\n"
           << "\"apaga ventilador sala\" -> {\"intent\":\"turn_off\",\"device\":\"ventilador_sala\"}\n"
           << "\"estado luz cocina\" -> {\"intent\":\"status\",\"device\":\"luz_cocina\"}\n\n";
    if (request.hint_negated) {
        prompt << "Nota: el comando esta negado.\n";
    }
    prompt << "Comando: \"" << request.text << "\"\nJSON:";
    return prompt.str();
}

} // namespace domo_nlu
