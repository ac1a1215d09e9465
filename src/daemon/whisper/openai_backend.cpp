#include "openai_backend.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <print>

using json = nlohmann::json;

namespace {
constexpr const char* default_model = "whisper-1";
constexpr long probe_timeout_ms = 5000;
} // namespace

OpenAiBackend::OpenAiBackend(std::string url, std::string api_key, long timeout_ms)
    : url_(std::move(url)), http_(HttpClient::Timeouts{.total_ms = timeout_ms}) {
    if (!api_key.empty()) http_.set_bearer_token(std::move(api_key));
}

Result<TranscriptResult> OpenAiBackend::transcribe(std::span<const uint8_t> encoded_audio,
                                                   const TranscriptionOptions& options) {
    std::vector<FormField> fields = {
        {.name = "file", .filename = "audio.wav", .content_type = "audio/wav"},
        {.name = "model", .value = options.model.empty() ? default_model : options.model},
        {.name = "response_format", .value = "json"},
    };
    if (!options.language.empty()) {
        fields.push_back({.name = "language", .value = options.language});
    }
    if (options.temperature) {
        fields.push_back({.name = "temperature", .value = std::to_string(*options.temperature)});
    }

    auto start = std::chrono::steady_clock::now();
    auto resp = http_.post_form(url_, fields, encoded_audio);
    auto end = std::chrono::steady_clock::now();

    if (!resp) return std::unexpected(resp.error());
    if (!is_success(resp->status)) {
        return std::unexpected(classify_status(resp->status, error_detail(resp->body)));
    }

    try {
        auto j = json::parse(resp->body);
        if (!j.contains("text") || !j["text"].is_string()) {
            return std::unexpected(ServiceError{
                ServiceKind::Generic, "Invalid response format from OpenAI Whisper server"});
        }

        TranscriptResult result;
        result.text = trim_transcript(j["text"].get<std::string>());
        if (j.contains("language") && j["language"].is_string()) {
            result.language = j["language"].get<std::string>();
        }
        result.processing_s = std::chrono::duration<double>(end - start).count();
        return result;
    } catch (const json::exception& e) {
        return std::unexpected(ServiceError{ServiceKind::Generic,
                                            std::string("JSON parse error: ") + e.what()});
    }
}

bool OpenAiBackend::test_connection() {
    auto resp = http_.get(base_url(url_) + "/v1/models", probe_timeout_ms);
    if (!resp) {
        std::println(stderr, "http: OpenAI Whisper connection test failed: {}",
                     to_string(resp.error()));
        return false;
    }
    if (!is_success(resp->status)) {
        std::println(stderr, "http: OpenAI Whisper connection test failed: HTTP {}",
                     resp->status);
        return false;
    }
    return true;
}

std::string OpenAiBackend::base_url(const std::string& url) {
    auto pos = url.find("/v1/audio/transcriptions");
    if (pos == std::string::npos) return url;
    return url.substr(0, pos);
}
