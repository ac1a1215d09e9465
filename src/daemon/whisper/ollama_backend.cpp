#include "ollama_backend.hpp"
#include "base64.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <print>

using json = nlohmann::json;

namespace {
constexpr const char* default_model = "qwen2-audio";
} // namespace

OllamaBackend::OllamaBackend(std::string url, long timeout_ms)
    : url_(std::move(url)), http_(HttpClient::Timeouts{.total_ms = timeout_ms}) {
    while (!url_.empty() && url_.back() == '/') url_.pop_back();
}

std::string OllamaBackend::build_request(std::span<const uint8_t> encoded_audio,
                                         const TranscriptionOptions& options) {
    std::string prompt = "Transcribe this audio.";
    if (!options.language.empty()) {
        prompt = "Transcribe this audio in " + options.language + ".";
    }

    json body = {
        {"model", options.model.empty() ? default_model : options.model},
        {"messages", json::array({
            {
                {"role", "user"},
                {"content", prompt},
                {"audio", json::array({base64::encode(encoded_audio)})},
            },
        })},
        {"stream", false},
    };
    if (options.temperature) {
        body["options"] = {{"temperature", *options.temperature}};
    }
    return body.dump();
}

Result<TranscriptResult> OllamaBackend::transcribe(std::span<const uint8_t> encoded_audio,
                                                   const TranscriptionOptions& options) {
    auto start = std::chrono::steady_clock::now();
    auto resp = http_.post_json(url_ + "/api/chat", build_request(encoded_audio, options));
    auto end = std::chrono::steady_clock::now();

    if (!resp) return std::unexpected(resp.error());
    if (!is_success(resp->status)) {
        return std::unexpected(classify_status(resp->status, error_detail(resp->body)));
    }

    try {
        auto j = json::parse(resp->body);
        if (!j.contains("message") || !j["message"].is_object() ||
            !j["message"].contains("content") || !j["message"]["content"].is_string()) {
            return std::unexpected(ServiceError{ServiceKind::Generic,
                                                "Invalid response format from Ollama server"});
        }

        TranscriptResult result;
        result.text = trim_transcript(j["message"]["content"].get<std::string>());
        result.processing_s = std::chrono::duration<double>(end - start).count();
        return result;
    } catch (const json::exception& e) {
        return std::unexpected(ServiceError{ServiceKind::Generic,
                                            std::string("JSON parse error: ") + e.what()});
    }
}

bool OllamaBackend::test_connection() {
    auto resp = http_.get(url_ + "/api/tags", 5000);
    if (!resp) {
        std::println(stderr, "http: Ollama connection test failed: {}", to_string(resp.error()));
        return false;
    }
    if (!is_success(resp->status)) {
        std::println(stderr, "http: Ollama connection test failed: HTTP {}", resp->status);
        return false;
    }
    return true;
}
