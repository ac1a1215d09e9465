#include "whisper_cpp_backend.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <print>

using json = nlohmann::json;

WhisperCppBackend::WhisperCppBackend(std::string url, long timeout_ms)
    : url_(std::move(url)), http_(HttpClient::Timeouts{.total_ms = timeout_ms}) {}

Result<TranscriptResult> WhisperCppBackend::transcribe(std::span<const uint8_t> encoded_audio,
                                                       const TranscriptionOptions& options) {
    std::vector<FormField> fields = {
        {.name = "file", .filename = "audio.wav", .content_type = "audio/wav"},
        {.name = "temperature",
         .value = options.temperature ? std::to_string(*options.temperature) : "0.0"},
        {.name = "response_format", .value = "json"},
    };
    if (!options.language.empty()) {
        fields.push_back({.name = "language", .value = options.language});
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
        if (j.contains("error")) {
            return std::unexpected(ServiceError{ServiceKind::Generic,
                                                "server error: " + error_detail(resp->body)});
        }
        if (!j.contains("text") || !j["text"].is_string()) {
            return std::unexpected(ServiceError{ServiceKind::Generic,
                                                "unexpected response: " + resp->body});
        }

        TranscriptResult result;
        result.text = trim_transcript(j["text"].get<std::string>());
        result.processing_s = std::chrono::duration<double>(end - start).count();
        return result;
    } catch (const json::exception& e) {
        return std::unexpected(ServiceError{ServiceKind::Generic,
                                            std::string("JSON parse error: ") + e.what()});
    }
}

bool WhisperCppBackend::test_connection() {
    auto base = url_.substr(0, url_.find("/inference"));
    auto resp = http_.get(base + "/", 5000);
    if (!resp) {
        std::println(stderr, "http: whisper.cpp connection test failed: {}",
                     to_string(resp.error()));
        return false;
    }
    return resp->status < 500;
}
