#pragma once

#include "backend.hpp"
#include "http_client.hpp"

#include <string>

// Ollama builds with audio input: the WAV goes base64-encoded into a chat
// message and the reply content is the transcript.
class OllamaBackend : public WhisperBackend {
public:
    OllamaBackend(std::string url, long timeout_ms);

    Result<TranscriptResult> transcribe(std::span<const uint8_t> encoded_audio,
                                        const TranscriptionOptions& options) override;
    bool test_connection() override;
    std::string name() const override { return "ollama"; }

    static std::string build_request(std::span<const uint8_t> encoded_audio,
                                     const TranscriptionOptions& options);

private:
    std::string url_;
    HttpClient http_;
};
