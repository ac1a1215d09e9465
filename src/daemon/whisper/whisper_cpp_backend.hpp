#pragma once

#include "backend.hpp"
#include "http_client.hpp"

#include <string>

// whisper.cpp's bundled HTTP server (POST .../inference).
class WhisperCppBackend : public WhisperBackend {
public:
    WhisperCppBackend(std::string url, long timeout_ms);

    Result<TranscriptResult> transcribe(std::span<const uint8_t> encoded_audio,
                                        const TranscriptionOptions& options) override;
    bool test_connection() override;
    std::string name() const override { return "whisper.cpp"; }

private:
    std::string url_;
    HttpClient http_;
};
