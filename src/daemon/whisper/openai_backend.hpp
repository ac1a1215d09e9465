#pragma once

#include "backend.hpp"
#include "http_client.hpp"

#include <string>

// OpenAI Whisper API and compatible servers (vLLM, faster-whisper-server):
// multipart upload to .../v1/audio/transcriptions.
class OpenAiBackend : public WhisperBackend {
public:
    OpenAiBackend(std::string url, std::string api_key, long timeout_ms);

    Result<TranscriptResult> transcribe(std::span<const uint8_t> encoded_audio,
                                        const TranscriptionOptions& options) override;
    bool test_connection() override;
    std::string name() const override { return "openai-whisper"; }

    // Server root with the transcription path removed.
    static std::string base_url(const std::string& url);

private:
    std::string url_;
    HttpClient http_;
};
