#pragma once

#include "../errors.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

struct TranscriptionOptions {
    std::string model;
    std::string language;
    std::optional<double> temperature;
};

struct TranscriptResult {
    std::string text;
    std::optional<std::string> language;
    double duration_s = 0.0;
    double processing_s = 0.0;
};

// One speech-to-text provider. Implementations classify their own transport
// failures; callers only ever see an Error.
class WhisperBackend {
public:
    virtual ~WhisperBackend() = default;
    virtual Result<TranscriptResult> transcribe(std::span<const uint8_t> encoded_audio,
                                                const TranscriptionOptions& options) = 0;
    virtual bool test_connection() = 0;
    virtual std::string name() const = 0;
};
