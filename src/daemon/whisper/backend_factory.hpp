#pragma once

#include "backend.hpp"

#include <memory>
#include <string>

enum class BackendKind { OpenAi, WhisperCpp, Ollama };

struct BackendSettings {
    std::string url;
    std::string api_key;
    long timeout_ms = 30000;
};

// Picks the provider from the shape of the endpoint URL.
Result<BackendKind> detect_backend(const std::string& url);

Result<std::unique_ptr<WhisperBackend>> make_backend(const BackendSettings& settings);
