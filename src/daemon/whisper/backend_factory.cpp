#include "backend_factory.hpp"

#include "ollama_backend.hpp"
#include "openai_backend.hpp"
#include "whisper_cpp_backend.hpp"

#include <algorithm>
#include <cctype>

Result<BackendKind> detect_backend(const std::string& url) {
    auto first = url.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return std::unexpected(ConfigurationError{"Endpoint URL cannot be empty"});
    }

    std::string lower = url;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (!lower.starts_with("http://") && !lower.starts_with("https://")) {
        return std::unexpected(
            ConfigurationError{"Endpoint URL must start with http:// or https://"});
    }

    if (lower.find("localhost:11434") != std::string::npos ||
        lower.find("ollama") != std::string::npos) {
        return BackendKind::Ollama;
    }
    if (lower.find("/v1/audio/transcriptions") != std::string::npos) {
        return BackendKind::OpenAi;
    }
    if (lower.find("/inference") != std::string::npos) {
        return BackendKind::WhisperCpp;
    }

    return std::unexpected(ConfigurationError{"Unsupported STT provider URL"});
}

Result<std::unique_ptr<WhisperBackend>> make_backend(const BackendSettings& settings) {
    auto kind = detect_backend(settings.url);
    if (!kind) return std::unexpected(kind.error());

    std::unique_ptr<WhisperBackend> backend;
    switch (*kind) {
        case BackendKind::Ollama:
            backend = std::make_unique<OllamaBackend>(settings.url, settings.timeout_ms);
            break;
        case BackendKind::OpenAi:
            backend = std::make_unique<OpenAiBackend>(settings.url, settings.api_key,
                                                      settings.timeout_ms);
            break;
        case BackendKind::WhisperCpp:
            backend = std::make_unique<WhisperCppBackend>(settings.url, settings.timeout_ms);
            break;
    }
    return backend;
}
