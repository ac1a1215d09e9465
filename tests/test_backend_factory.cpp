#include <catch2/catch_test_macros.hpp>

#include "whisper/backend_factory.hpp"

#include <string>

namespace {

std::string config_reason(const Result<BackendKind>& r) {
    auto* cfg = std::get_if<ConfigurationError>(&r.error());
    return cfg ? cfg->reason : std::string{};
}

} // namespace

TEST_CASE("detect_backend", "[backend]") {

    SECTION("OpenAiCompatible") {
        REQUIRE(detect_backend("https://api.openai.com/v1/audio/transcriptions") ==
                BackendKind::OpenAi);
        REQUIRE(detect_backend("http://gpu-box:8000/v1/audio/transcriptions") ==
                BackendKind::OpenAi);
    }

    SECTION("WhisperCpp") {
        REQUIRE(detect_backend("http://127.0.0.1:8080/inference") == BackendKind::WhisperCpp);
    }

    SECTION("Ollama") {
        REQUIRE(detect_backend("http://localhost:11434") == BackendKind::Ollama);
        REQUIRE(detect_backend("https://ollama.lan") == BackendKind::Ollama);
        REQUIRE(detect_backend("HTTP://LOCALHOST:11434/") == BackendKind::Ollama);
    }

    SECTION("EmptyUrl") {
        auto r = detect_backend("");
        REQUIRE_FALSE(r);
        REQUIRE(config_reason(r) == "Endpoint URL cannot be empty");
        REQUIRE(config_reason(detect_backend("   ")) == "Endpoint URL cannot be empty");
    }

    SECTION("MissingScheme") {
        auto r = detect_backend("localhost:8000/v1/audio/transcriptions");
        REQUIRE_FALSE(r);
        REQUIRE(config_reason(r) == "Endpoint URL must start with http:// or https://");
        REQUIRE_FALSE(detect_backend("ftp://host/inference"));
    }

    SECTION("UnknownShape") {
        auto r = detect_backend("http://localhost:9000/transcribe");
        REQUIRE_FALSE(r);
        REQUIRE(config_reason(r) == "Unsupported STT provider URL");
    }
}

TEST_CASE("make_backend", "[backend]") {

    SECTION("BuildsMatchingBackend") {
        auto openai = make_backend({.url = "http://localhost:8000/v1/audio/transcriptions",
                                    .api_key = "sk-test", .timeout_ms = 1000});
        REQUIRE(openai);
        REQUIRE((*openai)->name() == "openai-whisper");

        auto cpp = make_backend({.url = "http://localhost:8080/inference"});
        REQUIRE(cpp);
        REQUIRE((*cpp)->name() == "whisper.cpp");

        auto ollama = make_backend({.url = "http://localhost:11434"});
        REQUIRE(ollama);
        REQUIRE((*ollama)->name() == "ollama");
    }

    SECTION("PropagatesConfigurationError") {
        auto r = make_backend({.url = "not a url"});
        REQUIRE_FALSE(r);
        REQUIRE(std::holds_alternative<ConfigurationError>(r.error()));
    }
}
