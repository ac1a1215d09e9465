#include <catch2/catch_test_macros.hpp>

#include "errors.hpp"

TEST_CASE("describe", "[errors]") {

    SECTION("NetworkKinds") {
        auto refused = describe(NetworkError{NetworkKind::Refused, "connect failed"});
        REQUIRE(refused.title == "Connection Failed");
        REQUIRE(refused.body == "Cannot connect to STT endpoint. Is your service running?");

        auto timeout = describe(NetworkError{NetworkKind::Timeout, ""});
        REQUIRE(timeout.title == "Connection Timed Out");
        REQUIRE(timeout.body == "STT endpoint took too long. Try increasing the timeout.");

        auto auth = describe(NetworkError{NetworkKind::Auth, ""});
        REQUIRE(auth.title == "Authentication Failed");
        REQUIRE(auth.body == "Check your API key in Settings.");
    }

    SECTION("GenericNetworkCarriesMessage") {
        auto n = describe(NetworkError{NetworkKind::Generic, "SSL handshake failed"});
        REQUIRE(n.title == "Network Error");
        REQUIRE(n.body == "SSL handshake failed");
    }

    SECTION("ServiceKinds") {
        auto nf = describe(ServiceError{ServiceKind::NotFound, "model x"});
        REQUIRE(nf.title == "Model Not Found");
        REQUIRE(nf.body == "Check the model name in Settings.");

        auto rl = describe(ServiceError{ServiceKind::RateLimited, ""});
        REQUIRE(rl.title == "Rate Limited");
        REQUIRE(rl.body == "Too many requests. Wait a moment and try again.");

        auto gen = describe(ServiceError{ServiceKind::Generic, "HTTP 500: boom"});
        REQUIRE(gen.title == "Transcription Error");
        REQUIRE(gen.body == "HTTP 500: boom");
    }

    SECTION("AudioAndConfiguration") {
        auto a = describe(AudioError{"No audio captured"});
        REQUIRE(a.title == "Recording Failed");
        REQUIRE(a.body == "No audio captured");

        auto c = describe(ConfigurationError{"Unsupported STT provider URL"});
        REQUIRE(c.title == "Error");
        REQUIRE(c.body == "Unsupported STT provider URL");
    }

    SECTION("UnknownHidesDetails") {
        auto u = describe(UnknownError{"std::bad_alloc"});
        REQUIRE(u.title == "Error");
        REQUIRE(u.body == "An unexpected error occurred. Check the log for details.");
    }
}

TEST_CASE("is_retryable", "[errors]") {
    REQUIRE(is_retryable(NetworkError{NetworkKind::Refused, ""}));
    REQUIRE(is_retryable(NetworkError{NetworkKind::Timeout, ""}));
    REQUIRE(is_retryable(NetworkError{NetworkKind::Generic, ""}));
    REQUIRE_FALSE(is_retryable(NetworkError{NetworkKind::Auth, ""}));

    REQUIRE_FALSE(is_retryable(ServiceError{ServiceKind::RateLimited, ""}));
    REQUIRE_FALSE(is_retryable(ServiceError{ServiceKind::Generic, ""}));
    REQUIRE_FALSE(is_retryable(AudioError{"x"}));
    REQUIRE_FALSE(is_retryable(ConfigurationError{"x"}));
    REQUIRE_FALSE(is_retryable(UnknownError{"x"}));
}

TEST_CASE("to_string keeps the underlying message", "[errors]") {
    auto s = to_string(ServiceError{ServiceKind::Generic, "HTTP 502"});
    REQUIRE(s.find("HTTP 502") != std::string::npos);

    auto a = to_string(AudioError{"device busy"});
    REQUIRE(a.find("device busy") != std::string::npos);
}
