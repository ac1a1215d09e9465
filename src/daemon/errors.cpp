#include "errors.hpp"

#include <format>

namespace {

template <typename... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

const char* network_kind_name(NetworkKind kind) {
    switch (kind) {
        case NetworkKind::Refused: return "refused";
        case NetworkKind::Timeout: return "timeout";
        case NetworkKind::Auth: return "auth";
        case NetworkKind::Generic: return "generic";
    }
    return "generic";
}

const char* service_kind_name(ServiceKind kind) {
    switch (kind) {
        case ServiceKind::NotFound: return "not found";
        case ServiceKind::RateLimited: return "rate limited";
        case ServiceKind::Generic: return "generic";
    }
    return "generic";
}

} // namespace

Notice describe(const Error& err) {
    return std::visit(overloaded{
        [](const NetworkError& e) -> Notice {
            switch (e.kind) {
                case NetworkKind::Refused:
                    return {"Connection Failed",
                            "Cannot connect to STT endpoint. Is your service running?"};
                case NetworkKind::Timeout:
                    return {"Connection Timed Out",
                            "STT endpoint took too long. Try increasing the timeout."};
                case NetworkKind::Auth:
                    return {"Authentication Failed", "Check your API key in Settings."};
                case NetworkKind::Generic:
                    break;
            }
            return {"Network Error", e.message};
        },
        [](const ServiceError& e) -> Notice {
            switch (e.kind) {
                case ServiceKind::NotFound:
                    return {"Model Not Found", "Check the model name in Settings."};
                case ServiceKind::RateLimited:
                    return {"Rate Limited", "Too many requests. Wait a moment and try again."};
                case ServiceKind::Generic:
                    break;
            }
            return {"Transcription Error", e.message};
        },
        [](const AudioError& e) -> Notice {
            return {"Recording Failed", e.reason};
        },
        [](const ConfigurationError& e) -> Notice {
            return {"Error", e.reason};
        },
        [](const UnknownError&) -> Notice {
            return {"Error", "An unexpected error occurred. Check the log for details."};
        },
    }, err);
}

bool is_retryable(const Error& err) {
    auto* net = std::get_if<NetworkError>(&err);
    return net && net->kind != NetworkKind::Auth;
}

std::string to_string(const Error& err) {
    return std::visit(overloaded{
        [](const NetworkError& e) {
            return std::format("network error ({}): {}", network_kind_name(e.kind), e.message);
        },
        [](const ServiceError& e) {
            return std::format("service error ({}): {}", service_kind_name(e.kind), e.message);
        },
        [](const AudioError& e) { return "audio error: " + e.reason; },
        [](const ConfigurationError& e) { return "configuration error: " + e.reason; },
        [](const UnknownError& e) { return "unexpected error: " + e.message; },
    }, err);
}
