#pragma once

#include <expected>
#include <string>
#include <variant>

// Closed set of failure kinds. Classified once where the failure happens,
// then passed around by value.

enum class NetworkKind { Refused, Timeout, Auth, Generic };
enum class ServiceKind { NotFound, RateLimited, Generic };

struct NetworkError {
    NetworkKind kind = NetworkKind::Generic;
    std::string message;
};

struct ServiceError {
    ServiceKind kind = ServiceKind::Generic;
    std::string message;
};

struct AudioError {
    std::string reason;
};

struct ConfigurationError {
    std::string reason;
};

struct UnknownError {
    std::string message;
};

using Error = std::variant<NetworkError, ServiceError, AudioError,
                           ConfigurationError, UnknownError>;

template <typename T>
using Result = std::expected<T, Error>;

// User-facing title/body pair for a notification.
struct Notice {
    std::string title;
    std::string body;
};

Notice describe(const Error& err);

// Only transport-level failures are worth another attempt. Auth failures are
// deterministic and are not retried.
bool is_retryable(const Error& err);

// One-line description for logs and IPC replies.
std::string to_string(const Error& err);
