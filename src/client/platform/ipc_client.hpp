#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// Client side of the daemon's line-oriented JSON channel.
class IpcClient {
public:
    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool send(const nlohmann::json& cmd) = 0;
    // Waits for one response line; the error string says why none arrived.
    virtual std::expected<nlohmann::json, std::string> recv(int timeout_ms) = 0;
    virtual void close() = 0;
};
