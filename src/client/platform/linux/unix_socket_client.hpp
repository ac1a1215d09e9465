#pragma once

#include "platform/ipc_client.hpp"

class UnixSocketClient : public IpcClient {
public:
    UnixSocketClient();
    ~UnixSocketClient() override;

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    bool connect(const std::string& endpoint) override;
    bool send(const nlohmann::json& cmd) override;
    std::expected<nlohmann::json, std::string> recv(int timeout_ms) override;
    void close() override;

private:
    int fd_ = -1;
    // Bytes past the last returned line.
    std::string buf_;
};
