#pragma once

#include "platform/ipc_server.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>

// Newline-delimited JSON over a non-blocking AF_UNIX stream socket, readable
// and writable only by the owning user.
class UnixSocketServer : public IpcServer {
public:
    // A client that never sends a newline does not get to grow our memory.
    static constexpr size_t max_message_bytes = 64 * 1024;

    UnixSocketServer();
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    bool start(const std::string& endpoint) override;
    void stop() override;
    int server_fd() const override { return server_fd_; }
    int accept_client() override;
    ReadResult read_command(int client_fd, nlohmann::json& cmd) override;
    bool send_response(int client_fd, const nlohmann::json& response) override;
    void close_client(int client_fd) override;

    size_t client_count() const { return pending_.size(); }

private:
    int server_fd_ = -1;
    std::string socket_path_;
    // Bytes received per client that do not yet form a full line.
    std::unordered_map<int, std::string> pending_;
};
