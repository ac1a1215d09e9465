#include "platform/linux/unix_socket_server.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketServer::UnixSocketServer() = default;

UnixSocketServer::~UnixSocketServer() {
    stop();
}

bool UnixSocketServer::start(const std::string& endpoint) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) {
        std::println(stderr, "ipc: socket path too long: {}", endpoint);
        return false;
    }
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    // Remove stale socket
    ::unlink(endpoint.c_str());

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        std::println(stderr, "ipc: socket() failed: {}", std::strerror(errno));
        return false;
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "ipc: bind() failed: {}", std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }
    socket_path_ = endpoint;

    // Only the owning user may drive the microphone.
    if (::chmod(endpoint.c_str(), S_IRUSR | S_IWUSR) < 0) {
        std::println(stderr, "ipc: chmod() failed: {}", std::strerror(errno));
    }

    if (::listen(server_fd_, 4) < 0) {
        std::println(stderr, "ipc: listen() failed: {}", std::strerror(errno));
        stop();
        return false;
    }

    return true;
}

void UnixSocketServer::stop() {
    for (auto& [fd, buf] : pending_) {
        ::close(fd);
    }
    pending_.clear();

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

int UnixSocketServer::accept_client() {
    int fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) return -1;
    pending_.emplace(fd, std::string{});
    return fd;
}

ReadResult UnixSocketServer::read_command(int client_fd, nlohmann::json& cmd) {
    auto it = pending_.find(client_fd);
    if (it == pending_.end()) return ReadResult::Closed;
    auto& buf = it->second;

    // A previous read may already hold a complete line.
    if (buf.find('\n') == std::string::npos) {
        char chunk[4096];
        ssize_t n = ::recv(client_fd, chunk, sizeof(chunk), 0);
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            return ReadResult::Incomplete;
        }
        if (n <= 0) return ReadResult::Closed;

        buf.append(chunk, static_cast<size_t>(n));
        if (buf.size() > max_message_bytes) {
            std::println(stderr, "ipc: client {} exceeded message size, dropping", client_fd);
            return ReadResult::Closed;
        }
    }

    // Newline-delimited JSON
    auto pos = buf.find('\n');
    if (pos == std::string::npos) return ReadResult::Incomplete;

    std::string line = buf.substr(0, pos);
    buf.erase(0, pos + 1);

    try {
        cmd = nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception& e) {
        std::println(stderr, "ipc: malformed command: {}", e.what());
        return ReadResult::Closed;
    }
    return cmd.is_object() ? ReadResult::Command : ReadResult::Closed;
}

bool UnixSocketServer::send_response(int client_fd, const nlohmann::json& response) {
    std::string msg = response.dump() + "\n";
    ssize_t sent = ::send(client_fd, msg.data(), msg.size(), MSG_NOSIGNAL);
    return sent == static_cast<ssize_t>(msg.size());
}

void UnixSocketServer::close_client(int client_fd) {
    if (pending_.erase(client_fd) > 0) {
        ::close(client_fd);
    }
}
