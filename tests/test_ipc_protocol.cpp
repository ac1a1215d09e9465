#include <catch2/catch_test_macros.hpp>

#include "platform/linux/unix_socket_client.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;

namespace {

std::string tmp_socket_path() {
    return "/tmp/vk_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// The server socket is non-blocking, so poll briefly for data to arrive.
ReadResult read_with_retry(UnixSocketServer& server, int fd, json& cmd) {
    ReadResult r = ReadResult::Incomplete;
    for (int i = 0; i < 100 && r == ReadResult::Incomplete; ++i) {
        r = server.read_command(fd, cmd);
        if (r == ReadResult::Incomplete) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return r;
}

} // namespace

TEST_CASE("IPC protocol", "[ipc]") {
    auto sock_path = tmp_socket_path();

    SECTION("ServerStartStop") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        REQUIRE(std::filesystem::exists(sock_path));

        struct stat st{};
        REQUIRE(::stat(sock_path.c_str(), &st) == 0);
        REQUIRE((st.st_mode & 0777) == 0600);

        server.stop();
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send({{"cmd", "history"}, {"limit", 5}}));

        json received;
        REQUIRE(read_with_retry(server, client_fd, received) == ReadResult::Command);
        REQUIRE(received["cmd"] == "history");
        REQUIRE(received["limit"] == 5);

        REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"state", "idle"}}));

        auto resp = client.recv(1000);
        REQUIRE(resp);
        REQUIRE((*resp)["state"] == "idle");

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("IncompleteLineIsNotADisconnect") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        json cmd;
        REQUIRE(server.read_command(client_fd, cmd) == ReadResult::Incomplete);

        server.stop();
    }

    SECTION("PipelinedCommands") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        for (int i = 0; i < 3; ++i) {
            REQUIRE(client.send({{"cmd", "status"}, {"seq", i}}));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

        for (int i = 0; i < 3; ++i) {
            json received;
            REQUIRE(read_with_retry(server, client_fd, received) == ReadResult::Command);
            REQUIRE(received["seq"] == i);
        }

        server.stop();
    }

    SECTION("ClientReadsQueuedResponsesInOrder") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(server.send_response(client_fd, {{"seq", 1}}));
        REQUIRE(server.send_response(client_fd, {{"seq", 2}}));

        auto first = client.recv(1000);
        auto second = client.recv(1000);
        REQUIRE(first);
        REQUIRE(second);
        REQUIRE((*first)["seq"] == 1);
        REQUIRE((*second)["seq"] == 2);

        server.stop();
    }

    SECTION("MalformedCommandDropsClient") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = ::socket(AF_UNIX, SOCK_STREAM, 0);
        REQUIRE(raw >= 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);
        REQUIRE(::connect(raw, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        std::string garbage = "not json\n";
        REQUIRE(::write(raw, garbage.data(), garbage.size()) ==
                static_cast<ssize_t>(garbage.size()));

        json cmd;
        REQUIRE(read_with_retry(server, client_fd, cmd) == ReadResult::Closed);

        ::close(raw);
        server.stop();
    }

    SECTION("ClientDisconnect") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        client.close();

        json cmd;
        REQUIRE(read_with_retry(server, client_fd, cmd) == ReadResult::Closed);

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("ClientTimesOut") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        REQUIRE(server.accept_client() >= 0);

        auto resp = client.recv(20);
        REQUIRE_FALSE(resp);
        REQUIRE(resp.error() == "timed out");

        server.stop();
    }

    SECTION("OversizedMessageDropsClient") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);
        REQUIRE(server.client_count() == 1);

        // One JSON string longer than the limit, so no newline arrives in time.
        json big = {{"cmd", std::string(UnixSocketServer::max_message_bytes + 16, 'a')}};
        std::jthread writer([&] { client.send(big); });

        json cmd;
        ReadResult r = ReadResult::Incomplete;
        for (int i = 0; i < 1000 && r == ReadResult::Incomplete; ++i) {
            r = server.read_command(client_fd, cmd);
            if (r == ReadResult::Incomplete) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        REQUIRE(r == ReadResult::Closed);

        server.close_client(client_fd);
        REQUIRE(server.client_count() == 0);
        writer.join();
        server.stop();
    }

    SECTION("ConnectWithoutServerFails") {
        UnixSocketClient client;
        REQUIRE_FALSE(client.connect(sock_path));
    }
}
