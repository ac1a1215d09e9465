#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <charconv>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

namespace {

// Stop replies only once transcription (with retries) has finished.
constexpr int processing_timeout_ms = 180000;
constexpr int command_timeout_ms = 15000;

void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  start                 Start recording");
    std::println(stderr, "  stop                  Stop recording, transcribe and paste");
    std::println(stderr, "  toggle                Start or stop recording");
    std::println(stderr, "  status                Show daemon status");
    std::println(stderr, "  history [--limit N]   Show transcription history");
    std::println(stderr, "  clear-history         Delete transcription history");
    std::println(stderr, "  test                  Check that the STT backend is reachable");
}

bool parse_limit(const std::string& s, int& out) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size() && out > 0;
}

int print_error(const json& response) {
    auto title = response.value("title", "Error");
    std::println(stderr, "{}: {}", title, response.value("message", "unknown error"));
    return 1;
}

void print_transcript(const json& response) {
    if (response.contains("text")) {
        std::println("{}", response["text"].get<std::string>());
    }
    if (response.contains("duration") && response.contains("processing_time")) {
        std::println(stderr, "({:.1f}s audio, {:.1f}s processing)",
                     response["duration"].get<double>(),
                     response["processing_time"].get<double>());
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    int limit = 10;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--limit" && i + 1 < argc) {
            if (!parse_limit(argv[++i], limit)) {
                std::println(stderr, "--limit expects a positive number");
                return 1;
            }
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    json cmd;
    int timeout_ms = command_timeout_ms;
    if (command == "start" || command == "status" || command == "test") {
        cmd = {{"cmd", command}};
    } else if (command == "stop" || command == "toggle") {
        cmd = {{"cmd", command}};
        timeout_ms = processing_timeout_ms;
    } else if (command == "history") {
        cmd = {{"cmd", "history"}, {"limit", limit}};
    } else if (command == "clear-history") {
        cmd = {{"cmd", "history-clear"}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is voicekeyd running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    auto response = client.recv(timeout_ms);
    if (!response) {
        std::println(stderr, "No response from daemon: {}", response.error());
        return 1;
    }

    if (response->value("status", "") == "error") {
        return print_error(*response);
    }

    if (command == "status") {
        std::println("State: {}", response->value("state", "unknown"));
        std::println("Backend: {} ({})", response->value("backend", "?"),
                     response->value("url", "?"));
        if (response->contains("duration")) {
            std::println("Recording duration: {:.1f}s", (*response)["duration"].get<double>());
        }
    } else if (command == "history") {
        for (auto& entry : (*response)["entries"]) {
            std::println("[{}] {}", entry.value("timestamp", ""), entry.value("text", ""));
        }
    } else if (command == "test") {
        bool reachable = response->value("reachable", false);
        std::println("{}: {}", response->value("backend", "backend"),
                     reachable ? "reachable" : "unreachable");
        return reachable ? 0 : 1;
    } else if (response->contains("text")) {
        print_transcript(*response);
    } else {
        std::println("{}", response->value("message", "OK"));
    }

    return 0;
}
