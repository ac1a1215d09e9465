#include <catch2/catch_test_macros.hpp>

#include "daemon_core.hpp"
#include "mocks.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;

namespace {

class MockIpcServer : public IpcServer {
public:
    bool start(const std::string&) override { return true; }
    void stop() override {}
    int server_fd() const override { return -1; }
    int accept_client() override { return -1; }
    ReadResult read_command(int, json&) override { return ReadResult::Closed; }
    bool send_response(int client_fd, const json& response) override {
        sent.emplace_back(client_fd, response);
        return true;
    }
    void close_client(int) override {}

    std::vector<std::pair<int, json>> sent;
};

struct TmpDb {
    std::string path;

    TmpDb() {
        path = std::filesystem::temp_directory_path() /
               ("vk_test_core_" + std::to_string(getpid()) + ".sqlite");
    }

    ~TmpDb() { std::filesystem::remove(path); }
};

struct CoreHarness {
    Journal journal;
    MockAudioCapture audio;
    MockClipboard clipboard{journal};
    MockKeystrokes keys{journal};
    MockNotifier notifier;
    MockIpcServer ipc;
    TmpDb db;

    std::mutex mutex;
    std::condition_variable cv;
    int completions = 0;
    int silences = 0;

    std::unique_ptr<DaemonCore> core;

    explicit CoreHarness(Config config) {
        core = std::make_unique<DaemonCore>(
            std::move(config), false, audio, clipboard, keys, notifier, ipc,
            [this] {
                std::lock_guard lock(mutex);
                ++completions;
                cv.notify_all();
            },
            [this] { ++silences; });
    }

    static Config default_config() {
        Config cfg;
        // Nothing listens on the discard port.
        cfg.backend.url = "http://127.0.0.1:9/v1/audio/transcriptions";
        cfg.backend.timeout_ms = 2000;
        cfg.retry.max_retries = 0;
        return cfg;
    }

    bool wait_for_completion() {
        std::unique_lock lock(mutex);
        return cv.wait_for(lock, std::chrono::seconds(5), [this] { return completions > 0; });
    }
};

} // namespace

TEST_CASE("DaemonCore", "[daemon]") {

    SECTION("RejectsUnsupportedBackendUrl") {
        auto cfg = CoreHarness::default_config();
        cfg.backend.url = "http://localhost:8000/some/path";
        CoreHarness h(cfg);
        REQUIRE_FALSE(h.core->init(h.db.path));
    }

    SECTION("StatusWhenIdle") {
        CoreHarness h(CoreHarness::default_config());
        REQUIRE(h.core->init(h.db.path));

        auto resp = h.core->handle_command("status", {{"cmd", "status"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["state"] == "idle");
        REQUIRE(resp["backend"] == "openai");
        REQUIRE_FALSE(resp.contains("duration"));
    }

    SECTION("UnknownCommand") {
        CoreHarness h(CoreHarness::default_config());
        REQUIRE(h.core->init(h.db.path));

        auto resp = h.core->handle_command("dance", {{"cmd", "dance"}});
        REQUIRE(resp["status"] == "error");
    }

    SECTION("MalformedRequestsGetErrorReplies") {
        CoreHarness h(CoreHarness::default_config());
        REQUIRE(h.core->init(h.db.path));

        auto numeric = h.core->handle_request({{"cmd", 5}});
        REQUIRE(numeric["status"] == "error");
        REQUIRE(numeric["message"] == "bad request");

        auto missing = h.core->handle_request(nlohmann::json::object());
        REQUIRE(missing["status"] == "error");

        auto bad_limit = h.core->handle_request({{"cmd", "history"}, {"limit", "x"}});
        REQUIRE(bad_limit["status"] == "error");

        // The daemon keeps answering afterwards.
        REQUIRE(h.core->handle_request({{"cmd", "status"}})["state"] == "idle");
    }

    SECTION("StopWhenIdleIsAnError") {
        CoreHarness h(CoreHarness::default_config());
        REQUIRE(h.core->init(h.db.path));

        auto resp = h.core->handle_command("stop", {{"cmd", "stop"}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["message"] == "not recording");
    }

    SECTION("StartThenStatusShowsRecording") {
        CoreHarness h(CoreHarness::default_config());
        REQUIRE(h.core->init(h.db.path));

        auto resp = h.core->handle_command("start", {{"cmd", "start"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(h.core->state() == RecordingState::Recording);

        auto again = h.core->handle_command("start", {{"cmd", "start"}});
        REQUIRE(again["status"] == "error");

        auto status = h.core->handle_command("status", {{"cmd", "status"}});
        REQUIRE(status["state"] == "recording");
        REQUIRE(status.contains("duration"));

        h.core->shutdown();
    }

    SECTION("StartFailureIsReported") {
        CoreHarness h(CoreHarness::default_config());
        REQUIRE(h.core->init(h.db.path));
        h.audio.start_result = std::unexpected(AudioError{"device busy"});

        auto resp = h.core->handle_command("toggle", {{"cmd", "toggle"}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(h.core->state() == RecordingState::Idle);
        REQUIRE(h.notifier.notices.size() == 1);
    }

    SECTION("DeferredStopRepliesToWaitingClient") {
        CoreHarness h(CoreHarness::default_config());
        REQUIRE(h.core->init(h.db.path));
        // Empty capture fails before any network traffic.
        h.audio.samples.clear();

        REQUIRE(h.core->handle_command("toggle", {{"cmd", "toggle"}})["status"] == "ok");

        auto resp = h.core->handle_command("toggle", {{"cmd", "toggle"}});
        REQUIRE(resp["status"] == "processing");
        h.core->add_waiting_client(7);

        REQUIRE(h.wait_for_completion());
        h.core->on_processing_complete();

        REQUIRE(h.ipc.sent.size() == 1);
        REQUIRE(h.ipc.sent[0].first == 7);
        const auto& reply = h.ipc.sent[0].second;
        REQUIRE(reply["status"] == "error");
        REQUIRE(reply["title"] == "Recording Failed");
        REQUIRE(h.core->state() == RecordingState::Idle);
    }

    SECTION("DisconnectedClientIsNotAnswered") {
        CoreHarness h(CoreHarness::default_config());
        REQUIRE(h.core->init(h.db.path));
        h.audio.samples.clear();

        h.core->handle_command("start", {{"cmd", "start"}});
        h.core->handle_command("stop", {{"cmd", "stop"}});
        h.core->add_waiting_client(7);
        h.core->remove_waiting_client(7);

        REQUIRE(h.wait_for_completion());
        h.core->on_processing_complete();
        REQUIRE(h.ipc.sent.empty());
    }

    SECTION("SilenceStopsRecording") {
        auto cfg = CoreHarness::default_config();
        cfg.silence.enabled = true;
        cfg.silence.duration_ms = 0;
        CoreHarness h(cfg);
        REQUIRE(h.core->init(h.db.path));
        h.audio.samples.clear();

        h.core->handle_command("start", {{"cmd", "start"}});
        std::vector<int16_t> loud(160, 8000);
        std::vector<int16_t> quiet(160, 0);
        h.audio.feed(loud);
        h.audio.feed(quiet);
        REQUIRE(h.silences == 1);

        h.core->on_silence_detected();
        REQUIRE(h.core->state() != RecordingState::Recording);
        REQUIRE(h.audio.stops == 1);

        REQUIRE(h.wait_for_completion());
        h.core->on_processing_complete();
        REQUIRE(h.core->state() == RecordingState::Idle);
    }

    SECTION("SilenceIgnoredWhenIdle") {
        CoreHarness h(CoreHarness::default_config());
        REQUIRE(h.core->init(h.db.path));
        h.core->on_silence_detected();
        REQUIRE(h.audio.stops == 0);
    }

    SECTION("HistoryListsAndClears") {
        CoreHarness h(CoreHarness::default_config());
        REQUIRE(h.core->init(h.db.path));

        {
            HistoryDb other;
            REQUIRE(other.open(h.db.path));
            REQUIRE(other.insert("first", "en", 1.0, 0.1, "openai"));
            REQUIRE(other.insert("second", "en", 2.0, 0.2, "openai"));
        }

        auto resp = h.core->handle_command("history", {{"cmd", "history"}, {"limit", 1}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["entries"].size() == 1);
        REQUIRE(resp["entries"][0]["text"] == "second");

        REQUIRE(h.core->handle_command("history-clear", {{"cmd", "history-clear"}})["status"] == "ok");
        auto empty = h.core->handle_command("history", {{"cmd", "history"}});
        REQUIRE(empty["entries"].empty());
    }

    SECTION("TestReportsUnreachableBackend") {
        CoreHarness h(CoreHarness::default_config());
        REQUIRE(h.core->init(h.db.path));

        auto resp = h.core->handle_command("test", {{"cmd", "test"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["reachable"] == false);
    }
}
