#pragma once

#include "audio_encoder.hpp"
#include "command_parser.hpp"
#include "config.hpp"
#include "output/delivery_transaction.hpp"
#include "output/output.hpp"
#include "platform/audio_capture.hpp"
#include "platform/ipc_server.hpp"
#include "platform/notifier.hpp"
#include "recording_orchestrator.hpp"
#include "silence_detector.hpp"
#include "storage/history_db.hpp"
#include "whisper/retrying_transcriber.hpp"

#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Platform-independent daemon logic: IPC command handling on top of the
// recording orchestrator. Everything here runs on the event loop thread
// except the processing worker, which hands its result back through
// NotifyCallback.
class DaemonCore {
public:
    // Wakes the event loop; called from the worker thread.
    using NotifyCallback = std::function<void()>;
    // Asks the event loop to stop recording; called from the capture thread.
    using SilenceCallback = std::function<void()>;

    DaemonCore(Config config, bool verbose,
               AudioCapture& audio, Clipboard& clipboard, KeystrokeSimulator& keys,
               Notifier& notifier, IpcServer& ipc,
               NotifyCallback notify, SilenceCallback silence);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // history_path overrides the default database location.
    bool init(const std::string& history_path = {});

    // Entry point for a decoded client message; rejects a missing or non-string "cmd".
    nlohmann::json handle_request(const nlohmann::json& cmd);
    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    void on_processing_complete();
    void on_silence_detected();

    void add_waiting_client(int fd);
    void remove_waiting_client(int fd);

    RecordingState state() const { return orchestrator_.state(); }

    void shutdown();

private:
    nlohmann::json handle_start(const nlohmann::json& cmd);
    nlohmann::json handle_stop(const nlohmann::json& cmd);
    nlohmann::json handle_toggle(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);
    nlohmann::json handle_history_clear(const nlohmann::json& cmd);
    nlohmann::json handle_test(const nlohmann::json& cmd);

    nlohmann::json begin_stop();
    void record(const StopOutcome& outcome);
    static nlohmann::json outcome_response(const StopOutcome& outcome);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    AudioCapture& audio_;
    IpcServer& ipc_;
    NotifyCallback notify_;
    SilenceCallback silence_cb_;

    WavEncoder encoder_;
    RetryingTranscriber transcriber_;
    DeliveryTransaction delivery_;
    std::optional<CommandParser> parser_;
    SilenceDetector silence_;
    RecordingOrchestrator orchestrator_;
    HistoryDb history_db_;
    std::string backend_name_;

    std::vector<int> waiting_clients_;

    std::mutex outcomes_mutex_;
    std::vector<StopOutcome> outcomes_;
    std::jthread worker_;
};
