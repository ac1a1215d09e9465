#include "daemon_core.hpp"

#include "platform/platform_paths.hpp"
#include "whisper/backend_factory.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <print>

namespace {

BackendSettings backend_settings(const Config& config) {
    return BackendSettings{
        .url = config.backend.url,
        .api_key = config.backend.api_key(),
        .timeout_ms = static_cast<long>(config.backend.timeout_ms),
    };
}

RecordingOrchestrator::Settings orchestrator_settings(const Config& config) {
    return RecordingOrchestrator::Settings{
        .audio = AudioSettings{
            .device = config.audio.device,
            .sample_rate = config.audio.sample_rate,
            .format = config.audio.format,
        },
        .transcription = TranscriptionOptions{
            .model = config.backend.model,
            .language = config.backend.language,
            .temperature = config.backend.temperature,
        },
    };
}

const char* backend_kind_name(BackendKind kind) {
    switch (kind) {
        case BackendKind::OpenAi: return "openai";
        case BackendKind::WhisperCpp: return "whisper.cpp";
        case BackendKind::Ollama: return "ollama";
    }
    return "unknown";
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose,
                       AudioCapture& audio, Clipboard& clipboard, KeystrokeSimulator& keys,
                       Notifier& notifier, IpcServer& ipc,
                       NotifyCallback notify, SilenceCallback silence)
    : config_(std::move(config)), verbose_(verbose),
      audio_(audio), ipc_(ipc),
      notify_(std::move(notify)), silence_cb_(std::move(silence)),
      transcriber_(
          [settings = backend_settings(config_)] { return make_backend(settings); },
          RetryPolicy{
              .max_retries = config_.retry.max_retries,
              .initial_delay = std::chrono::milliseconds(config_.retry.initial_delay_ms),
          }),
      delivery_(clipboard, keys,
                DeliveryTransaction::Timing{
                    .settle = std::chrono::milliseconds(config_.output.settle_ms),
                    .restore = std::chrono::milliseconds(config_.output.restore_ms),
                }),
      silence_(SilenceDetector::Options{
          .threshold = config_.silence.threshold,
          .duration = std::chrono::milliseconds(config_.silence.duration_ms),
      }),
      orchestrator_(audio_, encoder_, transcriber_, delivery_, notifier,
                    orchestrator_settings(config_)),
      history_db_(config_.history.max_entries) {}

DaemonCore::~DaemonCore() {
    audio_.set_chunk_observer({});
}

bool DaemonCore::init(const std::string& history_path) {
    auto kind = detect_backend(config_.backend.url);
    if (!kind) {
        std::println(stderr, "Invalid backend URL {}: {}", config_.backend.url,
                     to_string(kind.error()));
        return false;
    }
    backend_name_ = backend_kind_name(*kind);

    if (config_.commands.enabled) {
        parser_.emplace(config_.commands.custom);
        orchestrator_.set_command_parser(&*parser_);
    }

    if (config_.silence.enabled) {
        silence_.on_silence(silence_cb_);
        orchestrator_.set_silence_detector(&silence_);
        audio_.set_chunk_observer([this](std::span<const int16_t> chunk) {
            silence_.process_chunk(chunk);
        });
    }

    orchestrator_.set_executor([this](RecordingOrchestrator::Task task) {
        worker_ = std::jthread([task = std::move(task)] { task(); });
    });

    orchestrator_.on_complete([this](const StopOutcome& outcome) {
        {
            std::lock_guard lock(outcomes_mutex_);
            outcomes_.push_back(outcome);
        }
        notify_();
    });

    std::string db_path = history_path;
    if (db_path.empty()) {
        auto data = platform::data_dir();
        db_path = !data.empty() ? data + "/history.db" : "/tmp/voicekey/history.db";
    }
    if (!history_db_.open(db_path)) {
        std::println(stderr, "Warning: history DB failed to open, history disabled");
    }

    log(std::format("Backend: {} @ {}", backend_name_, config_.backend.url));
    return true;
}

nlohmann::json DaemonCore::handle_request(const nlohmann::json& cmd) {
    auto it = cmd.find("cmd");
    if (it == cmd.end() || !it->is_string()) {
        return {{"status", "error"}, {"message", "bad request"}};
    }
    return handle_command(it->get<std::string>(), cmd);
}

nlohmann::json DaemonCore::handle_command(const std::string& cmd_str,
                                          const nlohmann::json& cmd) {
    try {
        if (cmd_str == "start") return handle_start(cmd);
        if (cmd_str == "stop") return handle_stop(cmd);
        if (cmd_str == "toggle") return handle_toggle(cmd);
        if (cmd_str == "status") return handle_status(cmd);
        if (cmd_str == "history") return handle_history(cmd);
        if (cmd_str == "history-clear") return handle_history_clear(cmd);
        if (cmd_str == "test") return handle_test(cmd);
    } catch (const nlohmann::json::exception& e) {
        // Wrongly typed arguments from a client.
        return {{"status", "error"}, {"message", std::string("bad request: ") + e.what()}};
    }
    return {{"status", "error"}, {"message", "unknown command"}};
}

nlohmann::json DaemonCore::handle_start(const nlohmann::json& /*cmd*/) {
    if (orchestrator_.state() != RecordingState::Idle) {
        return {{"status", "error"}, {"message", "already recording or processing"}};
    }

    if (!orchestrator_.start()) {
        return {{"status", "error"}, {"message", "failed to start recording"}};
    }

    log("Recording started");
    return {{"status", "ok"}, {"message", "recording"}};
}

nlohmann::json DaemonCore::handle_stop(const nlohmann::json& /*cmd*/) {
    if (orchestrator_.state() != RecordingState::Recording) {
        return {{"status", "error"}, {"message", "not recording"}};
    }
    return begin_stop();
}

nlohmann::json DaemonCore::handle_toggle(const nlohmann::json& cmd) {
    switch (orchestrator_.state()) {
        case RecordingState::Idle:
            return handle_start(cmd);
        case RecordingState::Recording:
            return begin_stop();
        case RecordingState::Processing:
            break;
    }
    return {{"status", "error"}, {"message", "busy processing previous recording"}};
}

nlohmann::json DaemonCore::begin_stop() {
    double duration = orchestrator_.recording_duration();
    if (!orchestrator_.stop()) {
        return {{"status", "error"}, {"message", "not recording"}};
    }

    log(std::format("Recording stopped after {:.1f}s, transcribing...", duration));
    return {{"status", "processing"}, {"duration", duration}};
}

nlohmann::json DaemonCore::handle_status(const nlohmann::json& /*cmd*/) {
    nlohmann::json resp = {
        {"status", "ok"},
        {"state", to_string(orchestrator_.state())},
        {"backend", backend_name_},
        {"url", config_.backend.url},
        {"commands", parser_.has_value()},
        {"auto_stop", config_.silence.enabled},
    };
    if (orchestrator_.state() == RecordingState::Recording) {
        resp["duration"] = orchestrator_.recording_duration();
    }
    return resp;
}

nlohmann::json DaemonCore::handle_history(const nlohmann::json& cmd) {
    int limit = std::clamp(cmd.value("limit", 10), 1, std::max(1, config_.history.max_entries));
    auto entries = history_db_.recent(limit);

    nlohmann::json resp = {{"status", "ok"}, {"entries", nlohmann::json::array()}};
    for (auto& e : entries) {
        resp["entries"].push_back({
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"text", e.text},
            {"language", e.language},
            {"audio_duration", e.audio_duration},
            {"processing_time", e.processing_time},
            {"backend", e.backend},
        });
    }
    return resp;
}

nlohmann::json DaemonCore::handle_history_clear(const nlohmann::json& /*cmd*/) {
    if (!history_db_.clear()) {
        return {{"status", "error"}, {"message", "history unavailable"}};
    }
    return {{"status", "ok"}};
}

nlohmann::json DaemonCore::handle_test(const nlohmann::json& /*cmd*/) {
    auto reachable = transcriber_.test_connection();
    if (!reachable) {
        auto notice = describe(reachable.error());
        return {{"status", "error"}, {"title", notice.title},
                {"message", to_string(reachable.error())}};
    }
    return {{"status", "ok"}, {"reachable", *reachable}, {"backend", backend_name_}};
}

void DaemonCore::on_processing_complete() {
    // A newer session may already be processing; its thread is joined later.
    if (worker_.joinable() && orchestrator_.state() != RecordingState::Processing) {
        worker_.join();
    }

    std::vector<StopOutcome> done;
    {
        std::lock_guard lock(outcomes_mutex_);
        done.swap(outcomes_);
    }

    for (const auto& outcome : done) {
        record(outcome);

        auto response = outcome_response(outcome);
        for (int fd : waiting_clients_) {
            ipc_.send_response(fd, response);
        }
        waiting_clients_.clear();
    }
}

void DaemonCore::on_silence_detected() {
    if (orchestrator_.state() != RecordingState::Recording) return;
    log("Silence detected, stopping");
    begin_stop();
}

void DaemonCore::record(const StopOutcome& outcome) {
    if (outcome.error) {
        log("Processing failed: " + to_string(*outcome.error));
    }
    if (!outcome.transcript) return;

    const auto& tr = *outcome.transcript;
    log(std::format("Transcription complete: {:.1f}s audio, {:.1f}s processing, {} chars",
                    tr.duration_s, tr.processing_s, tr.text.size()));

    if (tr.text.find_first_not_of(" \t\n\r") == std::string::npos) return;
    history_db_.insert(tr.text, tr.language.value_or(config_.backend.language),
                       tr.duration_s, tr.processing_s, backend_name_);
}

nlohmann::json DaemonCore::outcome_response(const StopOutcome& outcome) {
    nlohmann::json response;
    if (outcome.error) {
        auto notice = describe(*outcome.error);
        response = {
            {"status", "error"},
            {"title", notice.title},
            {"message", to_string(*outcome.error)},
        };
    } else {
        response = {{"status", "ok"}};
    }

    if (outcome.transcript) {
        response["text"] = outcome.transcript->text;
        response["duration"] = outcome.transcript->duration_s;
        response["processing_time"] = outcome.transcript->processing_s;
        if (outcome.transcript->language) {
            response["language"] = *outcome.transcript->language;
        }
    }
    return response;
}

void DaemonCore::add_waiting_client(int fd) {
    waiting_clients_.push_back(fd);
}

void DaemonCore::remove_waiting_client(int fd) {
    std::erase(waiting_clients_, fd);
}

void DaemonCore::shutdown() {
    if (orchestrator_.state() == RecordingState::Recording) {
        audio_.stop_capture();
    }

    if (orchestrator_.state() == RecordingState::Processing) {
        log("Waiting for pending transcription to complete...");
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    on_processing_complete();
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[voicekey] {}", msg);
    }
}
