#pragma once

#include "audio_encoder.hpp"
#include "command_parser.hpp"
#include "errors.hpp"
#include "output/delivery_transaction.hpp"
#include "platform/audio_capture.hpp"
#include "platform/notifier.hpp"
#include "recording_state.hpp"
#include "silence_detector.hpp"
#include "whisper/retrying_transcriber.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

// What one stop() produced. A transcript can be present together with an
// error when delivery failed after a successful transcription.
struct StopOutcome {
    std::optional<TranscriptResult> transcript;
    std::optional<Error> error;
    bool delivered = false;
};

// Drives one recording session at a time through
// Idle -> Recording -> Processing -> Idle.
//
// start() and stop() reject calls that do not match the current state, so a
// second toggle while a result is being processed does nothing. Processing
// runs through the executor; by default it runs inline on the caller's thread.
class RecordingOrchestrator {
public:
    using Task = std::function<void()>;
    using Executor = std::function<void(Task)>;
    using CompletionCallback = std::function<void(const StopOutcome&)>;

    struct Settings {
        AudioSettings audio;
        TranscriptionOptions transcription;
    };

    RecordingOrchestrator(AudioCapture& audio, const AudioEncoder& encoder,
                          RetryingTranscriber& transcriber, DeliveryTransaction& delivery,
                          Notifier& notifier, Settings settings);

    RecordingOrchestrator(const RecordingOrchestrator&) = delete;
    RecordingOrchestrator& operator=(const RecordingOrchestrator&) = delete;

    // Optional collaborators. A null parser delivers plain text.
    void set_silence_detector(SilenceDetector* detector) { silence_ = detector; }
    void set_command_parser(const CommandParser* parser) { parser_ = parser; }
    void set_executor(Executor executor) { executor_ = std::move(executor); }
    void on_complete(CompletionCallback cb) { on_complete_ = std::move(cb); }

    bool toggle();
    bool start();
    bool stop();

    RecordingState state() const;
    double recording_duration() const;
    const Settings& settings() const { return settings_; }

private:
    void run_pipeline(std::vector<int16_t> pcm);
    StopOutcome process(const std::vector<int16_t>& pcm);
    void finish(const StopOutcome& outcome);
    void set_state(RecordingState state);
    void report(const Error& err);

    AudioCapture& audio_;
    const AudioEncoder& encoder_;
    RetryingTranscriber& transcriber_;
    DeliveryTransaction& delivery_;
    Notifier& notifier_;
    Settings settings_;

    SilenceDetector* silence_ = nullptr;
    const CommandParser* parser_ = nullptr;
    Executor executor_;
    CompletionCallback on_complete_;

    mutable std::mutex mutex_;
    RecordingState state_ = RecordingState::Idle;
    bool starting_ = false;
    std::chrono::steady_clock::time_point record_start_;
};
