#include "recording_orchestrator.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <print>

RecordingOrchestrator::RecordingOrchestrator(AudioCapture& audio, const AudioEncoder& encoder,
                                             RetryingTranscriber& transcriber,
                                             DeliveryTransaction& delivery,
                                             Notifier& notifier, Settings settings)
    : audio_(audio), encoder_(encoder), transcriber_(transcriber),
      delivery_(delivery), notifier_(notifier), settings_(std::move(settings)),
      executor_([](Task task) { task(); }) {}

bool RecordingOrchestrator::toggle() {
    switch (state()) {
        case RecordingState::Idle:
            return start();
        case RecordingState::Recording:
            return stop();
        case RecordingState::Processing:
            break;
    }
    return false;
}

bool RecordingOrchestrator::start() {
    {
        std::lock_guard lock(mutex_);
        if (state_ != RecordingState::Idle || starting_) return false;
        state_ = RecordingState::Recording;
        starting_ = true;
        record_start_ = std::chrono::steady_clock::now();
    }
    notifier_.on_state_change(RecordingState::Recording);

    if (silence_) silence_->reset();

    Result<void> started;
    try {
        started = audio_.start_capture(settings_.audio);
    } catch (const std::exception& e) {
        started = std::unexpected(AudioError{e.what()});
    }

    if (!started) {
        std::println(stderr, "session: failed to start audio capture: {}",
                     to_string(started.error()));
        {
            std::lock_guard lock(mutex_);
            starting_ = false;
        }
        set_state(RecordingState::Idle);
        report(started.error());
        return false;
    }

    std::lock_guard lock(mutex_);
    starting_ = false;
    return true;
}

bool RecordingOrchestrator::stop() {
    {
        std::lock_guard lock(mutex_);
        if (state_ != RecordingState::Recording || starting_) return false;
        state_ = RecordingState::Processing;
    }
    notifier_.on_state_change(RecordingState::Processing);

    auto pcm = audio_.stop_capture();

    try {
        executor_([this, pcm = std::move(pcm)]() mutable { run_pipeline(std::move(pcm)); });
    } catch (const std::exception& e) {
        // Could not hand the work off; finish here so the state machine
        // does not stay in Processing.
        finish(StopOutcome{.error = UnknownError{e.what()}});
    }
    return true;
}

RecordingState RecordingOrchestrator::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

double RecordingOrchestrator::recording_duration() const {
    std::lock_guard lock(mutex_);
    if (state_ != RecordingState::Recording) return 0.0;
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(now - record_start_).count();
}

void RecordingOrchestrator::run_pipeline(std::vector<int16_t> pcm) {
    StopOutcome outcome;
    try {
        outcome = process(pcm);
    } catch (const std::exception& e) {
        outcome.error = UnknownError{e.what()};
    }
    finish(outcome);
}

StopOutcome RecordingOrchestrator::process(const std::vector<int16_t>& pcm) {
    StopOutcome outcome;

    if (pcm.empty()) {
        outcome.error = AudioError{"No audio captured"};
        return outcome;
    }

    const auto& audio = settings_.audio;
    auto encoded = encoder_.encode(pcm, audio.sample_rate, audio.format);
    if (!encoded) {
        outcome.error = encoded.error();
        return outcome;
    }

    auto result = transcriber_.transcribe(*encoded, settings_.transcription);
    if (!result) {
        outcome.error = result.error();
        return outcome;
    }

    result->duration_s = static_cast<double>(pcm.size()) / audio.sample_rate;
    outcome.transcript = std::move(*result);

    const auto& text = outcome.transcript->text;
    bool blank = std::all_of(text.begin(), text.end(),
                             [](unsigned char c) { return std::isspace(c); });
    if (blank) return outcome;

    Result<void> delivered = parser_ ? delivery_.deliver(parser_->parse(text))
                                     : delivery_.deliver(text);
    if (!delivered) {
        outcome.error = delivered.error();
        return outcome;
    }

    outcome.delivered = true;
    return outcome;
}

void RecordingOrchestrator::finish(const StopOutcome& outcome) {
    set_state(RecordingState::Idle);
    if (outcome.error) report(*outcome.error);
    if (on_complete_) on_complete_(outcome);
}

void RecordingOrchestrator::set_state(RecordingState state) {
    {
        std::lock_guard lock(mutex_);
        state_ = state;
    }
    notifier_.on_state_change(state);
}

void RecordingOrchestrator::report(const Error& err) {
    auto notice = describe(err);
    notifier_.notify(notice.title, notice.body);
}
