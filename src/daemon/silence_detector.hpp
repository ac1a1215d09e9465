#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>

// Watches the capture stream and fires once when the speaker has gone quiet.
// Silence is only timed after the first loud chunk of a session, so a quiet
// room at the start of a recording never triggers a stop.
class SilenceDetector {
public:
    using Clock = std::chrono::steady_clock;
    using SilenceCallback = std::function<void()>;

    struct Options {
        double threshold = 0.005;                       // RMS, 0..1
        std::chrono::milliseconds duration{3000};
    };

    SilenceDetector() = default;
    explicit SilenceDetector(Options opts) : opts_(opts) {}

    void on_silence(SilenceCallback cb) { callback_ = std::move(cb); }

    void process_chunk(std::span<const int16_t> chunk) { process_chunk(chunk, Clock::now()); }
    void process_chunk(std::span<const int16_t> chunk, Clock::time_point now);

    void reset();

    bool speech_observed() const { return state_.speech_observed; }
    bool emitted() const { return state_.emitted; }
    const Options& options() const { return opts_; }

    static double rms(std::span<const int16_t> chunk);

private:
    struct State {
        bool speech_observed = false;
        std::optional<Clock::time_point> silence_started;
        bool emitted = false;
    };

    Options opts_;
    State state_;
    SilenceCallback callback_;
};
