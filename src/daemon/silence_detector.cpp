#include "silence_detector.hpp"

#include <cmath>

void SilenceDetector::process_chunk(std::span<const int16_t> chunk, Clock::time_point now) {
    if (rms(chunk) >= opts_.threshold) {
        state_.speech_observed = true;
        state_.silence_started.reset();
        state_.emitted = false;
        return;
    }

    if (!state_.speech_observed) return;

    if (!state_.silence_started) {
        state_.silence_started = now;
    }

    if (!state_.emitted && now - *state_.silence_started >= opts_.duration) {
        state_.emitted = true;
        if (callback_) callback_();
    }
}

void SilenceDetector::reset() {
    state_ = State{};
}

double SilenceDetector::rms(std::span<const int16_t> chunk) {
    if (chunk.empty()) return 0.0;

    double sum_squares = 0.0;
    for (int16_t s : chunk) {
        double v = static_cast<double>(s) / 32768.0;
        sum_squares += v * v;
    }
    return std::sqrt(sum_squares / static_cast<double>(chunk.size()));
}
