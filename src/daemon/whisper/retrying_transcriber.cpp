#include "retrying_transcriber.hpp"

#include <algorithm>
#include <print>
#include <thread>

std::chrono::milliseconds RetryPolicy::delay_before(int retry) const {
    if (retry < 1 || initial_delay <= std::chrono::milliseconds{0}) {
        return std::chrono::milliseconds{0};
    }
    auto delay = initial_delay;
    for (int i = 1; i < retry && delay < max_delay; ++i) delay *= 2;
    return std::min(delay, max_delay);
}

RetryingTranscriber::RetryingTranscriber(BackendSelector select, RetryPolicy policy,
                                         SleepFn sleep)
    : select_(std::move(select)), policy_(policy), sleep_(std::move(sleep)) {
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

Result<TranscriptResult>
RetryingTranscriber::transcribe(std::span<const uint8_t> encoded_audio,
                                const TranscriptionOptions& options) {
    auto backend = select_();
    if (!backend) return std::unexpected(backend.error());

    for (int attempt = 0;; ++attempt) {
        auto result = (*backend)->transcribe(encoded_audio, options);
        if (result) return result;

        if (attempt >= policy_.max_retries || !is_retryable(result.error())) {
            return result;
        }

        auto delay = policy_.delay_before(attempt + 1);
        std::println(stderr, "http: {} failed ({}), retry {}/{} in {}ms",
                     (*backend)->name(), to_string(result.error()),
                     attempt + 1, policy_.max_retries, delay.count());
        sleep_(delay);
    }
}

Result<bool> RetryingTranscriber::test_connection() {
    auto backend = select_();
    if (!backend) return std::unexpected(backend.error());
    return (*backend)->test_connection();
}
