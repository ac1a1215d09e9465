#pragma once

#include "backend.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>

struct RetryPolicy {
    static constexpr std::chrono::milliseconds max_delay{60000};

    int max_retries = 3;
    std::chrono::milliseconds initial_delay{1000};

    // Delay before retry n (1-based): initial_delay * 2^(n-1), capped at max_delay.
    std::chrono::milliseconds delay_before(int retry) const;
};

// Runs a backend request with exponential backoff on network failures.
// Everything else is returned on the first attempt, untouched.
class RetryingTranscriber {
public:
    using BackendSelector = std::function<Result<std::unique_ptr<WhisperBackend>>()>;
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    explicit RetryingTranscriber(BackendSelector select, RetryPolicy policy = {},
                                 SleepFn sleep = {});

    Result<TranscriptResult> transcribe(std::span<const uint8_t> encoded_audio,
                                        const TranscriptionOptions& options);

    // Single probe, no retries. Fails only if no backend can be selected.
    Result<bool> test_connection();

    const RetryPolicy& policy() const { return policy_; }

private:
    BackendSelector select_;
    RetryPolicy policy_;
    SleepFn sleep_;
};
