#pragma once

#include "errors.hpp"

#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <vector>

struct AudioSettings {
    std::string device = "default";
    uint32_t sample_rate = 16000;
    std::string format = "wav";
};

// Microphone source. Chunks are reported to the observer in arrival order on
// the capture thread; the observer must not block.
class AudioCapture {
public:
    using ChunkObserver = std::function<void(std::span<const int16_t>)>;

    virtual ~AudioCapture() = default;
    virtual Result<void> start_capture(const AudioSettings& settings) = 0;
    // Stops the stream and hands over everything captured since start.
    virtual std::vector<int16_t> stop_capture() = 0;
    virtual bool is_capturing() const = 0;
    virtual void set_chunk_observer(ChunkObserver observer) = 0;
};
