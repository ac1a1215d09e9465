#pragma once

#include "errors.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

// Encodes raw PCM int16 samples into a WAV file in memory.
namespace wav {

std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate,
                            uint16_t channels = 1);

} // namespace wav

class AudioEncoder {
public:
    virtual ~AudioEncoder() = default;
    virtual Result<std::vector<uint8_t>> encode(std::span<const int16_t> pcm,
                                                uint32_t sample_rate,
                                                const std::string& format) const = 0;
};

class WavEncoder : public AudioEncoder {
public:
    Result<std::vector<uint8_t>> encode(std::span<const int16_t> pcm,
                                        uint32_t sample_rate,
                                        const std::string& format) const override;
};
