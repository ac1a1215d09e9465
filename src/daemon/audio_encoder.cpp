#include "audio_encoder.hpp"

namespace wav {

std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate,
                            uint16_t channels) {
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = static_cast<uint16_t>(channels * bits_per_sample / 8);
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));

    std::vector<uint8_t> out;
    out.reserve(44 + data_size);

    auto tag = [&out](const char* t) { out.insert(out.end(), t, t + 4); };
    auto le16 = [&out](uint16_t v) {
        out.push_back(static_cast<uint8_t>(v & 0xff));
        out.push_back(static_cast<uint8_t>(v >> 8));
    };
    auto le32 = [&out](uint32_t v) {
        for (int shift = 0; shift < 32; shift += 8) {
            out.push_back(static_cast<uint8_t>((v >> shift) & 0xff));
        }
    };

    tag("RIFF");
    le32(36 + data_size);
    tag("WAVE");
    tag("fmt ");
    le32(16);               // fmt chunk size
    le16(1);                // PCM
    le16(channels);
    le32(sample_rate);
    le32(byte_rate);
    le16(block_align);
    le16(bits_per_sample);
    tag("data");
    le32(data_size);
    for (int16_t s : samples) {
        le16(static_cast<uint16_t>(s));
    }

    return out;
}

} // namespace wav

Result<std::vector<uint8_t>> WavEncoder::encode(std::span<const int16_t> pcm,
                                                uint32_t sample_rate,
                                                const std::string& format) const {
    if (format != "wav") {
        return std::unexpected(AudioError{"Unsupported format: " + format});
    }
    if (sample_rate == 0) {
        return std::unexpected(AudioError{"Invalid sample rate"});
    }
    return wav::encode(pcm, sample_rate);
}
