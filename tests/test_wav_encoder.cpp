#include <catch2/catch_test_macros.hpp>

#include "audio_encoder.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace {

// Read a little-endian uint16 from raw bytes.
uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

// Read a little-endian uint32 from raw bytes.
uint32_t read_u32(const uint8_t* p) {
    return uint32_t(p[0]) | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16) |
           (uint32_t(p[3]) << 24);
}

std::string read_tag(const uint8_t* p) {
    return {reinterpret_cast<const char*>(p), 4};
}

} // namespace

TEST_CASE("wav::encode", "[wav]") {
    constexpr uint32_t sample_rate = 16000;
    std::vector<int16_t> samples = {0, 100, -100, 32767, -32768};

    SECTION("HeaderMagic") {
        auto wav = wav::encode(samples, sample_rate);
        REQUIRE(read_tag(wav.data()) == "RIFF");
        REQUIRE(read_tag(wav.data() + 8) == "WAVE");
        REQUIRE(read_tag(wav.data() + 12) == "fmt ");
        REQUIRE(read_tag(wav.data() + 36) == "data");
    }

    SECTION("HeaderFields") {
        auto wav = wav::encode(samples, sample_rate);
        REQUIRE(wav.size() == 44 + samples.size() * 2);

        REQUIRE(read_u32(wav.data() + 16) == 16);
        // PCM
        REQUIRE(read_u16(wav.data() + 20) == 1);
        REQUIRE(read_u16(wav.data() + 22) == 1);
        REQUIRE(read_u32(wav.data() + 24) == sample_rate);
        REQUIRE(read_u32(wav.data() + 28) == sample_rate * 2);
        REQUIRE(read_u16(wav.data() + 32) == 2);
        REQUIRE(read_u16(wav.data() + 34) == 16);

        uint32_t data_size = static_cast<uint32_t>(samples.size() * 2);
        REQUIRE(read_u32(wav.data() + 40) == data_size);
        REQUIRE(read_u32(wav.data() + 4) == 36 + data_size);
    }

    SECTION("SamplesLittleEndian") {
        auto wav = wav::encode(samples, sample_rate);
        // 100 = 0x0064, -100 = 0xff9c
        REQUIRE(wav[46] == 0x64);
        REQUIRE(wav[47] == 0x00);
        REQUIRE(wav[48] == 0x9c);
        REQUIRE(wav[49] == 0xff);
        // -32768 = 0x8000
        REQUIRE(wav[52] == 0x00);
        REQUIRE(wav[53] == 0x80);
    }

    SECTION("Stereo") {
        auto wav = wav::encode(std::vector<int16_t>{1, 2, 3, 4}, 44100, 2);
        REQUIRE(read_u16(wav.data() + 22) == 2);
        REQUIRE(read_u32(wav.data() + 28) == 44100 * 4);
        REQUIRE(read_u16(wav.data() + 32) == 4);
    }

    SECTION("EmptySamples") {
        std::vector<int16_t> empty;
        auto wav = wav::encode(empty, sample_rate);
        REQUIRE(wav.size() == 44);
        REQUIRE(read_u32(wav.data() + 40) == 0);
    }
}

TEST_CASE("WavEncoder", "[wav]") {
    WavEncoder encoder;
    std::vector<int16_t> pcm(160, 42);

    SECTION("EncodesWav") {
        auto r = encoder.encode(pcm, 16000, "wav");
        REQUIRE(r);
        REQUIRE(r->size() == 44 + 320);
    }

    SECTION("RejectsOtherFormats") {
        auto r = encoder.encode(pcm, 16000, "mp3");
        REQUIRE_FALSE(r);
        auto* audio = std::get_if<AudioError>(&r.error());
        REQUIRE(audio);
        REQUIRE(audio->reason == "Unsupported format: mp3");
    }

    SECTION("RejectsZeroSampleRate") {
        auto r = encoder.encode(pcm, 0, "wav");
        REQUIRE_FALSE(r);
        REQUIRE(std::holds_alternative<AudioError>(r.error()));
    }
}
