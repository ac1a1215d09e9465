#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

struct Config {
    struct Backend {
        std::string url = "http://localhost:8000/v1/audio/transcriptions";
        std::string model = "whisper-large-v3";
        std::string language = "en";
        std::optional<double> temperature;
        uint32_t timeout_ms = 30000;
        // The key itself never lives in the config file.
        std::string api_key_env = "VOICEKEY_API_KEY";

        std::string api_key() const;
    } backend;

    struct Retry {
        static constexpr int retry_limit = 10;
        int max_retries = 3;
        uint32_t initial_delay_ms = 1000;
    } retry;

    struct Audio {
        std::string device = "default";
        uint32_t sample_rate = 16000;
        uint32_t max_seconds = 120;
        std::string format = "wav";

        // Computed from max_seconds and sample_rate (no independent config key).
        size_t ring_buffer_samples() const {
            return static_cast<size_t>(max_seconds) * sample_rate;
        }
    } audio;

    struct Silence {
        bool enabled = true;
        double threshold = 0.005;
        uint32_t duration_ms = 3000;
    } silence;

    struct Commands {
        bool enabled = false;
        std::map<std::string, std::string> custom;
    } commands;

    struct Output {
        std::string paste_shortcut = "ctrl+v";
        uint32_t settle_ms = 50;
        uint32_t restore_ms = 200;
    } output;

    struct Ui {
        bool show_notifications = true;
    } ui;

    struct History {
        int max_entries = 50;
    } history;

    static bool is_supported_sample_rate(uint32_t rate);

    static Config load(const std::string& path);
    static Config load_default();
};
