#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string Config::Backend::api_key() const {
    if (api_key_env.empty()) return {};
    const char* key = std::getenv(api_key_env.c_str());
    return key ? key : "";
}

bool Config::is_supported_sample_rate(uint32_t rate) {
    constexpr std::array<uint32_t, 4> rates = {8000, 16000, 22050, 44100};
    return std::ranges::find(rates, rate) != rates.end();
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("backend")) {
            auto& b = j["backend"];
            if (b.contains("url")) cfg.backend.url = b["url"].get<std::string>();
            if (b.contains("model")) cfg.backend.model = b["model"].get<std::string>();
            if (b.contains("language")) cfg.backend.language = b["language"].get<std::string>();
            if (b.contains("temperature") && !b["temperature"].is_null()) {
                cfg.backend.temperature = b["temperature"].get<double>();
            }
            if (b.contains("timeout_ms")) cfg.backend.timeout_ms = b["timeout_ms"].get<uint32_t>();
            if (b.contains("api_key_env")) cfg.backend.api_key_env = b["api_key_env"].get<std::string>();
        }

        if (j.contains("retry")) {
            auto& r = j["retry"];
            if (r.contains("max_retries")) cfg.retry.max_retries =
                std::clamp(r["max_retries"].get<int>(), 0, Retry::retry_limit);
            if (r.contains("initial_delay_ms")) cfg.retry.initial_delay_ms = r["initial_delay_ms"].get<uint32_t>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("device")) cfg.audio.device = a["device"].get<std::string>();
            if (a.contains("sample_rate")) {
                auto rate = a["sample_rate"].get<uint32_t>();
                if (is_supported_sample_rate(rate)) {
                    cfg.audio.sample_rate = rate;
                } else {
                    std::println(stderr, "config: unsupported sample_rate {}, using {}",
                                 rate, cfg.audio.sample_rate);
                }
            }
            if (a.contains("max_seconds")) cfg.audio.max_seconds = a["max_seconds"].get<uint32_t>();
            if (a.contains("format")) cfg.audio.format = a["format"].get<std::string>();
        }

        if (j.contains("silence")) {
            auto& s = j["silence"];
            if (s.contains("enabled")) cfg.silence.enabled = s["enabled"].get<bool>();
            if (s.contains("threshold")) cfg.silence.threshold = s["threshold"].get<double>();
            if (s.contains("duration_ms")) cfg.silence.duration_ms = s["duration_ms"].get<uint32_t>();
        }

        if (j.contains("commands")) {
            auto& c = j["commands"];
            if (c.contains("enabled")) cfg.commands.enabled = c["enabled"].get<bool>();
            if (c.contains("custom")) {
                cfg.commands.custom = c["custom"].get<std::map<std::string, std::string>>();
            }
        }

        if (j.contains("output")) {
            auto& o = j["output"];
            if (o.contains("paste_shortcut")) cfg.output.paste_shortcut = o["paste_shortcut"].get<std::string>();
            if (o.contains("settle_ms")) cfg.output.settle_ms = o["settle_ms"].get<uint32_t>();
            if (o.contains("restore_ms")) cfg.output.restore_ms = o["restore_ms"].get<uint32_t>();
        }

        if (j.contains("ui")) {
            auto& u = j["ui"];
            if (u.contains("show_notifications")) cfg.ui.show_notifications = u["show_notifications"].get<bool>();
        }

        if (j.contains("history")) {
            auto& h = j["history"];
            if (h.contains("max_entries")) cfg.history.max_entries = std::max(1, h["max_entries"].get<int>());
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
