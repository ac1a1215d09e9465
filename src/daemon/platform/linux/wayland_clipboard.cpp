#include "platform/linux/wayland_clipboard.hpp"
#include "platform/linux/subprocess.hpp"

Result<std::string> WaylandClipboard::read_text() {
    auto res = run_process({"wl-paste", "--no-newline", "--type", "text"}, std::nullopt, true);
    if (!res) {
        return std::unexpected(ConfigurationError{"wl-paste: " + res.error()});
    }
    if (res->exit_code == 127) {
        return std::unexpected(ConfigurationError{"wl-paste not found, install wl-clipboard"});
    }
    // wl-paste exits non-zero when nothing (or nothing textual) is copied.
    if (res->exit_code != 0) return std::string{};
    return std::move(res->output);
}

Result<void> WaylandClipboard::write_text(const std::string& text) {
    auto res = text.empty() ? run_process({"wl-copy", "--clear"})
                            : run_process({"wl-copy"}, text);
    if (!res) {
        return std::unexpected(ConfigurationError{"wl-copy: " + res.error()});
    }
    if (res->exit_code == 127) {
        return std::unexpected(ConfigurationError{"wl-copy not found, install wl-clipboard"});
    }
    if (res->exit_code != 0) {
        return std::unexpected(ConfigurationError{
            "wl-copy exited with code " + std::to_string(res->exit_code)});
    }
    return {};
}
