#include "platform/linux/desktop_notifier.hpp"
#include "platform/linux/subprocess.hpp"

#include <print>

DesktopNotifier::DesktopNotifier(bool show_notifications, bool verbose)
    : show_notifications_(show_notifications), verbose_(verbose) {}

void DesktopNotifier::on_state_change(RecordingState state) {
    if (verbose_) {
        std::println(stderr, "[voicekey] state: {}", to_string(state));
    }
}

void DesktopNotifier::notify(const std::string& title, const std::string& body) {
    std::println(stderr, "[voicekey] {}: {}", title, body);
    if (!show_notifications_) return;

    auto res = run_process({"notify-send", "--app-name=voicekey", title, body});
    if (!res) {
        std::println(stderr, "notify: {}", res.error());
    } else if (res->exit_code != 0) {
        std::println(stderr, "notify: notify-send exited with code {}", res->exit_code);
    }
}
