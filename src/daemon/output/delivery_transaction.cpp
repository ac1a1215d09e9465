#include "delivery_transaction.hpp"

#include <algorithm>
#include <cctype>
#include <print>
#include <thread>

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

} // namespace

ClipboardSnapshot::ClipboardSnapshot(Clipboard& clipboard) : clipboard_(clipboard) {
    auto prev = clipboard_.read_text();
    if (prev) {
        previous_ = std::move(*prev);
    } else {
        std::println(stderr, "clipboard: could not read current contents: {}",
                     to_string(prev.error()));
    }
}

ClipboardSnapshot::~ClipboardSnapshot() {
    auto res = clipboard_.write_text(previous_);
    if (!res) {
        std::println(stderr, "clipboard: failed to restore previous contents: {}",
                     to_string(res.error()));
    }
}

DeliveryTransaction::DeliveryTransaction(Clipboard& clipboard, KeystrokeSimulator& keys,
                                         Timing timing, SleepFn sleep)
    : clipboard_(clipboard), keys_(keys), timing_(timing), sleep_(std::move(sleep)) {
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

Result<void> DeliveryTransaction::deliver(const std::string& text) {
    if (is_blank(text)) return {};

    ClipboardSnapshot snapshot(clipboard_);
    return paste(text);
}

Result<void> DeliveryTransaction::deliver(const std::vector<Segment>& segments) {
    bool has_work = std::any_of(segments.begin(), segments.end(), [](const Segment& s) {
        return s.is_command() || !is_blank(s.value);
    });
    if (!has_work) return {};

    ClipboardSnapshot snapshot(clipboard_);
    for (const auto& seg : segments) {
        if (seg.is_text()) {
            if (is_blank(seg.value)) continue;
            auto res = paste(seg.value);
            if (!res) return res;
        } else {
            auto res = keys_.send_command(seg.value);
            if (!res) return res;
        }
    }
    return {};
}

Result<void> DeliveryTransaction::paste(const std::string& text) {
    auto res = clipboard_.write_text(text);
    if (!res) return res;

    sleep_(timing_.settle);
    res = keys_.simulate_paste();
    if (!res) return res;

    // Let the focused app read the clipboard before it is restored.
    sleep_(timing_.restore);
    return {};
}
