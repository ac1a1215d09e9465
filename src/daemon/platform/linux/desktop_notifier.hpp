#pragma once

#include "platform/notifier.hpp"

// Desktop notifications through notify-send; state changes go to the log.
class DesktopNotifier : public Notifier {
public:
    DesktopNotifier(bool show_notifications, bool verbose);

    void on_state_change(RecordingState state) override;
    void notify(const std::string& title, const std::string& body) override;

private:
    bool show_notifications_;
    bool verbose_;
};
