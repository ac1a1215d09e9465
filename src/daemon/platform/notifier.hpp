#pragma once

#include "recording_state.hpp"

#include <string>

// Where state changes and user-facing errors go. Fire-and-forget.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void on_state_change(RecordingState state) = 0;
    virtual void notify(const std::string& title, const std::string& body) = 0;
};
