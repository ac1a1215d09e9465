#pragma once

enum class RecordingState { Idle, Recording, Processing };

inline const char* to_string(RecordingState state) {
    switch (state) {
        case RecordingState::Idle: return "idle";
        case RecordingState::Recording: return "recording";
        case RecordingState::Processing: return "processing";
    }
    return "idle";
}
