#pragma once

#include "../command_parser.hpp"
#include "output.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

struct DeliveryTiming {
    std::chrono::milliseconds settle{50};    // after writing, before paste
    std::chrono::milliseconds restore{200};  // after paste, before restore
};

// Pastes text through the shared clipboard and puts the user's previous
// clipboard contents back afterwards, whatever happens in between.
class DeliveryTransaction {
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    using Timing = DeliveryTiming;

    DeliveryTransaction(Clipboard& clipboard, KeystrokeSimulator& keys,
                        Timing timing = {}, SleepFn sleep = {});

    Result<void> deliver(const std::string& text);
    Result<void> deliver(const std::vector<Segment>& segments);

private:
    Result<void> paste(const std::string& text);

    Clipboard& clipboard_;
    KeystrokeSimulator& keys_;
    Timing timing_;
    SleepFn sleep_;
};

// Holds the clipboard contents taken at the start of a delivery and writes
// them back when it goes out of scope.
class ClipboardSnapshot {
public:
    explicit ClipboardSnapshot(Clipboard& clipboard);
    ~ClipboardSnapshot();

    ClipboardSnapshot(const ClipboardSnapshot&) = delete;
    ClipboardSnapshot& operator=(const ClipboardSnapshot&) = delete;

    const std::string& previous() const { return previous_; }

private:
    Clipboard& clipboard_;
    std::string previous_;
};
