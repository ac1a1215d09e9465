#pragma once

#include "../errors.hpp"

#include <string>

// System clipboard, text only. An empty write clears it.
class Clipboard {
public:
    virtual ~Clipboard() = default;
    virtual Result<std::string> read_text() = 0;
    virtual Result<void> write_text(const std::string& text) = 0;
};

// Synthesizes input into whatever window has focus.
class KeystrokeSimulator {
public:
    virtual ~KeystrokeSimulator() = default;
    virtual Result<void> simulate_paste() = 0;
    // Sends the key chord bound to a command identifier ("newline", "undo").
    // Unknown identifiers are ignored.
    virtual Result<void> send_command(const std::string& command) = 0;
};
