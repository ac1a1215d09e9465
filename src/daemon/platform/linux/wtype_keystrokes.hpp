#pragma once

#include "output/output.hpp"

#include <optional>
#include <string>
#include <vector>

// Virtual keyboard input through wtype. The paste chord is configurable
// because terminals want ctrl+shift+v.
class WtypeKeystrokes : public KeystrokeSimulator {
public:
    explicit WtypeKeystrokes(std::string paste_shortcut = "ctrl+v");

    Result<void> simulate_paste() override;
    Result<void> send_command(const std::string& command) override;

    // "ctrl+shift+v" -> {"-M", "ctrl", "-M", "shift", "-k", "v", "-m", "shift", "-m", "ctrl"}
    static std::vector<std::string> chord_args(const std::string& chord);
    // wtype arguments for a command identifier, nullopt if unmapped.
    static std::optional<std::vector<std::string>> command_args(const std::string& command);

private:
    Result<void> run(std::vector<std::string> args, const std::string& what);

    std::string paste_shortcut_;
};
