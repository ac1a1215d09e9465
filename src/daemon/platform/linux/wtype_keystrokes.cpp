#include "platform/linux/wtype_keystrokes.hpp"
#include "platform/linux/subprocess.hpp"

#include <map>
#include <print>

namespace {

const std::map<std::string, std::string>& command_chords() {
    static const std::map<std::string, std::string> chords = {
        {"newline", "Return"},
        {"return", "Return"},
        {"tab", "Tab"},
        {"space", "space"},
        {"backspace", "BackSpace"},
        {"delete", "Delete"},
        {"escape", "Escape"},
        {"selectAll", "ctrl+a"},
        {"undo", "ctrl+z"},
        {"redo", "ctrl+shift+z"},
        {"copy", "ctrl+c"},
        {"paste", "ctrl+v"},
        {"cut", "ctrl+x"},
    };
    return chords;
}

} // namespace

WtypeKeystrokes::WtypeKeystrokes(std::string paste_shortcut)
    : paste_shortcut_(std::move(paste_shortcut)) {}

std::vector<std::string> WtypeKeystrokes::chord_args(const std::string& chord) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= chord.size()) {
        auto plus = chord.find('+', start);
        auto part = chord.substr(start, plus == std::string::npos ? std::string::npos
                                                                  : plus - start);
        if (!part.empty()) parts.push_back(part);
        if (plus == std::string::npos) break;
        start = plus + 1;
    }

    std::vector<std::string> args;
    if (parts.empty()) return args;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        args.push_back("-M");
        args.push_back(parts[i]);
    }
    args.push_back("-k");
    args.push_back(parts.back());
    // Release modifiers in reverse order so none stays latched.
    for (size_t i = parts.size() - 1; i-- > 0;) {
        args.push_back("-m");
        args.push_back(parts[i]);
    }
    return args;
}

std::optional<std::vector<std::string>> WtypeKeystrokes::command_args(const std::string& command) {
    auto it = command_chords().find(command);
    if (it == command_chords().end()) return std::nullopt;
    return chord_args(it->second);
}

Result<void> WtypeKeystrokes::simulate_paste() {
    return run(chord_args(paste_shortcut_), "paste");
}

Result<void> WtypeKeystrokes::send_command(const std::string& command) {
    auto args = command_args(command);
    if (!args) {
        std::println(stderr, "keys: no keystroke bound to command '{}', skipping", command);
        return {};
    }
    return run(std::move(*args), command);
}

Result<void> WtypeKeystrokes::run(std::vector<std::string> args, const std::string& what) {
    if (args.empty()) {
        return std::unexpected(ConfigurationError{"empty key chord for " + what});
    }
    args.insert(args.begin(), "wtype");

    auto res = run_process(args);
    if (!res) {
        return std::unexpected(ConfigurationError{"wtype: " + res.error()});
    }
    if (res->exit_code == 127) {
        return std::unexpected(ConfigurationError{"wtype not found, install wtype"});
    }
    if (res->exit_code != 0) {
        return std::unexpected(ConfigurationError{
            "Keystroke simulation failed (" + what + "), wtype exited with code " +
            std::to_string(res->exit_code) +
            ". Does the compositor allow virtual keyboards?"});
    }
    return {};
}
