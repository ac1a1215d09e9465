#pragma once

#include <map>
#include <string>
#include <vector>

// A piece of parsed transcription: literal text to paste, or a command
// identifier to send as a keystroke.
struct Segment {
    enum class Kind { Text, Command };

    Kind kind;
    std::string value;

    static Segment text(std::string v) { return {Kind::Text, std::move(v)}; }
    static Segment command(std::string id) { return {Kind::Command, std::move(id)}; }

    bool is_text() const { return kind == Kind::Text; }
    bool is_command() const { return kind == Kind::Command; }

    bool operator==(const Segment&) const = default;
};

// Spoken phrase -> command identifier.
using PhraseTable = std::map<std::string, std::string>;

const PhraseTable& builtin_commands();

class CommandParser {
public:
    // Custom phrases are merged over the built-ins and win on collision.
    explicit CommandParser(const PhraseTable& custom = {});

    std::vector<Segment> parse(const std::string& text) const;

    const PhraseTable& commands() const { return commands_; }

private:
    PhraseTable commands_;
    // Lowercased phrases, longest first.
    std::vector<std::string> phrases_;
};
