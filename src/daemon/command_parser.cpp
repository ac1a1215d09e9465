#include "command_parser.hpp"

#include <algorithm>
#include <cctype>

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_word_char(char c) {
    auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '_';
}

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

} // namespace

const PhraseTable& builtin_commands() {
    static const PhraseTable table = {
        {"new line", "newline"},
        {"enter", "return"},
        {"tab", "tab"},
        {"space", "space"},
        {"backspace", "backspace"},
        {"delete", "delete"},
        {"select all", "selectAll"},
        {"undo", "undo"},
        {"redo", "redo"},
        {"copy that", "copy"},
        {"paste that", "paste"},
        {"cut that", "cut"},
        {"escape", "escape"},
    };
    return table;
}

CommandParser::CommandParser(const PhraseTable& custom) {
    for (const auto& [phrase, id] : builtin_commands()) {
        commands_[phrase] = id;
    }
    for (const auto& [phrase, id] : custom) {
        if (phrase.empty()) continue;
        commands_[to_lower(phrase)] = id;
    }

    phrases_.reserve(commands_.size());
    for (const auto& [phrase, id] : commands_) {
        phrases_.push_back(phrase);
    }
    std::stable_sort(phrases_.begin(), phrases_.end(),
                     [](const std::string& a, const std::string& b) {
                         return a.size() > b.size();
                     });
}

std::vector<Segment> CommandParser::parse(const std::string& text) const {
    std::vector<Segment> segments;
    if (text.empty() || is_blank(text)) return segments;

    const std::string lower = to_lower(text);
    std::string pending;
    size_t i = 0;

    while (i < lower.size()) {
        const std::string* hit = nullptr;

        for (const auto& phrase : phrases_) {
            if (i + phrase.size() > lower.size()) continue;
            if (lower.compare(i, phrase.size(), phrase) != 0) continue;
            if (i > 0 && is_word_char(lower[i - 1])) continue;
            size_t after = i + phrase.size();
            if (after < lower.size() && is_word_char(lower[after])) continue;

            hit = &phrase;
            break;
        }

        if (!hit) {
            pending += text[i];
            ++i;
            continue;
        }

        if (!pending.empty()) {
            segments.push_back(Segment::text(std::move(pending)));
            pending.clear();
        }
        segments.push_back(Segment::command(commands_.at(*hit)));
        i += hit->size();
    }

    if (!pending.empty()) {
        segments.push_back(Segment::text(std::move(pending)));
    }

    return segments;
}
