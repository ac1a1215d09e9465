#pragma once

#include "output/output.hpp"

// Clipboard access through wl-clipboard (wl-paste / wl-copy).
class WaylandClipboard : public Clipboard {
public:
    Result<std::string> read_text() override;
    Result<void> write_text(const std::string& text) override;
};
