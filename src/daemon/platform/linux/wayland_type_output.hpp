#pragma once

#include "platform/linux/wayland_clipboard_output.hpp"

// Puts the transcript on the clipboard and pastes it into the focused
// window with wtype: ctrl+v, or ctrl+shift+v when output.terminal is set.
class WaylandTypeOutput : public OutputMethod {
public:
    explicit WaylandTypeOutput(bool terminal_chord = false);

    OutputKind kind() const override { return OutputKind::Type; }
    std::expected<void, std::string> deliver(const std::string& text) override;

private:
    WaylandClipboardOutput clipboard_;
    bool terminal_chord_;
};
