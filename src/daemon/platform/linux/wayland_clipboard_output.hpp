#pragma once

#include "output/output.hpp"

// Replaces the Wayland selection through wl-copy.
class WaylandClipboardOutput : public OutputMethod {
public:
    OutputKind kind() const override { return OutputKind::Clipboard; }
    std::expected<void, std::string> deliver(const std::string& text) override;
};
