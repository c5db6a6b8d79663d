#include "platform/linux/wayland_clipboard_output.hpp"

#include "util/subprocess.hpp"

std::expected<void, std::string> WaylandClipboardOutput::deliver(const std::string& text) {
    // wl-copy forks a server that owns the selection; the parent returns once it is set.
    return run_process({"wl-copy"}, {.input = text, .timeout = std::chrono::seconds(5)});
}
