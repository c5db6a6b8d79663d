#include "platform/linux/wayland_type_output.hpp"

#include "util/subprocess.hpp"

#include <thread>

WaylandTypeOutput::WaylandTypeOutput(bool terminal_chord)
    : terminal_chord_(terminal_chord) {}

std::expected<void, std::string> WaylandTypeOutput::deliver(const std::string& text) {
    if (auto copied = clipboard_.deliver(text); !copied) {
        return copied;
    }

    // The compositor publishes the new selection asynchronously.
    std::this_thread::sleep_for(std::chrono::milliseconds(10));

    std::vector<std::string> chord = {"wtype", "-M", "ctrl"};
    if (terminal_chord_) {
        chord.insert(chord.end(), {"-M", "shift"});
    }
    chord.insert(chord.end(), {"-k", "v"});

    auto pasted = run_process(chord, {.timeout = std::chrono::seconds(5)});
    if (!pasted) {
        return std::unexpected("paste failed: " + pasted.error());
    }
    return {};
}
