#pragma once

#include "hotkey/key_combo_tracker.hpp"

#include <expected>
#include <functional>
#include <string>

// Raw key transitions for the configured combo keys, from a thread owned by the source.
class KeyEventSource {
public:
    using KeyCallback = std::function<void(LogicalKey, KeyTransition)>;

    virtual ~KeyEventSource() = default;
    virtual std::expected<void, std::string> start(KeyCallback on_key) = 0;
    virtual void stop() = 0;
};
