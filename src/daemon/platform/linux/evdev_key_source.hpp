#pragma once

#include "platform/key_event_source.hpp"

#include <optional>
#include <stop_token>
#include <string>
#include <thread>

// Kernel key codes of one modifier+letter combo.
struct EvdevKeyMap {
    int modifier_left = 0;
    int modifier_right = 0;
    int letter = 0;

    LogicalKey classify(int code) const;
};

// modifier: ctrl, alt, shift or super. key: a single letter a-z.
std::expected<EvdevKeyMap, std::string> make_key_map(const std::string& modifier,
                                                     const std::string& key);

// evdev value 1 (press) and 2 (autorepeat) are Down, 0 is Up.
std::optional<KeyTransition> transition_from_value(int value);

// Reads key events from /dev/input/event*. Needs read access to the device
// (usually membership in the "input" group). Events are not grabbed, so the
// focused application still sees them.
class EvdevKeySource : public KeyEventSource {
public:
    // An empty device path picks the first device that reports the letter key.
    EvdevKeySource(EvdevKeyMap keys, std::string device = {}, bool verbose = false);
    ~EvdevKeySource() override;

    EvdevKeySource(const EvdevKeySource&) = delete;
    EvdevKeySource& operator=(const EvdevKeySource&) = delete;

    std::expected<void, std::string> start(KeyCallback on_key) override;
    void stop() override;

    const std::string& device() const { return device_; }

private:
    std::expected<int, std::string> open_device();
    void run(std::stop_token st, KeyCallback on_key);

    EvdevKeyMap keys_;
    std::string device_;
    bool verbose_;
    int fd_ = -1;
    std::jthread thread_;
};
