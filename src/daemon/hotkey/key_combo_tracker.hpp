#pragma once

#include <optional>

// Logical identity of a raw key. Left and right modifier instances count as one modifier.
enum class LogicalKey { ModifierLeft, ModifierRight, Letter, Other };

enum class KeyTransition { Down, Up };

enum class KeyState { Released, Pressed };

enum class ComboEvent { Engaged, Released };

// Reduces a raw key event stream to edge-triggered combo events for modifier+letter.
class KeyComboTracker {
public:
    // Autorepeat Down events and Up events for keys not held are absorbed.
    std::optional<ComboEvent> on_key_event(LogicalKey key, KeyTransition transition);

    // Forgets all held keys without emitting anything. Used when an Up event was probably missed.
    void reset();

    KeyState modifier_state() const;
    KeyState letter_state() const { return letter_; }
    bool engaged() const { return engaged_; }

private:
    KeyState modifier_left_ = KeyState::Released;
    KeyState modifier_right_ = KeyState::Released;
    KeyState letter_ = KeyState::Released;
    bool engaged_ = false;
};

const char* to_string(ComboEvent event);
