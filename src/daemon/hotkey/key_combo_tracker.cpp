#include "hotkey/key_combo_tracker.hpp"

std::optional<ComboEvent> KeyComboTracker::on_key_event(LogicalKey key, KeyTransition transition) {
    KeyState next = transition == KeyTransition::Down ? KeyState::Pressed : KeyState::Released;

    switch (key) {
        case LogicalKey::ModifierLeft:
            modifier_left_ = next;
            break;
        case LogicalKey::ModifierRight:
            modifier_right_ = next;
            break;
        case LogicalKey::Letter:
            letter_ = next;
            break;
        case LogicalKey::Other:
            return std::nullopt;
    }

    bool full = modifier_state() == KeyState::Pressed && letter_ == KeyState::Pressed;
    if (full && !engaged_) {
        engaged_ = true;
        return ComboEvent::Engaged;
    }
    if (!full && engaged_) {
        engaged_ = false;
        return ComboEvent::Released;
    }
    return std::nullopt;
}

void KeyComboTracker::reset() {
    modifier_left_ = KeyState::Released;
    modifier_right_ = KeyState::Released;
    letter_ = KeyState::Released;
    engaged_ = false;
}

KeyState KeyComboTracker::modifier_state() const {
    if (modifier_left_ == KeyState::Pressed || modifier_right_ == KeyState::Pressed) {
        return KeyState::Pressed;
    }
    return KeyState::Released;
}

const char* to_string(ComboEvent event) {
    switch (event) {
        case ComboEvent::Engaged:  return "engaged";
        case ComboEvent::Released: return "released";
    }
    return "unknown";
}
