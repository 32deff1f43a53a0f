#include "input/key_codes.hpp"

std::vector<uint32_t> modifierKeyCodes(const std::string& name) {
    if (name == "shift") return {keycode::LeftShift, keycode::RightShift};
    if (name == "ctrl") return {keycode::LeftCtrl, keycode::RightCtrl};
    if (name == "alt") return {keycode::LeftAlt, keycode::RightAlt};
    if (name == "meta") return {keycode::LeftMeta, keycode::RightMeta};
    return {};
}

std::vector<uint32_t> allModifierKeyCodes() {
    return {keycode::LeftShift, keycode::RightShift, keycode::LeftCtrl, keycode::RightCtrl,
            keycode::LeftAlt, keycode::RightAlt, keycode::LeftMeta, keycode::RightMeta};
}
