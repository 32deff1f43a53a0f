#ifndef KEY_CODES_HPP
#define KEY_CODES_HPP

#include <cstdint>
#include <string>
#include <vector>

// Linux evdev key codes (linux/input-event-codes.h) for the modifiers the
// activation gesture cares about.
namespace keycode {
constexpr uint32_t LeftCtrl = 29;
constexpr uint32_t LeftShift = 42;
constexpr uint32_t RightShift = 54;
constexpr uint32_t LeftAlt = 56;
constexpr uint32_t RightCtrl = 97;
constexpr uint32_t RightAlt = 100;
constexpr uint32_t LeftMeta = 125;
constexpr uint32_t RightMeta = 126;
} // namespace keycode

// Physical keys behind a logical modifier name ("shift", "ctrl", "alt", "meta").
// Unknown names yield an empty list.
std::vector<uint32_t> modifierKeyCodes(const std::string& name);

// Every modifier key code.
std::vector<uint32_t> allModifierKeyCodes();

#endif
