#ifndef KEYSTROKE_SINK_HPP
#define KEYSTROKE_SINK_HPP

enum class NamedKey { Enter, Tab, Backspace };

// Synthesises keystrokes at whatever currently holds keyboard focus.
// Both calls throw InjectionError when the keystroke cannot be sent.
class KeystrokeSink {
public:
    virtual ~KeystrokeSink() = default;

    virtual void typeCharacter(char32_t codePoint) = 0;
    virtual void pressKey(NamedKey key) = 0;
};

#endif
