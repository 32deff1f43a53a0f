#ifndef XTEST_KEYSTROKE_SINK_HPP
#define XTEST_KEYSTROKE_SINK_HPP

#include "output/keystroke_sink.hpp"

#include <X11/Xlib.h>

#include <string>

// Keystroke synthesis on an X11 display through the XTest extension.
class XTestKeystrokeSink : public KeystrokeSink {
public:
    // Throws InjectionError if the display or XTest is unavailable.
    explicit XTestKeystrokeSink(const std::string& displayName = "");
    ~XTestKeystrokeSink() override;

    XTestKeystrokeSink(const XTestKeystrokeSink&) = delete;
    XTestKeystrokeSink& operator=(const XTestKeystrokeSink&) = delete;

    void typeCharacter(char32_t codePoint) override;
    void pressKey(NamedKey key) override;

private:
    void tapKeysym(KeySym keysym);
    void tapKeycode(KeyCode keycode, bool shift);
    KeyCode bindSpareKeycode(KeySym keysym);

    Display* display_ = nullptr;
    KeyCode shiftKeycode_ = 0;
    KeyCode spareKeycode_ = 0;
};

#endif
