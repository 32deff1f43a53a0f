#include "output/xtest_keystroke_sink.hpp"
#include "core/errors.hpp"

#include <X11/XKBlib.h>
#include <X11/keysym.h>
#include <X11/extensions/XTest.h>

#include <iostream>

static KeySym keysym_for(char32_t cp) {
    if (cp == U'\n') return XK_Return;
    if (cp == U'\t') return XK_Tab;
    if (cp < 0x100) return (KeySym)cp;
    return (KeySym)(0x01000000 | cp);
}

// Constructor
XTestKeystrokeSink::XTestKeystrokeSink(const std::string& displayName) {
    display_ = XOpenDisplay(displayName.empty() ? nullptr : displayName.c_str());
    if (!display_) throw InjectionError("cannot open X display (is DISPLAY set?)");

    int ev = 0, err = 0, maj = 0, min = 0;
    if (!XTestQueryExtension(display_, &ev, &err, &maj, &min)) {
        XCloseDisplay(display_);
        display_ = nullptr;
        throw InjectionError("X server lacks the XTEST extension");
    }

    shiftKeycode_ = XKeysymToKeycode(display_, XK_Shift_L);

    // Highest keycode with no symbols is used for characters missing from the map
    int minKeycode = 0, maxKeycode = 0;
    XDisplayKeycodes(display_, &minKeycode, &maxKeycode);
    int perKeycode = 0;
    KeySym* map = XGetKeyboardMapping(display_, (KeyCode)minKeycode,
                                      maxKeycode - minKeycode + 1, &perKeycode);
    if (map) {
        for (int kc = maxKeycode; kc >= minKeycode && !spareKeycode_; --kc) {
            bool empty = true;
            for (int j = 0; j < perKeycode; ++j) {
                if (map[(kc - minKeycode) * perKeycode + j] != NoSymbol) { empty = false; break; }
            }
            if (empty) spareKeycode_ = (KeyCode)kc;
        }
        XFree(map);
    }
    if (!spareKeycode_) {
        std::cerr << "[XTest] [WARN] No spare keycode; characters outside the keymap will be skipped" << std::endl;
    }

    std::cout << "[XTest] [INFO] Connected to display " << DisplayString(display_) << std::endl;
}

// Destructor
XTestKeystrokeSink::~XTestKeystrokeSink() {
    if (display_) XCloseDisplay(display_);
}

void XTestKeystrokeSink::typeCharacter(char32_t codePoint) {
    tapKeysym(keysym_for(codePoint));
}

void XTestKeystrokeSink::pressKey(NamedKey key) {
    switch (key) {
        case NamedKey::Enter:     tapKeysym(XK_Return); break;
        case NamedKey::Tab:       tapKeysym(XK_Tab); break;
        case NamedKey::Backspace: tapKeysym(XK_BackSpace); break;
    }
}

void XTestKeystrokeSink::tapKeysym(KeySym keysym) {
    KeyCode kc = XKeysymToKeycode(display_, keysym);
    if (kc != 0) {
        const KeySym lower = XkbKeycodeToKeysym(display_, kc, 0, 0);
        const KeySym upper = XkbKeycodeToKeysym(display_, kc, 0, 1);
        const bool shift = lower != keysym && upper == keysym;
        tapKeycode(kc, shift);
        return;
    }

    kc = bindSpareKeycode(keysym);
    tapKeycode(kc, false);

    // restore the spare keycode once the keystroke has been processed
    XSync(display_, False);
    KeySym none = NoSymbol;
    XChangeKeyboardMapping(display_, kc, 1, &none, 1);
    XFlush(display_);
}

void XTestKeystrokeSink::tapKeycode(KeyCode keycode, bool shift) {
    if (shift && shiftKeycode_) XTestFakeKeyEvent(display_, shiftKeycode_, True, 0);
    const bool ok = XTestFakeKeyEvent(display_, keycode, True, 0)
                 && XTestFakeKeyEvent(display_, keycode, False, 0);
    if (shift && shiftKeycode_) XTestFakeKeyEvent(display_, shiftKeycode_, False, 0);
    XFlush(display_);

    if (!ok) throw InjectionError("XTestFakeKeyEvent failed for keycode " + std::to_string((int)keycode));
}

KeyCode XTestKeystrokeSink::bindSpareKeycode(KeySym keysym) {
    if (!spareKeycode_) {
        throw InjectionError("no keycode available for keysym " + std::to_string((unsigned long)keysym));
    }
    KeySym syms[2] = {keysym, keysym};
    XChangeKeyboardMapping(display_, spareKeycode_, 2, syms, 1);
    XSync(display_, False);
    return spareKeycode_;
}
