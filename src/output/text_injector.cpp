#include "output/text_injector.hpp"
#include "core/errors.hpp"

#include <iostream>

static constexpr char32_t kReplacement = 0xFFFD;

// Constructor
TextInjector::TextInjector(KeystrokeSink& sink, Config config)
    : sink_(sink), config_(config), formatter_(config_.format) {}

std::vector<char32_t> TextInjector::decodeUtf8(const std::string& text) {
    std::vector<char32_t> out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        const unsigned char c = (unsigned char)text[i];
        char32_t cp = 0;
        int extra = 0;
        char32_t min = 0;

        if (c < 0x80)                { cp = c;        extra = 0; }
        else if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; extra = 1; min = 0x80; }
        else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; extra = 2; min = 0x800; }
        else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; extra = 3; min = 0x10000; }
        else {
            out.push_back(kReplacement);
            ++i;
            continue;
        }

        int got = 0;
        while (got < extra && i + 1 + got < text.size()
               && (((unsigned char)text[i + 1 + got]) & 0xC0) == 0x80) {
            cp = (cp << 6) | (((unsigned char)text[i + 1 + got]) & 0x3F);
            ++got;
        }

        if (got < extra) {
            // truncated sequence: replace the bytes consumed so far
            out.push_back(kReplacement);
            i += 1 + got;
            continue;
        }
        i += 1 + extra;

        if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) cp = kReplacement;
        out.push_back(cp);
    }
    return out;
}

bool TextInjector::inject(const std::string& text) {
    const std::string formatted = formatter_.format(text);
    if (formatted.empty()) return true;

    const std::vector<char32_t> codePoints = decodeUtf8(formatted);

    std::lock_guard<std::mutex> lock(mutex_);
    try {
        for (char32_t cp : codePoints) sink_.typeCharacter(cp);
        if (config_.autoSubmit) sink_.pressKey(NamedKey::Enter);
    } catch (const InjectionError& e) {
        ++failures_;
        std::cerr << "[Injector] [WARN] Keystroke injection failed: " << e.what() << std::endl;
        return false;
    }
    return true;
}

uint64_t TextInjector::failureCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}
